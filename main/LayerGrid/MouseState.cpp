#include "MouseState.hpp"
#include <iostream>

namespace LayerGrid {

    MouseState::~MouseState() {
        Unwatch();
    }

    bool MouseState::Watch(SDL_Window* window) {
        Unwatch();
        windowID.store(SDL_GetWindowID(window));
        if (!SDL_AddEventWatch(&MouseState::OnEvent, this)) {
            std::cerr << "[Window] Failed to watch mouse events: " << SDL_GetError() << std::endl;
            return false;
        }
        watching = true;
        return true;
    }

    void MouseState::Unwatch() {
        if (watching) {
            SDL_RemoveEventWatch(&MouseState::OnEvent, this);
            watching = false;
        }
        mouseDown.store(false);
    }

    bool SDLCALL MouseState::OnEvent(void* userdata, SDL_Event* event) {
        MouseState* state = static_cast<MouseState*>(userdata);

        if (event->type == SDL_EVENT_MOUSE_BUTTON_DOWN || event->type == SDL_EVENT_MOUSE_BUTTON_UP) {
            if (event->button.windowID != state->windowID.load()) {
                return true;
            }
            if (event->type == SDL_EVENT_MOUSE_BUTTON_DOWN) {
                state->MouseButtonDown();
            }
            else {
                state->MouseButtonUp();
            }
        }
        return true; // Watches cannot drop events
    }

} // namespace LayerGrid
