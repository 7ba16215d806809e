#ifndef MOUSE_STATE_HPP
#define MOUSE_STATE_HPP

#include <SDL3/SDL.h>
#include <atomic>

namespace LayerGrid {

    /**
     * @brief Tracks whether a mouse button is held over a window.
     *
     * Button events arrive through an SDL event watch, which may run on a
     * different thread from the code polling IsMouseDown().
     */
    class MouseState {
    public:
        MouseState() = default;
        ~MouseState();

        MouseState(const MouseState&) = delete;
        MouseState& operator=(const MouseState&) = delete;

        // Starts listening for button events on window. Replaces any earlier watch.
        bool Watch(SDL_Window* window);
        void Unwatch();

        void MouseButtonDown() { mouseDown.store(true); }
        void MouseButtonUp() { mouseDown.store(false); }
        bool IsMouseDown() const { return mouseDown.load(); }

    private:
        std::atomic<bool> mouseDown{ false };
        std::atomic<SDL_WindowID> windowID{ 0 };
        bool watching = false;

        static bool SDLCALL OnEvent(void* userdata, SDL_Event* event);
    };

} // namespace LayerGrid

#endif // MOUSE_STATE_HPP
