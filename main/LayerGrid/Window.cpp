#include "Window.hpp"
#include <iostream>

using namespace std;

namespace LayerGrid {

    GridWindow::GridWindow(Grid& grid, const CellMetrics& metrics, const string& title, const string& fontPath)
        : grid(grid), metrics(metrics) {
        if (!initializeSDL(title)) {
            return;
        }
        painter = make_unique<GridPainter>(renderer, metrics, fontPath);
        mouse.Watch(window);
        grid.SetRepaintHandler([this]() { dirty = true; });
        open = true;
        repaint();
    }

    GridWindow::~GridWindow() {
        grid.SetRepaintHandler(nullptr);
        cleanupSDL();
    }

    bool GridWindow::initializeSDL(const string& title) {
        if (!SDL_InitSubSystem(SDL_INIT_VIDEO)) {
            cerr << "[Window] Failed to initialize SDL video: " << SDL_GetError() << endl;
            return false;
        }
        ownsVideo = true;

        const int width = metrics.PanelExtent(grid.GetWidth());
        const int height = metrics.PanelExtent(grid.GetHeight());

        // Not resizable: the panel always matches the grid
        window = SDL_CreateWindow(title.c_str(), width, height, 0);
        if (!window) {
            cerr << "[Window] Failed to create window: " << SDL_GetError() << endl;
            return false;
        }
        SDL_SetWindowPosition(window, SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED);

        renderer = SDL_CreateRenderer(window, NULL);
        if (!renderer) {
            cerr << "[Window] Failed to create renderer: " << SDL_GetError() << endl;
            SDL_DestroyWindow(window); // Destroy the window to free memory before exiting
            window = nullptr;
            return false;
        }

        return true;
    }

    void GridWindow::cleanupSDL() {
        mouse.Unwatch();
        painter.reset(); // Textures go before their renderer
        if (renderer) {
            SDL_DestroyRenderer(renderer);
            renderer = nullptr;
        }
        if (window) {
            SDL_DestroyWindow(window);
            window = nullptr;
        }
        if (ownsVideo) {
            SDL_QuitSubSystem(SDL_INIT_VIDEO);
            ownsVideo = false;
        }
        open = false;
    }

    void GridWindow::pumpEvents() {
        if (!open) {
            return;
        }

        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            switch (event.type) {
            case SDL_EVENT_QUIT:
            case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
                cleanupSDL();
                return;
            case SDL_EVENT_WINDOW_EXPOSED:
                dirty = true;
                break;
            case SDL_EVENT_KEY_DOWN:
                if (keyHandler && !event.key.repeat) {
                    keyHandler(event.key.key);
                }
                break;
            default:
                break;
            }
        }

        if (open && dirty) {
            repaint();
        }
    }

    void GridWindow::repaint() {
        if (!open) {
            return;
        }
        painter->Paint(grid);
        SDL_RenderPresent(renderer);
        dirty = false;
    }

    optional<SDL_Point> GridWindow::getMouseCell() const {
        if (!open || SDL_GetMouseFocus() != window) {
            return nullopt; // Mouse is out of the window
        }

        float mouseX = 0.0f, mouseY = 0.0f;
        SDL_GetMouseState(&mouseX, &mouseY);

        const optional<SDL_Point> cell = metrics.PixelToCell(static_cast<int>(mouseX), static_cast<int>(mouseY));
        if (grid.IsOOB(cell)) {
            return nullopt;
        }
        return cell;
    }

} // namespace LayerGrid
