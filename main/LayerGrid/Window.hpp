#ifndef WINDOW_H
#define WINDOW_H

#include <SDL3/SDL.h>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include "CellMetrics.hpp"
#include "Grid.hpp"
#include "GridPainter.hpp"
#include "MouseState.hpp"

namespace LayerGrid {

    /**
     * @brief A fixed-size window showing one grid.
     *
     * The window is sized to fit the grid exactly and is centered on screen.
     * It registers itself as the grid's repaint handler, so it must be
     * destroyed before the grid.
     */
    class GridWindow {
    public:
        using KeyHandler = std::function<void(SDL_Keycode)>;

        GridWindow(Grid& grid, const CellMetrics& metrics, const std::string& title, const std::string& fontPath);
        ~GridWindow();

        GridWindow(const GridWindow&) = delete;
        GridWindow& operator=(const GridWindow&) = delete;

        // False if SDL failed to create the window or renderer.
        bool isOpen() const { return open; }

        // Handles pending events and redraws if the grid changed.
        void pumpEvents();
        // Draws the grid now.
        void repaint();

        // Cell under the cursor, or nothing when off the window or on a gridline.
        std::optional<SDL_Point> getMouseCell() const;
        bool isMouseDown() const { return mouse.IsMouseDown(); }

        void setKeyHandler(KeyHandler handler) { keyHandler = std::move(handler); }

        SDL_Window* getWindow() const { return window; }

    private:
        Grid& grid;
        CellMetrics metrics;
        SDL_Window* window = nullptr;
        SDL_Renderer* renderer = nullptr;
        std::unique_ptr<GridPainter> painter;
        MouseState mouse;
        KeyHandler keyHandler;
        bool open = false;
        bool dirty = true;
        bool ownsVideo = false;

        bool initializeSDL(const std::string& title);
        void cleanupSDL();
    };

} // namespace LayerGrid

#endif
