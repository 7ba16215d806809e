#include <SDL3/SDL.h>
#include <iostream>
#include <optional>
#include <string>
#include "CellMetrics.hpp"
#include "Color.hpp"
#include "Config.hpp"
#include "Errors.hpp"
#include "Grid.hpp"
#include "GridPainter.hpp"
#include "Serialization.hpp"
#include "Window.hpp"

using namespace std;
using namespace LayerGrid;

const char* SAVE_FILE = "grid.txt";
const char* IMAGE_FILE = "grid.png";

// Built-in setup when no config file is given: white gridlines, 1 is blue.
GridConfig DefaultConfig() {
    GridConfig config;
    config.gridlineColor = COLOR_WHITE;

    ValueConfig blue;
    blue.value = 1;
    blue.hasColor = true;
    blue.color = SDL_Color{ 0, 0, 255, 255 };
    config.values.push_back(blue);
    return config;
}

// Click and drag to flip every cell the cursor enters between 0 and 1.
void runGrid(const GridConfig& config) {
    Grid grid(config.width, config.height);
    CellMetrics metrics(config.cellSize, config.gridlineWeight);
    ApplyGridConfig(grid, config);

    GridWindow window(grid, metrics, config.title, config.fontPath);
    if (!window.isOpen()) {
        cerr << "Failed to open grid window." << endl;
        return;
    }

    window.setKeyHandler([&](SDL_Keycode key) {
        switch (key) {
        case SDLK_S:
            SaveGridToFile(grid, SAVE_FILE);
            break;
        case SDLK_L:
            LoadGridFromFile(grid, SAVE_FILE);
            break;
        case SDLK_P:
            if (SaveGridImage(grid, metrics, config.fontPath, IMAGE_FILE)) {
                cout << "[Grid] Wrote " << IMAGE_FILE << endl;
            }
            break;
        case SDLK_C:
            grid.Fill(0);
            break;
        default:
            break;
        }
    });

    optional<SDL_Point> current;
    while (window.isOpen()) {
        window.pumpEvents();

        optional<SDL_Point> p = window.getMouseCell();
        bool entered = !current || !p || p->x != current->x || p->y != current->y;
        if (p && window.isMouseDown() && entered) {
            grid.Set(p, 1 - grid.Get(p));
            current = p;
        }
        if (!window.isMouseDown()) {
            current.reset();
        }

        SDL_Delay(16);
    }
}

int main(int argc, char* argv[]) {
    GridConfig config = DefaultConfig();
    if (argc > 1 && !LoadGridConfig(argv[1], config)) {
        return 1;
    }

    if (!SDL_Init(SDL_INIT_VIDEO)) {
        cerr << "SDL could not initialize! SDL_Error: " << SDL_GetError() << endl;
        return 1;
    }

    int result = 0;
    try {
        runGrid(config);
    }
    catch (const InvalidArgument& e) {
        cerr << "Invalid grid setup: " << e.what() << endl;
        result = 1;
    }

    SDL_Quit();
    return result;
}
