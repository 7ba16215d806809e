#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <SDL3/SDL.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "Color.hpp"
#include "Grid.hpp"

namespace LayerGrid {

    // Appearance for one value. Unset members leave the value's entry alone.
    struct ValueConfig {
        int value = 0;
        bool hasColor = false;
        std::optional<SDL_Color> color; // Only read when hasColor; empty means transparent
        std::optional<SDL_Color> textColor;
        std::optional<std::string> text; // One UTF-8 code point, empty for none
        std::string imagePath;
    };

    struct GridConfig {
        int width = 10;
        int height = 10;
        int cellSize = 50;
        int gridlineWeight = 5;
        std::string title = "Simple Grid";
        std::string fontPath;
        bool autoRepaint = true;
        SDL_Color gridlineColor = COLOR_BLACK;
        std::vector<ValueConfig> values;
    };

    /**
     * @brief Reads a grid description.
     *
     * Colors are [r, g, b] or [r, g, b, a] arrays; a null cell color makes the
     * value transparent. Text is a string of at most one
     * character (UTF-8). Integer keys reject fractions and out-of-range numbers.
     *
     * @throws InvalidArgument If a key has the wrong shape.
     */
    GridConfig ParseGridConfig(const nlohmann::json& j);

    // Reads and parses a JSON file. Logs and returns false on any failure.
    bool LoadGridConfig(const std::string& path, GridConfig& config);

    // Applies the configured value appearances, gridline color and repaint mode.
    void ApplyGridConfig(Grid& grid, const GridConfig& config);

} // namespace LayerGrid

#endif // CONFIG_HPP
