#include "Serialization.hpp"
#include "Errors.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace LayerGrid {

    namespace {

        std::vector<std::string> SplitLayers(const std::string& gridData) {
            std::vector<std::string> parts;
            std::string part;
            std::istringstream in(gridData);
            while (std::getline(in, part, LAYER_SEPARATOR)) {
                parts.push_back(part);
            }
            // getline drops a trailing empty field
            if (gridData.empty() || gridData.back() == LAYER_SEPARATOR) {
                parts.emplace_back();
            }
            return parts;
        }

        int ParseCell(const std::string& token) {
            size_t used = 0;
            int value = 0;
            try {
                value = std::stoi(token, &used);
            }
            catch (const std::logic_error&) {
                throw InvalidArgument("Bad cell value in grid data: \"" + token + "\".");
            }
            if (used != token.size()) {
                throw InvalidArgument("Bad cell value in grid data: \"" + token + "\".");
            }
            return value;
        }

    } // namespace

    std::string SaveGrid(const Grid& grid) {
        std::ostringstream out;
        for (int i = 0; i < grid.LayerCount(); ++i) {
            if (i > 0) {
                out << LAYER_SEPARATOR;
            }
            const std::vector<int>& cells = grid.GetLayer(i).Cells();
            for (size_t c = 0; c < cells.size(); ++c) {
                if (c > 0) {
                    out << ' ';
                }
                out << cells[c];
            }
        }
        return out.str();
    }

    void LoadGrid(Grid& grid, const std::string& gridData) {
        const size_t cellCount = static_cast<size_t>(grid.GetWidth()) * grid.GetHeight();

        std::vector<std::vector<int>> parsed;
        for (const std::string& layerText : SplitLayers(gridData)) {
            std::vector<int> cells;
            std::istringstream tokens(layerText);
            std::string token;
            while (tokens >> token) {
                cells.push_back(ParseCell(token));
            }
            if (cells.size() != cellCount) {
                throw IndexOutOfBounds("Layer " + std::to_string(parsed.size()) + " has " + std::to_string(cells.size()) +
                    " cells, grid needs " + std::to_string(cellCount) + ".");
            }
            parsed.push_back(std::move(cells));
        }

        // Add any needed layers
        while (static_cast<int>(parsed.size()) > grid.LayerCount()) {
            grid.AddLayer();
        }

        const bool autoRepaint = grid.IsAutoRepaint();
        grid.SetAutoRepaint(false);
        for (size_t i = 0; i < parsed.size(); ++i) {
            for (int y = 0; y < grid.GetHeight(); ++y) {
                for (int x = 0; x < grid.GetWidth(); ++x) {
                    grid.Set(static_cast<int>(i), x, y, parsed[i][static_cast<size_t>(y) * grid.GetWidth() + x]);
                }
            }
        }
        grid.SetAutoRepaint(autoRepaint);
        if (autoRepaint) {
            grid.Repaint();
        }
    }

    bool SaveGridToFile(const Grid& grid, const std::string& path) {
        std::ofstream file(path);
        if (!file) {
            std::cerr << "[Grid] Failed to open " << path << " for writing\n";
            return false;
        }
        file << SaveGrid(grid);
        if (!file) {
            std::cerr << "[Grid] Failed to write " << path << "\n";
            return false;
        }
        std::cout << "[Grid] Saved " << grid.LayerCount() << " layer(s) to " << path << "\n";
        return true;
    }

    bool LoadGridFromFile(Grid& grid, const std::string& path) {
        std::ifstream file(path);
        if (!file) {
            std::cerr << "[Grid] Failed to open " << path << "\n";
            return false;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();

        std::string data = buffer.str();
        while (!data.empty() && (data.back() == '\n' || data.back() == '\r')) {
            data.pop_back();
        }

        try {
            LoadGrid(grid, data);
        }
        catch (const InvalidArgument& e) {
            std::cerr << "[Grid] " << path << ": " << e.what() << "\n";
            return false;
        }
        catch (const IndexOutOfBounds& e) {
            std::cerr << "[Grid] " << path << ": " << e.what() << "\n";
            return false;
        }
        std::cout << "[Grid] Loaded " << path << "\n";
        return true;
    }

} // namespace LayerGrid
