#include "Config.hpp"
#include "Errors.hpp"
#include "Texture.hpp"
#include <climits>
#include <cstdint>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace LayerGrid {

    namespace {

        // Whole JSON number within [low, high]. Unsigned values above INT64_MAX never fit.
        bool IsIntegerIn(const json& j, std::int64_t low, std::int64_t high) {
            if (!j.is_number_integer()) {
                return false;
            }
            if (j.is_number_unsigned() && j.get<std::uint64_t>() > static_cast<std::uint64_t>(INT64_MAX)) {
                return false;
            }
            const std::int64_t value = j.get<std::int64_t>();
            return value >= low && value <= high;
        }

        SDL_Color ParseColor(const json& j, const std::string& key) {
            if (!j.is_array() || (j.size() != 3 && j.size() != 4)) {
                throw InvalidArgument("\"" + key + "\" must be [r, g, b] or [r, g, b, a].");
            }
            Uint8 channels[4] = { 0, 0, 0, 255 };
            for (size_t i = 0; i < j.size(); ++i) {
                if (!IsIntegerIn(j[i], 0, 255)) {
                    throw InvalidArgument("\"" + key + "\" channels must be integers from 0 to 255.");
                }
                channels[i] = static_cast<Uint8>(j[i].get<std::int64_t>());
            }
            return { channels[0], channels[1], channels[2], channels[3] };
        }

        template <typename T>
        void Read(const json& j, const char* key, T& out) {
            if (!j.contains(key)) {
                return;
            }
            try {
                out = j.at(key).get<T>();
            }
            catch (const json::exception& e) {
                throw InvalidArgument(std::string("\"") + key + "\": " + e.what());
            }
        }

        void Read(const json& j, const char* key, int& out) {
            if (!j.contains(key)) {
                return;
            }
            if (!IsIntegerIn(j.at(key), INT_MIN, INT_MAX)) {
                throw InvalidArgument(std::string("\"") + key + "\" must be a whole number in int range.");
            }
            out = static_cast<int>(j.at(key).get<std::int64_t>());
        }

        ValueConfig ParseValue(const json& j) {
            if (!j.is_object() || !j.contains("value")) {
                throw InvalidArgument("Each entry of \"values\" needs a \"value\".");
            }

            ValueConfig value;
            Read(j, "value", value.value);

            if (j.contains("color")) {
                value.hasColor = true;
                if (!j["color"].is_null()) {
                    value.color = ParseColor(j["color"], "color");
                }
            }
            if (j.contains("textColor")) {
                value.textColor = ParseColor(j["textColor"], "textColor");
            }
            if (j.contains("text")) {
                std::string text;
                Read(j, "text", text);
                if (!IsGlyph(text)) {
                    throw InvalidArgument("\"text\" must be a single character.");
                }
                value.text = text;
            }
            Read(j, "image", value.imagePath);
            return value;
        }

    } // namespace

    GridConfig ParseGridConfig(const json& j) {
        if (!j.is_object()) {
            throw InvalidArgument("Grid config must be a JSON object.");
        }

        GridConfig config;
        Read(j, "width", config.width);
        Read(j, "height", config.height);
        Read(j, "cellSize", config.cellSize);
        Read(j, "gridlineWeight", config.gridlineWeight);
        Read(j, "title", config.title);
        Read(j, "font", config.fontPath);
        Read(j, "autoRepaint", config.autoRepaint);
        if (j.contains("gridlineColor")) {
            config.gridlineColor = ParseColor(j["gridlineColor"], "gridlineColor");
        }

        if (j.contains("values")) {
            if (!j["values"].is_array()) {
                throw InvalidArgument("\"values\" must be an array.");
            }
            for (const auto& entry : j["values"]) {
                config.values.push_back(ParseValue(entry));
            }
        }
        return config;
    }

    bool LoadGridConfig(const std::string& path, GridConfig& config) {
        std::ifstream file(path);
        if (!file) {
            std::cerr << "[Config] Failed to open " << path << std::endl;
            return false;
        }

        try {
            config = ParseGridConfig(json::parse(file));
        }
        catch (const json::parse_error& e) {
            std::cerr << "[Config] " << path << " is not valid JSON: " << e.what() << std::endl;
            return false;
        }
        catch (const InvalidArgument& e) {
            std::cerr << "[Config] " << path << ": " << e.what() << std::endl;
            return false;
        }

        std::cout << "[Config] Loaded " << path << " (" << config.width << "x" << config.height << ", "
            << config.values.size() << " value(s))" << std::endl;
        return true;
    }

    void ApplyGridConfig(Grid& grid, const GridConfig& config) {
        grid.SetAutoRepaint(false);

        grid.SetGridlineColor(config.gridlineColor);
        for (const ValueConfig& value : config.values) {
            if (value.hasColor) {
                grid.SetColor(value.value, value.color);
            }
            if (value.textColor) {
                grid.SetTextColor(value.value, value.textColor);
            }
            if (value.text) {
                grid.SetText(value.value, *value.text);
            }
            if (!value.imagePath.empty()) {
                ImageRef image = LoadImage(value.imagePath);
                if (image) {
                    grid.SetImage(value.value, image);
                }
            }
        }

        grid.SetAutoRepaint(config.autoRepaint);
        grid.Repaint();
    }

} // namespace LayerGrid
