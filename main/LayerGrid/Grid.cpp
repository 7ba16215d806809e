#include "Grid.hpp"
#include "Color.hpp"
#include "Errors.hpp"
#include <string>
#include <utility>

namespace LayerGrid {

    Grid::Grid(int width, int height)
        : width(width), height(height), valueTable(std::make_shared<ValueTable>()), gridlineColor(COLOR_BLACK) {
        if (width <= 0 || height <= 0) {
            throw InvalidArgument("Grid dimensions must be positive.");
        }
        AddLayer(); // Default layer
    }

    void Grid::AddLayer() {
        layers.emplace_back(width, height);
    }

    bool Grid::IsOOB(int x, int y) const {
        return x < 0 || y < 0 || x >= width || y >= height;
    }

    bool Grid::IsOOB(const std::optional<SDL_Point>& pos) const {
        if (!pos) {
            return true;
        }
        return IsOOB(pos->x, pos->y);
    }

    void Grid::CheckBounds(int x, int y) const {
        if (IsOOB(x, y)) {
            throw IndexOutOfBounds("Grid coordinates (" + std::to_string(x) + ", " + std::to_string(y) + ") must be in bounds.");
        }
    }

    void Grid::Set(int layer, int x, int y, int value) {
        if (!HasLayer(layer)) {
            return;
        }
        CheckBounds(x, y);
        layers[layer].Set(x, y, value);
        valueTable->Ensure(value);
        TryRepaint();
    }

    void Grid::Set(int layer, const std::optional<SDL_Point>& pos, int value) {
        if (!pos) {
            return;
        }
        Set(layer, pos->x, pos->y, value);
    }

    void Grid::Fill(int layer, int value) {
        if (!HasLayer(layer)) {
            return;
        }
        layers[layer].Fill(value);
        valueTable->Ensure(value);
        TryRepaint();
    }

    void Grid::FillRow(int layer, int row, int value) {
        if (!HasLayer(layer)) {
            return;
        }
        if (row < 0 || row >= height) {
            throw IndexOutOfBounds("Row " + std::to_string(row) + " must be in bounds.");
        }
        layers[layer].FillRow(row, value);
        valueTable->Ensure(value);
        TryRepaint();
    }

    void Grid::FillColumn(int layer, int column, int value) {
        if (!HasLayer(layer)) {
            return;
        }
        if (column < 0 || column >= width) {
            throw IndexOutOfBounds("Column " + std::to_string(column) + " must be in bounds.");
        }
        layers[layer].FillColumn(column, value);
        valueTable->Ensure(value);
        TryRepaint();
    }

    void Grid::Replace(int layer, int currentValue, int newValue) {
        if (!HasLayer(layer)) {
            return;
        }
        layers[layer].Replace(currentValue, newValue);
        valueTable->Ensure(newValue);
        TryRepaint();
    }

    int Grid::Get(int layer, int x, int y) const {
        const Layer& cells = GetLayer(layer);
        CheckBounds(x, y);
        return cells.Get(x, y);
    }

    int Grid::Get(int layer, const std::optional<SDL_Point>& pos) const {
        if (!pos) {
            throw NullInput("Position must not be null.");
        }
        return Get(layer, pos->x, pos->y);
    }

    const Layer& Grid::GetLayer(int layer) const {
        if (!HasLayer(layer)) {
            throw InvalidArgument("Must specify a valid layer.");
        }
        return layers[layer];
    }

    void Grid::SetColor(int value, std::optional<SDL_Color> color) {
        valueTable->SetColor(value, color);
        TryRepaint();
    }

    void Grid::SetTextColor(int value, std::optional<SDL_Color> textColor) {
        if (!textColor) {
            throw NullInput("Text color cannot be null.");
        }
        valueTable->SetTextColor(value, *textColor);
        TryRepaint();
    }

    void Grid::SetText(int value, const std::string& glyph) {
        valueTable->SetText(value, glyph);
        TryRepaint();
    }

    void Grid::SetImage(int value, ImageRef image) {
        valueTable->SetImage(value, std::move(image));
        TryRepaint();
    }

    void Grid::SetGridlineColor(SDL_Color color) {
        gridlineColor = color;
        TryRepaint();
    }

    std::vector<int> Grid::LayerValuesAt(int x, int y) const {
        CheckBounds(x, y);
        std::vector<int> values;
        values.reserve(layers.size());
        for (const auto& layer : layers) {
            values.push_back(layer.Get(x, y));
        }
        return values;
    }

    RenderedCell Grid::CompositeCell(int x, int y) const {
        return Composite(LayerValuesAt(x, y), *valueTable);
    }

    void Grid::Repaint() {
        if (repaintHandler) {
            repaintHandler();
        }
    }

    void Grid::TryRepaint() {
        if (autoRepaint) {
            Repaint();
        }
    }

} // namespace LayerGrid
