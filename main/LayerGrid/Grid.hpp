#ifndef GRID_HPP
#define GRID_HPP

#include <SDL3/SDL.h>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "Layer.hpp"
#include "ValueTable.hpp"
#include "Compositor.hpp"

namespace LayerGrid {

    /**
     * @brief A stack of equally sized layers of integer cell values plus the
     * table that maps each value to its appearance.
     *
     * Layer 0 always exists. Layers are only ever added on top.
     * Writes to a layer that does not exist are ignored; reads from one throw.
     */
    class Grid {
    public:
        using RepaintHandler = std::function<void()>;

        /**
         * @brief Constructs a grid with a single layer of zeros.
         * @param width Width of the grid in cells
         * @param height Height of the grid in cells
         * @throws InvalidArgument If either dimension is not positive.
         */
        Grid(int width, int height);

        int GetWidth() const { return width; }
        int GetHeight() const { return height; }
        int LayerCount() const { return static_cast<int>(layers.size()); }

        // Adds a zero-filled layer on top of all others.
        void AddLayer();

        bool IsOOB(int x, int y) const;
        // An absent position counts as out of bounds.
        bool IsOOB(const std::optional<SDL_Point>& pos) const;

        /**
         * @brief Sets one cell. Layer 0 when no layer is given.
         * @throws IndexOutOfBounds If (x, y) is outside an existing layer.
         */
        void Set(int layer, int x, int y, int value);
        void Set(int x, int y, int value) { Set(0, x, y, value); }
        // No-op when pos is empty.
        void Set(int layer, const std::optional<SDL_Point>& pos, int value);
        void Set(const std::optional<SDL_Point>& pos, int value) { Set(0, pos, value); }

        void Fill(int layer, int value);
        void Fill(int value) { Fill(0, value); }
        void FillRow(int layer, int row, int value);
        void FillRow(int row, int value) { FillRow(0, row, value); }
        void FillColumn(int layer, int column, int value);
        void FillColumn(int column, int value) { FillColumn(0, column, value); }
        void Replace(int layer, int currentValue, int newValue);
        void Replace(int currentValue, int newValue) { Replace(0, currentValue, newValue); }

        /**
         * @brief Returns the value of one cell. Layer 0 when no layer is given.
         * @throws InvalidArgument If the layer does not exist.
         * @throws IndexOutOfBounds If (x, y) is outside the grid.
         */
        int Get(int layer, int x, int y) const;
        int Get(int x, int y) const { return Get(0, x, y); }
        // @throws NullInput If pos is empty.
        int Get(int layer, const std::optional<SDL_Point>& pos) const;
        int Get(const std::optional<SDL_Point>& pos) const { return Get(0, pos); }

        const Layer& GetLayer(int layer) const;

        // Value appearance. Each call creates the entry when missing.
        void SetColor(int value, std::optional<SDL_Color> color);
        void SetTextColor(int value, std::optional<SDL_Color> textColor);
        // @throws InvalidArgument If glyph is longer than one UTF-8 code point.
        void SetText(int value, const std::string& glyph);
        void SetImage(int value, ImageRef image);

        std::shared_ptr<ValueTable> GetValueTable() const { return valueTable; }

        void SetGridlineColor(SDL_Color color);
        SDL_Color GetGridlineColor() const { return gridlineColor; }

        // Values of every layer at (x, y), bottom first.
        std::vector<int> LayerValuesAt(int x, int y) const;
        RenderedCell CompositeCell(int x, int y) const;

        void SetAutoRepaint(bool enabled) { autoRepaint = enabled; }
        bool IsAutoRepaint() const { return autoRepaint; }
        void SetRepaintHandler(RepaintHandler handler) { repaintHandler = std::move(handler); }
        // Requests a repaint regardless of the auto repaint setting.
        void Repaint();

    private:
        int width, height;
        std::vector<Layer> layers;
        std::shared_ptr<ValueTable> valueTable;
        SDL_Color gridlineColor;
        bool autoRepaint = true;
        RepaintHandler repaintHandler;

        bool HasLayer(int layer) const { return layer >= 0 && layer < LayerCount(); }
        void CheckBounds(int x, int y) const;
        void TryRepaint();
    };

} // namespace LayerGrid

#endif // GRID_HPP
