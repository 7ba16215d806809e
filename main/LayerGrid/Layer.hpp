#ifndef LAYER_HPP
#define LAYER_HPP

#include <cstddef>
#include <vector>

namespace LayerGrid {

    /**
     * @brief One width x height plane of integer cell values.
     * Callers check coordinates; Layer itself does not.
     */
    class Layer {
    public:
        Layer(int width, int height)
            : width(width), height(height), cells(static_cast<size_t>(width) * height, 0) {
        }

        int Get(int x, int y) const { return cells[Index(x, y)]; }
        void Set(int x, int y, int value) { cells[Index(x, y)] = value; }

        void Fill(int value);
        void FillRow(int row, int value);
        void FillColumn(int column, int value);
        void Replace(int currentValue, int newValue);

        int GetWidth() const { return width; }
        int GetHeight() const { return height; }

        // Row-major
        const std::vector<int>& Cells() const { return cells; }

    private:
        int width, height;
        std::vector<int> cells;

        size_t Index(int x, int y) const { return static_cast<size_t>(y) * width + x; }
    };

} // namespace LayerGrid

#endif // LAYER_HPP
