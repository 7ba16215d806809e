#include "Layer.hpp"
#include <algorithm>

namespace LayerGrid {

    void Layer::Fill(int value) {
        std::fill(cells.begin(), cells.end(), value);
    }

    void Layer::FillRow(int row, int value) {
        for (int x = 0; x < width; ++x) {
            Set(x, row, value);
        }
    }

    void Layer::FillColumn(int column, int value) {
        for (int y = 0; y < height; ++y) {
            Set(column, y, value);
        }
    }

    void Layer::Replace(int currentValue, int newValue) {
        std::replace(cells.begin(), cells.end(), currentValue, newValue);
    }

} // namespace LayerGrid
