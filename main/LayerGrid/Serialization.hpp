#ifndef SERIALIZATION_HPP
#define SERIALIZATION_HPP

#include <string>
#include "Grid.hpp"

namespace LayerGrid {

    const char LAYER_SEPARATOR = ':';

    /**
     * @brief Writes every layer's cell values as text.
     *
     * Values are row-major and space separated; layers are separated by ':'.
     * Only cell values are saved, not appearance or window settings.
     */
    std::string SaveGrid(const Grid& grid);

    /**
     * @brief Loads text produced by SaveGrid into a grid of the same size.
     *
     * Layers are added when the data has more of them than the grid. Grid
     * layers beyond the data are left untouched. Nothing is written unless
     * every layer parses.
     *
     * @throws InvalidArgument If a token is not an integer.
     * @throws IndexOutOfBounds If a layer does not hold exactly width * height values.
     */
    void LoadGrid(Grid& grid, const std::string& gridData);

    bool SaveGridToFile(const Grid& grid, const std::string& path);
    bool LoadGridFromFile(Grid& grid, const std::string& path);

} // namespace LayerGrid

#endif // SERIALIZATION_HPP
