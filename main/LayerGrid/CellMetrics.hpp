#ifndef CELL_METRICS_HPP
#define CELL_METRICS_HPP

#include <SDL3/SDL.h>
#include <optional>

namespace LayerGrid {

    /**
     * @brief Pixel layout of the grid panel.
     *
     * Cells are cellSize pixels square and separated by gridlineWeight pixels
     * of gridline, with a gridline band on the outer edge as well.
     */
    class CellMetrics {
    public:
        /**
         * @param cellSize Size of each cell in pixels
         * @param gridlineWeight Width of the gridlines in pixels
         * @throws InvalidArgument If cellSize is not positive or gridlineWeight is negative.
         */
        CellMetrics(int cellSize, int gridlineWeight);

        int GetCellSize() const { return cellSize; }
        int GetGridlineWeight() const { return gridlineWeight; }
        int Pitch() const { return cellSize + gridlineWeight; }

        // Pixel of the top-left corner of cell `index` along one axis.
        int CellOrigin(int index) const { return index * Pitch() + gridlineWeight; }
        // Panel size in pixels for `cells` cells along one axis.
        int PanelExtent(int cells) const { return cells * Pitch() + gridlineWeight; }

        SDL_FRect CellRect(int x, int y) const;

        /**
         * @brief Maps a panel-local pixel to the cell under it.
         * @return The cell, or nothing if the pixel lies on a gridline band
         * (including its boundary pixel) or to the left of / above the panel.
         */
        std::optional<SDL_Point> PixelToCell(int px, int py) const;

    private:
        int cellSize;
        int gridlineWeight;
    };

} // namespace LayerGrid

#endif // CELL_METRICS_HPP
