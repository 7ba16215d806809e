#include "CellMetrics.hpp"
#include "Errors.hpp"

namespace LayerGrid {

    CellMetrics::CellMetrics(int cellSize, int gridlineWeight)
        : cellSize(cellSize), gridlineWeight(gridlineWeight) {
        if (cellSize <= 0) {
            throw InvalidArgument("Cell size must be positive.");
        }
        if (gridlineWeight < 0) {
            throw InvalidArgument("Gridline weight must not be negative.");
        }
    }

    SDL_FRect CellMetrics::CellRect(int x, int y) const {
        return {
            static_cast<float>(CellOrigin(x)),
            static_cast<float>(CellOrigin(y)),
            static_cast<float>(cellSize),
            static_cast<float>(cellSize)
        };
    }

    std::optional<SDL_Point> CellMetrics::PixelToCell(int px, int py) const {
        if (px < 0 || py < 0) {
            return std::nullopt;
        }

        // Grid cell coordinates
        const int x = px / Pitch();
        const int y = py / Pitch();
        // Cell local pixel coordinates
        const int localX = px % Pitch();
        const int localY = py % Pitch();

        if (localX > gridlineWeight && localY > gridlineWeight) {
            return SDL_Point{ x, y };
        }
        return std::nullopt; // On a gridline
    }

} // namespace LayerGrid
