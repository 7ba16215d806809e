#ifndef GRID_PAINTER_HPP
#define GRID_PAINTER_HPP

#include <SDL3/SDL.h>
#include <memory>
#include <string>
#include "CellMetrics.hpp"
#include "Grid.hpp"
#include "TextRender.hpp"
#include "Texture.hpp"

namespace LayerGrid {

    /**
     * @brief Paints a grid onto one SDL_Renderer.
     * Owns the glyph and image textures created for that renderer.
     */
    class GridPainter {
    public:
        /**
         * @param renderer Target renderer, must outlive the painter.
         * @param metrics Cell layout in pixels.
         * @param fontPath TTF font for glyphs. Empty to draw no text.
         */
        GridPainter(SDL_Renderer* renderer, const CellMetrics& metrics, const std::string& fontPath);

        // Gridline background, then every cell composited from all layers.
        void Paint(const Grid& grid);

        const CellMetrics& GetMetrics() const { return metrics; }

    private:
        SDL_Renderer* renderer;
        CellMetrics metrics;
        std::unique_ptr<TextRender> text;
        TextureCache images;

        void PaintCell(const RenderedCell& cell, const SDL_FRect& rect);
    };

    /**
     * @brief Renders the whole grid into a new surface, without a window.
     * @return The image, or null on SDL failure (logged).
     */
    SurfacePtr RenderGridImage(const Grid& grid, const CellMetrics& metrics, const std::string& fontPath);

    // Renders the grid and writes it as a PNG file.
    bool SaveGridImage(const Grid& grid, const CellMetrics& metrics, const std::string& fontPath, const std::string& path);

} // namespace LayerGrid

#endif // GRID_PAINTER_HPP
