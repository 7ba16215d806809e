#include "GridPainter.hpp"
#include <iostream>

namespace LayerGrid {

    GridPainter::GridPainter(SDL_Renderer* renderer, const CellMetrics& metrics, const std::string& fontPath)
        : renderer(renderer), metrics(metrics), images(renderer) {
        if (!fontPath.empty()) {
            text = std::make_unique<TextRender>(renderer, fontPath, metrics.GetCellSize());
        }
    }

    void GridPainter::Paint(const Grid& grid) {
        // Gridlines are whatever shows between the cells
        const SDL_Color lines = grid.GetGridlineColor();
        SDL_SetRenderDrawColor(renderer, lines.r, lines.g, lines.b, lines.a);
        SDL_RenderClear(renderer);

        for (int x = 0; x < grid.GetWidth(); ++x) {
            for (int y = 0; y < grid.GetHeight(); ++y) {
                PaintCell(grid.CompositeCell(x, y), metrics.CellRect(x, y));
            }
        }
    }

    void GridPainter::PaintCell(const RenderedCell& cell, const SDL_FRect& rect) {
        SDL_SetRenderDrawColor(renderer, cell.color.r, cell.color.g, cell.color.b, cell.color.a);
        SDL_RenderFillRect(renderer, &rect);

        for (size_t i = 0; i < cell.images.size(); ++i) {
            if (i == cell.imagesBelowGlyph && cell.HasGlyph() && text) {
                text->renderGlyph(cell.glyph, cell.glyphColor, rect);
            }
            SDL_Texture* texture = images.Get(cell.images[i]);
            if (texture) {
                SDL_RenderTexture(renderer, texture, nullptr, &rect); // Stretched to the cell
            }
        }
        if (cell.imagesBelowGlyph >= cell.images.size() && cell.HasGlyph() && text) {
            text->renderGlyph(cell.glyph, cell.glyphColor, rect);
        }
    }

    SurfacePtr RenderGridImage(const Grid& grid, const CellMetrics& metrics, const std::string& fontPath) {
        const int w = metrics.PanelExtent(grid.GetWidth());
        const int h = metrics.PanelExtent(grid.GetHeight());

        SurfacePtr target(SDL_CreateSurface(w, h, SDL_PIXELFORMAT_RGBA32));
        if (!target) {
            std::cerr << "[Grid] Failed to create image surface: " << SDL_GetError() << std::endl;
            return nullptr;
        }

        SDL_Renderer* renderer = SDL_CreateSoftwareRenderer(target.get());
        if (!renderer) {
            std::cerr << "[Grid] Failed to create software renderer: " << SDL_GetError() << std::endl;
            return nullptr;
        }

        SurfacePtr image;
        {
            // Painter textures must go before the renderer
            GridPainter painter(renderer, metrics, fontPath);
            painter.Paint(grid);
            image.reset(SDL_RenderReadPixels(renderer, nullptr));
        }
        SDL_DestroyRenderer(renderer);

        if (!image) {
            std::cerr << "[Grid] Failed to read grid pixels: " << SDL_GetError() << std::endl;
        }
        return image;
    }

    bool SaveGridImage(const Grid& grid, const CellMetrics& metrics, const std::string& fontPath, const std::string& path) {
        SurfacePtr image = RenderGridImage(grid, metrics, fontPath);
        if (!image) {
            return false;
        }
        return SaveImagePNG(image.get(), path);
    }

} // namespace LayerGrid
