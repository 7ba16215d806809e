#ifndef COMPOSITOR_HPP
#define COMPOSITOR_HPP

#include <SDL3/SDL.h>
#include <string>
#include <vector>
#include "ValueTable.hpp"

namespace LayerGrid {

    /**
     * @brief What to paint for one cell, from bottom to top:
     * the color rect, images[0, imagesBelowGlyph), the glyph (if any),
     * then the rest of images.
     */
    struct RenderedCell {
        SDL_Color color;
        std::string glyph;
        SDL_Color glyphColor;
        std::vector<ImageRef> images;
        size_t imagesBelowGlyph = 0;
        int topOpaqueLayer = 0;
        int topTextLayer = 0;

        bool HasGlyph() const { return !glyph.empty(); }
    };

    /**
     * @brief Reduces the values stacked at one cell into a single paint instruction.
     *
     * The topmost non-null color wins and hides any text below it. The topmost
     * glyph is drawn unless an opaque color lies above it. Images are drawn
     * from the topmost opaque layer upward; the glyph sits over the image on
     * its own layer and under images on higher layers. A null color on layer 0
     * is painted white.
     *
     * @param layerValues Cell value per layer, layer 0 first.
     * @param table Appearance of every value in layerValues.
     * @throws InvalidArgument If layerValues is empty or holds an unmapped value.
     */
    RenderedCell Composite(const std::vector<int>& layerValues, const ValueTable& table);

} // namespace LayerGrid

#endif // COMPOSITOR_HPP
