#include "Compositor.hpp"
#include "Color.hpp"
#include "Errors.hpp"

namespace LayerGrid {

    RenderedCell Composite(const std::vector<int>& layerValues, const ValueTable& table) {
        if (layerValues.empty()) {
            throw InvalidArgument("A cell needs at least one layer.");
        }

        // Begin with the layer 0 appearance, which is always opaque
        const ValueAppearance& base = table.Get(layerValues[0]);
        RenderedCell cell;
        cell.color = base.color ? *base.color : DEFAULT_COLOR;
        cell.glyph = base.glyph;
        cell.glyphColor = base.textColor;

        const int layerCount = static_cast<int>(layerValues.size());
        for (int i = 1; i < layerCount; ++i) {
            const ValueAppearance& data = table.Get(layerValues[i]);
            if (data.color) {
                cell.color = *data.color;
                cell.glyph.clear(); // Opaque color covers text below it
                cell.topOpaqueLayer = i;
            }
            if (!data.glyph.empty()) {
                cell.glyph = data.glyph;
                cell.glyphColor = data.textColor;
                cell.topTextLayer = i;
            }
        }

        // Images under the top opaque color are hidden
        for (int i = cell.topOpaqueLayer; i < layerCount; ++i) {
            const ValueAppearance& data = table.Get(layerValues[i]);
            if (data.image) {
                cell.images.push_back(data.image);
            }
            if (i == cell.topTextLayer) {
                cell.imagesBelowGlyph = cell.images.size();
            }
        }

        return cell;
    }

} // namespace LayerGrid
