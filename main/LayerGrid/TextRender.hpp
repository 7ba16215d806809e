#ifndef TEXT_RENDER_HPP
#define TEXT_RENDER_HPP

#include <SDL3/SDL.h>
#include <SDL3_ttf/SDL_ttf.h>
#include <cstdint>
#include <map>
#include <string>
#include <utility>

namespace LayerGrid {

    /**
     * @brief Draws single characters centered in grid cells.
     *
     * The font is bold and sized so that one line of text is as tall as a cell.
     */
    class TextRender {
    public:
        TextRender(SDL_Renderer* renderer, const std::string& fontPath, int cellSize);
        ~TextRender();

        TextRender(const TextRender&) = delete;
        TextRender& operator=(const TextRender&) = delete;

        bool isLoaded() const { return font != nullptr; }
        float getFontSize() const { return fontSize; }

        // glyph is one UTF-8 code point
        void renderGlyph(const std::string& glyph, SDL_Color color, const SDL_FRect& cell);

    private:
        SDL_Renderer* renderer;
        TTF_Font* font;
        float fontSize;
        bool ttfStarted;

        struct GlyphTexture {
            SDL_Texture* texture;
            int w, h;
        };
        std::map<std::pair<std::string, uint32_t>, GlyphTexture> glyphs;

        void fitToCell(int cellSize);
        GlyphTexture* getGlyph(const std::string& glyph, SDL_Color color);
        void clearTextures();
    };

} // namespace LayerGrid

#endif
