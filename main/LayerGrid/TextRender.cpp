#include "TextRender.hpp"
#include <iostream>

namespace LayerGrid {

    TextRender::TextRender(SDL_Renderer* renderer, const std::string& fontPath, int cellSize)
        : renderer(renderer), font(nullptr), fontSize(0.0f), ttfStarted(false) {
        if (!TTF_Init()) {
            std::cerr << "[Text] Failed to initialize TTF: " << SDL_GetError() << std::endl;
            return;
        }
        ttfStarted = true;

        font = TTF_OpenFont(fontPath.c_str(), 1.0f);
        if (!font) {
            std::cerr << "[Text] Failed to load font " << fontPath << ": " << SDL_GetError() << std::endl;
            return;
        }
        TTF_SetFontStyle(font, TTF_STYLE_BOLD);
        fitToCell(cellSize);
    }

    TextRender::~TextRender() {
        clearTextures();
        if (font) {
            TTF_CloseFont(font);
        }
        if (ttfStarted) {
            TTF_Quit();
        }
    }

    // Grow the point size until one line fills the cell
    void TextRender::fitToCell(int cellSize) {
        float size = 0.0f;
        int textHeight = 0;
        while (textHeight < cellSize) {
            size += 1.0f;
            if (!TTF_SetFontSize(font, size)) {
                std::cerr << "[Text] Failed to size font: " << SDL_GetError() << std::endl;
                break;
            }
            textHeight = TTF_GetFontHeight(font);
        }
        fontSize = size;
    }

    void TextRender::clearTextures() {
        for (auto& entry : glyphs) {
            SDL_DestroyTexture(entry.second.texture);
        }
        glyphs.clear();
    }

    TextRender::GlyphTexture* TextRender::getGlyph(const std::string& glyph, SDL_Color color) {
        const uint32_t packed = (static_cast<uint32_t>(color.r) << 24) | (static_cast<uint32_t>(color.g) << 16) |
            (static_cast<uint32_t>(color.b) << 8) | color.a;
        const std::pair<std::string, uint32_t> key(glyph, packed);

        auto it = glyphs.find(key);
        if (it != glyphs.end()) {
            return &it->second;
        }

        SDL_Surface* textSurface = TTF_RenderText_Blended(font, glyph.c_str(), glyph.size(), color);
        if (!textSurface) {
            std::cerr << "[Text] Text Surface Error: " << SDL_GetError() << std::endl;
            return nullptr;
        }

        SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer, textSurface);
        GlyphTexture entry = { texture, textSurface->w, textSurface->h };
        SDL_DestroySurface(textSurface);

        if (!texture) {
            std::cerr << "[Text] Failed to create text texture: " << SDL_GetError() << std::endl;
            return nullptr;
        }
        return &glyphs.emplace(key, entry).first->second;
    }

    void TextRender::renderGlyph(const std::string& glyph, SDL_Color color, const SDL_FRect& cell) {
        if (!font || glyph.empty()) {
            return;
        }

        GlyphTexture* text = getGlyph(glyph, color);
        if (!text) {
            return;
        }

        SDL_FRect textRect = {
            cell.x + (cell.w - text->w) / 2,
            cell.y + (cell.h - text->h) / 2,
            static_cast<float>(text->w),
            static_cast<float>(text->h)
        };
        SDL_RenderTexture(renderer, text->texture, nullptr, &textRect);
    }

} // namespace LayerGrid
