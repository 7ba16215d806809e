#pragma once
#include <SDL3/SDL.h>

namespace LayerGrid {

    const SDL_Color COLOR_WHITE = { 255, 255, 255, 255 };
    const SDL_Color COLOR_BLACK = { 0, 0, 0, 255 };

    // Cell color used for value entries created on demand
    const SDL_Color DEFAULT_COLOR = COLOR_WHITE;
    const SDL_Color DEFAULT_TEXT_COLOR = COLOR_BLACK;

    //Compares two colors
    inline bool IsColorEqual(const SDL_Color& a, const SDL_Color& b) {
        return (a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a);
    }

} // namespace LayerGrid
