#include <SDL3/SDL.h>
#include <iostream>
#include "UnitTests.hpp"

int main(int argc, char* argv[]) {
    // Headless: the raster test only needs a software renderer
    SDL_SetHint(SDL_HINT_VIDEO_DRIVER, "dummy");
    if (!SDL_Init(SDL_INIT_VIDEO)) {
        std::cerr << "SDL could not initialize! SDL_Error: " << SDL_GetError() << std::endl;
        return 1;
    }

    bool (*tests[])() = {
        Test_SetThenGet,
        Test_ValueEntryCreatedOnWrite,
        Test_CompositeSingleLayer,
        Test_ColorHidesTextBelow,
        Test_CompositeImagesAndText,
        Test_CompositeUnknownValue,
        Test_SaveLoadRoundTrip,
        Test_LoadAddsAndKeepsLayers,
        Test_LoadRejectsBadData,
        Test_MouseMapping,
        Test_CellMetrics,
        Test_MissingLayer,
        Test_FillLayer,
        Test_FillRowColumnReplace,
        Test_OutOfBounds,
        Test_NullInput,
        Test_AutoRepaint,
        Test_MouseFlag,
        Test_MouseWatch,
        Test_Utf8Glyph,
        Test_ParseGridConfig,
        Test_ParseGridConfigErrors,
        Test_RenderGridImage,
    };

    int failed = 0;
    for (auto test : tests) {
        if (!test()) {
            ++failed;
        }
    }

    SDL_Quit();

    if (failed > 0) {
        std::cerr << failed << " test(s) failed.\n";
        return 1;
    }
    std::cout << "All tests passed.\n";
    return 0;
}
