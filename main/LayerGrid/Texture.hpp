#ifndef TEXTURE_HPP
#define TEXTURE_HPP

#include <SDL3/SDL.h>
#include <map>
#include <memory>
#include <string>
#include "ValueTable.hpp"

namespace LayerGrid {

    struct SurfaceDeleter {
        void operator()(SDL_Surface* surface) const { SDL_DestroySurface(surface); }
    };
    using SurfacePtr = std::unique_ptr<SDL_Surface, SurfaceDeleter>;

    // Takes ownership of surface. Null stays null.
    ImageRef MakeImageRef(SDL_Surface* surface);

    // Loads any format SDL_image reads. Returns null and logs on failure.
    ImageRef LoadImage(const std::string& path);

    bool SaveImagePNG(SDL_Surface* surface, const std::string& path);

    /**
     * @brief Keeps one SDL_Texture per image surface for a renderer.
     * Cached surfaces stay alive until Clear() or destruction.
     */
    class TextureCache {
    public:
        explicit TextureCache(SDL_Renderer* renderer) : renderer(renderer) {}
        ~TextureCache() { Clear(); }

        TextureCache(const TextureCache&) = delete;
        TextureCache& operator=(const TextureCache&) = delete;

        SDL_Texture* Get(const ImageRef& image);
        void Clear();

    private:
        struct Entry {
            ImageRef image;
            SDL_Texture* texture;
        };

        SDL_Renderer* renderer;
        std::map<SDL_Surface*, Entry> entries;
    };

} // namespace LayerGrid

#endif // TEXTURE_HPP
