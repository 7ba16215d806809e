#include <SDL3_image/SDL_image.h>
#include <SDL3/SDL.h>
#include "Texture.hpp"
#include <iostream>

namespace LayerGrid {

    ImageRef MakeImageRef(SDL_Surface* surface) {
        if (!surface) {
            return nullptr;
        }
        return ImageRef(surface, SurfaceDeleter());
    }

    ImageRef LoadImage(const std::string& path) {
        SDL_Surface* surface = IMG_Load(path.c_str());
        if (!surface) {
            std::cerr << "[Texture] Failed to load " << path << ": " << SDL_GetError() << std::endl;
            return nullptr;
        }
        return MakeImageRef(surface);
    }

    bool SaveImagePNG(SDL_Surface* surface, const std::string& path) {
        if (!surface) {
            std::cerr << "[Texture] Nothing to save to " << path << std::endl;
            return false;
        }
        if (!IMG_SavePNG(surface, path.c_str())) {
            std::cerr << "[Texture] Failed to save " << path << ": " << SDL_GetError() << std::endl;
            return false;
        }
        return true;
    }

    SDL_Texture* TextureCache::Get(const ImageRef& image) {
        if (!image) {
            return nullptr;
        }

        auto it = entries.find(image.get());
        if (it != entries.end()) {
            return it->second.texture;
        }

        SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer, image.get());
        if (!texture) {
            std::cerr << "[Texture] Create Texture failed: " << SDL_GetError() << std::endl;
            return nullptr;
        }
        entries.emplace(image.get(), Entry{ image, texture });
        return texture;
    }

    void TextureCache::Clear() {
        for (auto& entry : entries) {
            SDL_DestroyTexture(entry.second.texture);
        }
        entries.clear();
    }

} // namespace LayerGrid
