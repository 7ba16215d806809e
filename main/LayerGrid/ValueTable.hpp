#ifndef VALUE_TABLE_HPP
#define VALUE_TABLE_HPP

#include <SDL3/SDL.h>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace LayerGrid {

    using ImageRef = std::shared_ptr<SDL_Surface>;

    /**
     * @brief Appearance mapped to one integer cell value.
     *
     * A null color is painted white on layer 0 and is transparent on every
     * other layer. The glyph is one UTF-8 code point; empty means no text.
     */
    struct ValueAppearance {
        std::optional<SDL_Color> color;
        std::string glyph;
        SDL_Color textColor;
        ImageRef image;

        ValueAppearance();
        ValueAppearance(std::optional<SDL_Color> color, SDL_Color textColor, std::string glyph, ImageRef image);
    };

    // True for an empty string or exactly one well-formed UTF-8 code point.
    bool IsGlyph(const std::string& text);

    /**
     * @brief Maps cell values to their appearance.
     *
     * Entries are created with default appearance the first time a value is
     * written or configured and are never removed.
     */
    class ValueTable {
    public:
        ValueTable();

        // Creates a default entry for value if it has none.
        void Ensure(int value);
        bool Contains(int value) const;

        /**
         * @brief Returns the appearance of a value.
         * @throws InvalidArgument If the value has no entry.
         */
        const ValueAppearance& Get(int value) const;

        void SetColor(int value, std::optional<SDL_Color> color);
        void SetTextColor(int value, SDL_Color textColor);
        // @throws InvalidArgument If glyph is not empty or a single UTF-8 code point.
        void SetText(int value, const std::string& glyph);
        void SetImage(int value, ImageRef image);

        size_t Size() const { return entries.size(); }

    private:
        std::unordered_map<int, ValueAppearance> entries;
    };

} // namespace LayerGrid

#endif // VALUE_TABLE_HPP
