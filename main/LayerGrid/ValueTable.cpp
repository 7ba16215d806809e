#include "ValueTable.hpp"
#include "Color.hpp"
#include "Errors.hpp"
#include <cstring>
#include <string>
#include <utility>

namespace LayerGrid {

    bool IsGlyph(const std::string& text) {
        const char* next = text.c_str();
        size_t left = text.size();
        int codePoints = 0;
        while (left > 0) {
            const char* start = next;
            const Uint32 codePoint = SDL_StepUTF8(&next, &left);
            if (codePoint == 0) {
                return false; // Embedded NUL
            }
            // A literal U+FFFD is fine, a malformed sequence is not
            if (codePoint == SDL_INVALID_UNICODE_CODEPOINT && !(next - start == 3 && std::memcmp(start, "\xEF\xBF\xBD", 3) == 0)) {
                return false;
            }
            ++codePoints;
        }
        return codePoints <= 1;
    }

    ValueAppearance::ValueAppearance()
        : color(DEFAULT_COLOR), glyph(), textColor(DEFAULT_TEXT_COLOR), image(nullptr) {
    }

    ValueAppearance::ValueAppearance(std::optional<SDL_Color> color, SDL_Color textColor, std::string glyph, ImageRef image)
        : color(color), glyph(std::move(glyph)), textColor(textColor), image(std::move(image)) {
    }

    ValueTable::ValueTable() {
        // 0 starts with no color so higher layers stay see-through
        entries.emplace(0, ValueAppearance(std::nullopt, DEFAULT_TEXT_COLOR, "", nullptr));
    }

    void ValueTable::Ensure(int value) {
        if (entries.find(value) == entries.end()) {
            entries.emplace(value, ValueAppearance());
        }
    }

    bool ValueTable::Contains(int value) const {
        return entries.find(value) != entries.end();
    }

    const ValueAppearance& ValueTable::Get(int value) const {
        auto it = entries.find(value);
        if (it == entries.end()) {
            throw InvalidArgument("No appearance mapped to value " + std::to_string(value) + ".");
        }
        return it->second;
    }

    void ValueTable::SetColor(int value, std::optional<SDL_Color> color) {
        Ensure(value);
        entries[value].color = color;
    }

    void ValueTable::SetTextColor(int value, SDL_Color textColor) {
        Ensure(value);
        entries[value].textColor = textColor;
    }

    void ValueTable::SetText(int value, const std::string& glyph) {
        if (!IsGlyph(glyph)) {
            throw InvalidArgument("Cell text must be a single character.");
        }
        Ensure(value);
        entries[value].glyph = glyph;
    }

    void ValueTable::SetImage(int value, ImageRef image) {
        Ensure(value);
        entries[value].image = std::move(image);
    }

} // namespace LayerGrid
