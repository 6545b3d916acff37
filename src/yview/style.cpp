#include <yview/style.h>
#include <ytrace/ytrace.hpp>

#include <sstream>
#include <stdexcept>

namespace yview {

Style resolveStyle(const std::optional<Style>& explicitStyle,
                   const StyleResolver* resolver,
                   const std::string& selector,
                   const Style& fallback) {
    if (explicitStyle) {
        return *explicitStyle;
    }
    if (resolver) {
        if (auto resolved = resolver->resolve(selector)) {
            return *resolved;
        }
    }
    return fallback;
}

Result<uint32_t> parseColor(const std::string& text) {
    try {
        if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
            size_t used = 0;
            auto value = std::stoul(text, &used, 16);
            if (used != text.size()) {
                return Err<uint32_t>("invalid color: " + text, ErrorCode::Parse);
            }
            return static_cast<uint32_t>(value);
        }
        if (text.size() == 7 && text[0] == '#') {
            size_t used = 0;
            uint32_t rgb = static_cast<uint32_t>(std::stoul(text.substr(1), &used, 16));
            if (used != 6) {
                return Err<uint32_t>("invalid color: " + text, ErrorCode::Parse);
            }
            // #RRGGBB -> 0xFFBBGGRR (ABGR)
            uint8_t r = (rgb >> 16) & 0xFF;
            uint8_t g = (rgb >> 8) & 0xFF;
            uint8_t b = rgb & 0xFF;
            return 0xFF000000u | (b << 16) | (g << 8) | r;
        }
    } catch (const std::logic_error&) {
        // stoul: invalid_argument / out_of_range
    }
    return Err<uint32_t>("invalid color: " + text, ErrorCode::Parse);
}

Result<Style> parseStyle(const std::string& text) {
    Style style;
    std::istringstream in(text);
    std::string word;
    while (in >> word) {
        if (word == "bold") {
            style.attrs |= Style::ATTR_BOLD;
        } else if (word == "dim") {
            style.attrs |= Style::ATTR_DIM;
        } else if (word == "italic") {
            style.attrs |= Style::ATTR_ITALIC;
        } else if (word == "underline") {
            style.attrs |= Style::ATTR_UNDERLINE;
        } else if (word == "reversed" || word == "reverse") {
            style.attrs |= Style::ATTR_REVERSED;
        } else if (word.rfind("fg=", 0) == 0 || word.rfind("bg=", 0) == 0) {
            auto color = parseColor(word.substr(3));
            if (!color) {
                return Err<Style>("invalid style '" + text + "'", color);
            }
            (word[0] == 'f' ? style.fg : style.bg) = *color;
        } else {
            ydebug("parseStyle: unknown token '{}'", word);
            return Err<Style>("unknown style attribute: " + word, ErrorCode::Parse);
        }
    }
    return style;
}

} // namespace yview
