#pragma once

#include <yview/result.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace yview {

//=============================================================================
// Style - colours (ABGR) and text attributes of a cell
//=============================================================================
struct Style {
    static constexpr uint8_t ATTR_BOLD      = 0x01;
    static constexpr uint8_t ATTR_DIM       = 0x02;
    static constexpr uint8_t ATTR_ITALIC    = 0x04;
    static constexpr uint8_t ATTR_UNDERLINE = 0x08;
    static constexpr uint8_t ATTR_REVERSED  = 0x10;

    std::optional<uint32_t> fg;
    std::optional<uint32_t> bg;
    uint8_t attrs = 0;

    bool isEmpty() const { return !fg && !bg && attrs == 0; }
    bool has(uint8_t attr) const { return (attrs & attr) != 0; }

    // Overlay other on top of this: set colours win, attributes accumulate
    Style patch(const Style& other) const {
        Style s = *this;
        if (other.fg) s.fg = other.fg;
        if (other.bg) s.bg = other.bg;
        s.attrs |= other.attrs;
        return s;
    }

    static Style reversed() { return Style{std::nullopt, std::nullopt, ATTR_REVERSED}; }
    static Style foreground(uint32_t c) { return Style{c, std::nullopt, 0}; }

    bool operator==(const Style& o) const = default;
};

//=============================================================================
// StyleResolver - external style cascade, looked up by selector
//=============================================================================
class StyleResolver {
public:
    virtual ~StyleResolver() = default;
    virtual std::optional<Style> resolve(const std::string& selector) const = 0;
};

// explicit > resolved > fallback
Style resolveStyle(const std::optional<Style>& explicitStyle,
                   const StyleResolver* resolver,
                   const std::string& selector,
                   const Style& fallback);

// "#RRGGBB" or "0xAABBGGRR" -> ABGR
Result<uint32_t> parseColor(const std::string& text);

// Space separated attribute names plus optional fg=/bg= colours,
// e.g. "bold reversed fg=#ff0000"
Result<Style> parseStyle(const std::string& text);

} // namespace yview
