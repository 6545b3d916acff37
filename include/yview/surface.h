#pragma once

#include <yview/result.hpp>
#include <yview/style.h>
#include <yview/types.h>
#include <string>

namespace yview {

enum class BorderType {
    None,
    Plain,
    Rounded,
};

const char* toString(BorderType type);
Result<BorderType> parseBorderType(const std::string& name);

//=============================================================================
// Surface - character buffer the views draw into
//=============================================================================
class Surface {
public:
    virtual ~Surface() = default;

    virtual int width() const = 0;
    virtual int height() const = 0;

    // Draw text starting at (x, y); clipped to maxWidth cells (< 0 = no limit)
    // and to the surface. The style is patched over the existing cell style.
    virtual void drawText(int x, int y, const std::string& text,
                          const Style& style, int maxWidth = -1) = 0;

    // Patch style over every cell of the area
    virtual void fillStyle(const Rect& area, const Style& style) = 0;

    // Box outline with an optional title in the top edge.
    // Default implementation is built on drawText.
    virtual void drawBorder(const Rect& area, BorderType type,
                            const std::string& title, const Style& style);
};

} // namespace yview
