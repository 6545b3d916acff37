#pragma once

#include <yview/result.hpp>
#include <yview/style.h>
#include <yview/types.h>
#include <string>

namespace yview {

class Surface;

enum class ScrollbarPolicy {
    Never,
    Always,
    AsNeeded,
};

const char* toString(ScrollbarPolicy policy);
Result<ScrollbarPolicy> parseScrollbarPolicy(const std::string& name);

struct ScrollbarMetrics {
    int thumbPosition = 0;
    int thumbSize = 0;
    int trackLength = 0;

    bool operator==(const ScrollbarMetrics& o) const = default;
};

// Thumb geometry on a track of trackLength cells. Content that fits the
// viewport yields a thumb spanning the whole track.
ScrollbarMetrics projectScrollbar(int contentLength, int viewportLength,
                                  int position, int trackLength);

inline ScrollbarMetrics projectScrollbar(int contentLength, int viewportLength, int position) {
    return projectScrollbar(contentLength, viewportLength, position, viewportLength);
}

// Column reservation before measuring: every item is at least one row,
// so more items than rows always overflow.
bool speculateScrollbar(ScrollbarPolicy policy, int itemCount, int viewportHeight);

// Final decision from the measured total height
bool finalizeScrollbar(ScrollbarPolicy policy, int totalHeight, int viewportHeight);

//=============================================================================
// VScrollbar - one column track with a thumb
//=============================================================================
struct VScrollbar {
    std::string trackSymbol;
    std::string thumbSymbol;
    Style trackStyle;
    Style thumbStyle;

    void render(Surface& surface, const Rect& column, const ScrollbarMetrics& m) const;
};

} // namespace yview
