#include <yview/scrollbar.h>
#include <yview/surface.h>

#include <algorithm>
#include <cmath>

namespace yview {

const char* toString(ScrollbarPolicy policy) {
    switch (policy) {
        case ScrollbarPolicy::Never: return "never";
        case ScrollbarPolicy::Always: return "always";
        case ScrollbarPolicy::AsNeeded: return "as-needed";
    }
    return "as-needed";
}

Result<ScrollbarPolicy> parseScrollbarPolicy(const std::string& name) {
    if (name == "never") return ScrollbarPolicy::Never;
    if (name == "always") return ScrollbarPolicy::Always;
    if (name == "as-needed") return ScrollbarPolicy::AsNeeded;
    return Err<ScrollbarPolicy>("unknown scrollbar policy: " + name, ErrorCode::Configuration);
}

ScrollbarMetrics projectScrollbar(int contentLength, int viewportLength,
                                  int position, int trackLength) {
    ScrollbarMetrics m;
    m.trackLength = std::max(0, trackLength);
    if (m.trackLength == 0) {
        return m;
    }
    if (contentLength <= viewportLength || contentLength <= 0) {
        m.thumbSize = m.trackLength;
        return m;
    }

    double ratio = static_cast<double>(std::max(0, viewportLength)) / contentLength;
    int size = static_cast<int>(std::ceil(ratio * m.trackLength));
    m.thumbSize = std::clamp(size, 1, m.trackLength);

    int maxPosition = contentLength - viewportLength;
    int clamped = std::clamp(position, 0, maxPosition);
    double fraction = static_cast<double>(clamped) / maxPosition;
    m.thumbPosition = static_cast<int>(std::lround(fraction * (m.trackLength - m.thumbSize)));
    return m;
}

bool speculateScrollbar(ScrollbarPolicy policy, int itemCount, int viewportHeight) {
    switch (policy) {
        case ScrollbarPolicy::Never: return false;
        case ScrollbarPolicy::Always: return true;
        case ScrollbarPolicy::AsNeeded: return itemCount > viewportHeight;
    }
    return false;
}

bool finalizeScrollbar(ScrollbarPolicy policy, int totalHeight, int viewportHeight) {
    switch (policy) {
        case ScrollbarPolicy::Never: return false;
        case ScrollbarPolicy::Always: return true;
        case ScrollbarPolicy::AsNeeded: return totalHeight > viewportHeight;
    }
    return false;
}

void VScrollbar::render(Surface& surface, const Rect& column, const ScrollbarMetrics& m) const {
    if (column.isEmpty()) return;
    for (int row = 0; row < column.height; ++row) {
        bool onThumb = row >= m.thumbPosition && row < m.thumbPosition + m.thumbSize;
        surface.drawText(column.x, column.y + row,
                         onThumb ? thumbSymbol : trackSymbol,
                         onThumb ? thumbStyle : trackStyle, 1);
    }
}

} // namespace yview
