#include <yview/viewport.h>

#include <algorithm>

namespace yview {

const ViewportSlice* Viewport::sliceAt(int y) const {
    for (const auto& s : slices) {
        if (y >= s.y && y < s.y + s.rows) {
            return &s;
        }
    }
    return nullptr;
}

Viewport computeViewport(const std::vector<int>& heights, int offset, int viewportHeight) {
    Viewport vp;
    if (viewportHeight <= 0 || heights.empty()) {
        return vp;
    }
    offset = std::max(0, offset);

    int cumStart = 0;
    size_t i = 0;

    // Skip items ending at or before offset
    for (; i < heights.size(); ++i) {
        int h = std::max(1, heights[i]);
        if (cumStart + h > offset) break;
        cumStart += h;
    }
    if (i == heights.size()) {
        return vp;
    }

    vp.firstIndex = static_cast<int>(i);
    vp.skipRows = offset - cumStart;

    int y = 0;
    int skip = vp.skipRows;
    for (; i < heights.size() && y < viewportHeight; ++i) {
        int h = std::max(1, heights[i]);
        int rows = std::min(h - skip, viewportHeight - y);
        vp.slices.push_back({static_cast<int>(i), skip, rows, y});
        y += rows;
        skip = 0;
    }
    return vp;
}

std::vector<int> cumulativeTops(const std::vector<int>& heights) {
    std::vector<int> tops;
    tops.reserve(heights.size() + 1);
    int acc = 0;
    for (int h : heights) {
        tops.push_back(acc);
        acc += std::max(1, h);
    }
    tops.push_back(acc);
    return tops;
}

} // namespace yview
