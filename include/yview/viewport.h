#pragma once

#include <vector>

namespace yview {

// One visible item: which of its rows are on screen and where
struct ViewportSlice {
    int index = 0;     // item index
    int firstRow = 0;  // first visible row inside the item
    int rows = 0;      // visible rows, bottom-clipped
    int y = 0;         // row inside the viewport

    bool operator==(const ViewportSlice& o) const = default;
};

struct Viewport {
    int firstIndex = 0;  // first visible item
    int skipRows = 0;    // leading rows of firstIndex scrolled off the top
    std::vector<ViewportSlice> slices;

    bool empty() const { return slices.empty(); }
    int lastIndex() const { return slices.empty() ? -1 : slices.back().index; }
    // Slice covering viewport row y, or nullptr
    const ViewportSlice* sliceAt(int y) const;
};

// Visible window over items of the given heights (heights < 1 count as 1)
Viewport computeViewport(const std::vector<int>& heights, int offset, int viewportHeight);

// Start row of every item, plus the total height as last element
std::vector<int> cumulativeTops(const std::vector<int>& heights);

} // namespace yview
