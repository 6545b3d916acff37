#pragma once

namespace yview {

//=============================================================================
// ScrollState - vertical scroll position of one view, in rows
//
// offset is kept in [0, maxScroll()] by every mutator. Content and viewport
// sizes are measurements; changing them does not move the offset until the
// next clamp (done once per render by the scroll policy).
//=============================================================================
class ScrollState {
public:
    int offset() const { return _offset; }
    int viewportHeight() const { return _viewportHeight; }
    int contentHeight() const { return _contentHeight; }
    bool userScrolledAway() const { return _userScrolledAway; }

    int maxScroll() const;
    bool isAtBottom() const { return _offset >= maxScroll(); }

    void setViewportHeight(int rows);
    void setContentHeight(int rows);
    void setUserScrolledAway(bool away) { _userScrolledAway = away; }

    void setOffset(int offset);
    void scrollBy(int delta);
    void scrollToTop() { _offset = 0; }
    void scrollToEnd() { _offset = maxScroll(); }
    void clamp() { setOffset(_offset); }

    // Minimal move so that rows [rangeStart, rangeEnd) are visible.
    // A range taller than the viewport aligns its top.
    void ensureVisible(int rangeStart, int rangeEnd);

private:
    int _offset = 0;
    int _viewportHeight = 0;
    int _contentHeight = 0;
    bool _userScrolledAway = false;
};

} // namespace yview
