#include <yview/scrollable-view.h>
#include <yview/theme.h>
#include <yview/utf8.h>
#include <ytrace/ytrace.hpp>

namespace yview {

const char* toString(ListDirection direction) {
    switch (direction) {
        case ListDirection::TopToBottom: return "top-to-bottom";
        case ListDirection::BottomToTop: return "bottom-to-top";
    }
    return "top-to-bottom";
}

Result<ListDirection> parseListDirection(const std::string& name) {
    if (name == "top-to-bottom") return ListDirection::TopToBottom;
    if (name == "bottom-to-top") return ListDirection::BottomToTop;
    return Err<ListDirection>("unknown list direction: " + name, ErrorCode::Configuration);
}

ScrollableView::ScrollableView(std::string highlightSymbol, std::string selectorPrefix)
    : _selectorPrefix(std::move(selectorPrefix)),
      _highlightSymbol(std::move(highlightSymbol)),
      _thumbSymbol(defaultTheme().scrollbarThumbSymbol),
      _trackSymbol(defaultTheme().scrollbarTrackSymbol),
      _mouseScrollStep(defaultTheme().mouseScrollStep) {}

Result<void> ScrollableView::setScrollPolicy(ScrollPolicy policy) {
    if (auto res = _policy.select(policy); !res) {
        return Err<void>("setScrollPolicy failed", res);
    }
    return Ok();
}

void ScrollableView::setScrollbarSymbols(std::string thumb, std::string track) {
    _thumbSymbol = std::move(thumb);
    _trackSymbol = std::move(track);
}

void ScrollableView::select(int index) {
    _selection.select(index, itemCount());
}

//-----------------------------------------------------------------------------
// Selection moves
//-----------------------------------------------------------------------------

void ScrollableView::selectPrevious() {
    _selection.selectPrevious(itemCount());
}

void ScrollableView::selectNext() {
    _selection.selectNext(itemCount());
}

void ScrollableView::selectFirst() {
    _selection.selectFirst();
}

void ScrollableView::selectLast() {
    _selection.selectLast(itemCount());
}

void ScrollableView::pageUp() {
    _selection.selectPrevious(itemCount(), navigation().pageStep());
}

void ScrollableView::pageDown() {
    _selection.selectNext(itemCount(), navigation().pageStep());
}

void ScrollableView::scrollBy(int delta) {
    _scroll.scrollBy(delta);
    if (delta != 0 && _policy.is(ScrollPolicy::StickyScroll)) {
        _scroll.setUserScrolledAway(true);
    }
}

void ScrollableView::scrollToTop() {
    _scroll.scrollToTop();
    if (_policy.is(ScrollPolicy::StickyScroll)) {
        _scroll.setUserScrolledAway(true);
    }
}

void ScrollableView::scrollToEnd() {
    _scroll.scrollToEnd();
    if (_policy.is(ScrollPolicy::StickyScroll)) {
        _scroll.setUserScrolledAway(false);
    }
}

//-----------------------------------------------------------------------------
// Input
//-----------------------------------------------------------------------------

bool ScrollableView::handleAction(NavAction action) {
    return navigation().apply(action, itemCount());
}

bool ScrollableView::handleKey(const KeyEvent& key) {
    auto action = _bindings.actionFor(key);
    if (!action) {
        return false;
    }
    ydebug("ScrollableView: key -> {}", toString(*action));
    return handleAction(*action);
}

bool ScrollableView::handleMouse(const MouseEvent& mouse) {
    switch (mouse.kind) {
        case MouseEvent::Kind::ScrollUp:
            navigation().scrollLines(-_mouseScrollStep, itemCount());
            return true;
        case MouseEvent::Kind::ScrollDown:
            navigation().scrollLines(_mouseScrollStep, itemCount());
            return true;
        case MouseEvent::Kind::Press: {
            if (!_itemsArea.contains(mouse.x, mouse.y)) {
                return false;
            }
            int row = mouse.y - _itemsArea.y;
            if (_direction == ListDirection::BottomToTop) {
                row = _itemsArea.height - 1 - row;
            }
            const ViewportSlice* slice = _lastViewport.sliceAt(row);
            if (!slice) {
                return false;
            }
            select(slice->index);
            return true;
        }
    }
    return false;
}

//-----------------------------------------------------------------------------
// Render pipeline
//-----------------------------------------------------------------------------

Style ScrollableView::resolved(const std::optional<Style>& explicitStyle,
                               const std::string& selector,
                               const Style& fallback) const {
    return resolveStyle(explicitStyle, _styleResolver.get(), selector, fallback);
}

ScrollableView::Frame ScrollableView::layout(const Rect& area, Surface* surface,
                                             int count, const RowMeasure& measure) {
    Frame frame;
    frame.inner = area;

    if (_border != BorderType::None) {
        if (surface) {
            surface->drawBorder(area, _border, _title,
                                resolved(_borderStyle, "border", defaultTheme().border));
        }
        frame.inner = area.inner(1);
    }

    count = std::max(0, count);
    const int viewportHeight = std::max(0, frame.inner.height);
    frame.symbolWidth = utf8::width(_highlightSymbol);

    auto measureAll = [&](bool reserveScrollbar) {
        int width = frame.inner.width - frame.symbolWidth - (reserveScrollbar ? 1 : 0);
        width = std::max(1, width);
        frame.heights.assign(count, 1);
        int total = 0;
        for (int i = 0; i < count; ++i) {
            frame.heights[i] = std::max(1, measure(i, width));
            total += frame.heights[i];
        }
        return total;
    };

    // A scrollbar needs a column next to at least one content column
    const bool scrollbarFits = frame.inner.width >= 2;
    bool reserve = scrollbarFits && speculateScrollbar(_scrollbarPolicy, count, viewportHeight);
    int total = measureAll(reserve);
    frame.showScrollbar = scrollbarFits && finalizeScrollbar(_scrollbarPolicy, total, viewportHeight);
    if (frame.showScrollbar && !reserve) {
        // Rows were measured one column too wide
        total = measureAll(true);
    }

    frame.tops = cumulativeTops(frame.heights);

    _scroll.setViewportHeight(viewportHeight);
    _scroll.setContentHeight(total);
    _selection.clampTo(count);

    int selectedTop = 0;
    int selectedBottom = 0;
    if (count > 0) {
        selectedTop = frame.tops[_selection.selected()];
        selectedBottom = selectedTop + frame.heights[_selection.selected()];
    }
    resolveScrollPolicy(_policy.current(), _scroll, selectedTop, selectedBottom);

    frame.viewport = computeViewport(frame.heights, _scroll.offset(), viewportHeight);

    int scrollbarWidth = frame.showScrollbar ? 1 : 0;
    frame.content = {frame.inner.x + frame.symbolWidth, frame.inner.y,
                     std::max(0, frame.inner.width - frame.symbolWidth - scrollbarWidth),
                     viewportHeight};
    if (frame.showScrollbar) {
        frame.scrollbar = {frame.inner.right() - 1, frame.inner.y, 1, viewportHeight};
    }

    _lastViewport = frame.viewport;
    // Highlight and content columns; the scrollbar column does not select
    _itemsArea = {frame.inner.x, frame.inner.y,
                  std::min(std::max(0, frame.inner.width), frame.symbolWidth + frame.content.width),
                  viewportHeight};
    _scrollbarVisible = frame.showScrollbar;
    _scrollbarMetrics = ScrollbarMetrics{};
    if (frame.showScrollbar) {
        _scrollbarMetrics = projectScrollbar(total, viewportHeight, _scroll.offset(), viewportHeight);
        if (_direction == ListDirection::BottomToTop) {
            _scrollbarMetrics.thumbPosition = _scrollbarMetrics.trackLength -
                _scrollbarMetrics.thumbSize - _scrollbarMetrics.thumbPosition;
        }
    }

    ydebug("ScrollableView: {} items, {} rows, offset {}/{}, {} visible, scrollbar {}",
           count, total, _scroll.offset(), _scroll.maxScroll(),
           frame.viewport.slices.size(), frame.showScrollbar);
    return frame;
}

ItemArea ScrollableView::itemArea(const Frame& frame, const ViewportSlice& slice) const {
    int top = slice.y;
    int clipped = slice.firstRow;
    if (_direction == ListDirection::BottomToTop) {
        // Mirror the slice; rows clipped at the bottom edge become the
        // item's trailing rows
        top = frame.content.height - slice.y - slice.rows;
        clipped = frame.heights[slice.index] - slice.firstRow - slice.rows;
    }

    ItemArea ia;
    ia.rect = {frame.content.x, frame.content.y + top, frame.content.width, slice.rows};
    ia.index = slice.index;
    ia.clippedRows = clipped;
    ia.selected = slice.index == _selection.selected();
    return ia;
}

void ScrollableView::drawSelection(Surface& surface, const Frame& frame,
                                   const ItemArea& item) const {
    if (!item.selected) {
        return;
    }
    Style style = resolved(_highlightStyle, _selectorPrefix + ":selected",
                           defaultTheme().highlight);
    int innerWidth = std::max(0, frame.inner.width);
    int rowWidth = std::min(innerWidth, frame.symbolWidth + frame.content.width);
    surface.fillStyle({frame.inner.x, item.rect.y, rowWidth, item.rect.height}, style);

    int symbolWidth = std::min(innerWidth, frame.symbolWidth);
    if (symbolWidth == 0) {
        return;
    }
    int rows = _repeatHighlightSymbol ? item.rect.height : 1;
    for (int r = 0; r < rows; ++r) {
        surface.drawText(frame.inner.x, item.rect.y + r, _highlightSymbol, style, symbolWidth);
    }
}

void ScrollableView::drawScrollbar(Surface& surface, const Frame& frame) const {
    if (!frame.showScrollbar) {
        return;
    }
    const auto& theme = defaultTheme();
    VScrollbar bar{
        _trackSymbol,
        _thumbSymbol,
        resolved(_trackStyle, "scrollbar-track", theme.scrollbarTrack),
        resolved(_thumbStyle, "scrollbar-thumb", theme.scrollbarThumb),
    };
    bar.render(surface, frame.scrollbar, _scrollbarMetrics);
}

} // namespace yview
