#include <yview/scroll-state.h>

#include <algorithm>
#include <cstdint>

namespace yview {

int ScrollState::maxScroll() const {
    return std::max(0, _contentHeight - _viewportHeight);
}

void ScrollState::setViewportHeight(int rows) {
    _viewportHeight = std::max(0, rows);
}

void ScrollState::setContentHeight(int rows) {
    _contentHeight = std::max(0, rows);
}

void ScrollState::setOffset(int offset) {
    _offset = std::clamp(offset, 0, maxScroll());
}

void ScrollState::scrollBy(int delta) {
    int64_t target = static_cast<int64_t>(_offset) + delta;
    target = std::clamp<int64_t>(target, 0, maxScroll());
    _offset = static_cast<int>(target);
}

void ScrollState::ensureVisible(int rangeStart, int rangeEnd) {
    if (rangeEnd < rangeStart) {
        std::swap(rangeStart, rangeEnd);
    }
    if (rangeStart < _offset) {
        setOffset(rangeStart);
    } else if (rangeEnd > _offset + _viewportHeight) {
        if (rangeEnd - rangeStart > _viewportHeight) {
            setOffset(rangeStart);
        } else {
            setOffset(rangeEnd - _viewportHeight);
        }
    }
}

} // namespace yview
