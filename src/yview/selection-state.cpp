#include <yview/selection-state.h>

#include <algorithm>
#include <cstdint>

namespace yview {

void SelectionState::select(int index) {
    _selected = std::max(0, index);
}

void SelectionState::select(int index, int itemCount) {
    select(index);
    clampTo(itemCount);
}

void SelectionState::clampTo(int itemCount) {
    if (itemCount <= 0) {
        _selected = 0;
        return;
    }
    _selected = std::clamp(_selected, 0, itemCount - 1);
}

void SelectionState::selectNext(int itemCount, int step) {
    clampTo(itemCount);
    int64_t target = static_cast<int64_t>(_selected) + std::max(1, step);
    _selected = static_cast<int>(std::min<int64_t>(target, std::max(0, itemCount - 1)));
}

void SelectionState::selectPrevious(int itemCount, int step) {
    clampTo(itemCount);
    _selected = std::max(0, _selected - std::max(1, step));
}

void SelectionState::selectLast(int itemCount) {
    _selected = std::max(0, itemCount - 1);
}

} // namespace yview
