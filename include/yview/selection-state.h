#pragma once

namespace yview {

//=============================================================================
// SelectionState - single selected index
//
// Clamped to [0, itemCount) whenever itemCount > 0, else 0.
//=============================================================================
class SelectionState {
public:
    int selected() const { return _selected; }

    // Stores the index; negatives become 0. The upper bound is applied by
    // clampTo() once the item count is known.
    void select(int index);
    void select(int index, int itemCount);
    void clampTo(int itemCount);

    void selectNext(int itemCount, int step = 1);
    void selectPrevious(int itemCount, int step = 1);
    void selectFirst() { _selected = 0; }
    void selectLast(int itemCount);

private:
    int _selected = 0;
};

} // namespace yview
