#include <yview/navigation.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>

namespace yview {

int NavigationController::pageStep() const {
    return std::max(1, _scroll.viewportHeight() - 1);
}

void NavigationController::scrollAway(int delta) {
    _scroll.scrollBy(delta);
    _scroll.setUserScrolledAway(true);
}

void NavigationController::moveUp(int itemCount, int step) {
    if (sticky()) {
        scrollAway(-step);
    } else {
        _selection.selectPrevious(itemCount, step);
    }
}

void NavigationController::moveDown(int itemCount, int step) {
    if (sticky()) {
        scrollAway(step);
    } else {
        _selection.selectNext(itemCount, step);
    }
}

void NavigationController::home() {
    if (sticky()) {
        _scroll.setOffset(0);
        _scroll.setUserScrolledAway(true);
    } else {
        _selection.selectFirst();
    }
}

void NavigationController::end(int itemCount) {
    if (sticky()) {
        // The next render pins the offset to the bottom
        _scroll.setUserScrolledAway(false);
    } else {
        _selection.selectLast(itemCount);
    }
}

bool NavigationController::apply(NavAction action, int itemCount) {
    switch (action) {
        case NavAction::MoveUp:
            moveUp(itemCount);
            return true;
        case NavAction::MoveDown:
            moveDown(itemCount);
            return true;
        case NavAction::PageUp:
            moveUp(itemCount, pageStep());
            return true;
        case NavAction::PageDown:
            moveDown(itemCount, pageStep());
            return true;
        case NavAction::Home:
            home();
            return true;
        case NavAction::End:
            end(itemCount);
            return true;
        case NavAction::MoveLeft:
        case NavAction::MoveRight:
        case NavAction::Select:
            return false;
    }
    ydebug("NavigationController: unhandled action {}", toString(action));
    return false;
}

void NavigationController::scrollLines(int lines, int itemCount) {
    if (lines < 0) {
        moveUp(itemCount, -lines);
    } else if (lines > 0) {
        moveDown(itemCount, lines);
    }
}

} // namespace yview
