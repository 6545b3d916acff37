#pragma once

#include <yview/key-bindings.h>
#include <yview/scroll-policy.h>
#include <yview/scroll-state.h>
#include <yview/selection-state.h>

namespace yview {

//=============================================================================
// NavigationController - applies navigation actions to one view's state
//
// Under StickyScroll the actions move the scroll offset and mark the view
// as scrolled away (End re-engages following). Otherwise they move the
// selection. Page steps are max(1, viewportHeight - 1) as of the last render.
//=============================================================================
class NavigationController {
public:
    NavigationController(ScrollState& scroll, SelectionState& selection,
                         const ScrollPolicySelector& policy)
        : _scroll(scroll), _selection(selection), _policy(policy) {}

    int pageStep() const;

    // Returns false for actions this controller does not handle
    // (MoveLeft, MoveRight, Select).
    bool apply(NavAction action, int itemCount);

    // Wheel scrolling by lines; positive is down
    void scrollLines(int lines, int itemCount);

    void moveUp(int itemCount, int step = 1);
    void moveDown(int itemCount, int step = 1);
    void home();
    void end(int itemCount);

private:
    bool sticky() const { return _policy.is(ScrollPolicy::StickyScroll); }
    void scrollAway(int delta);

    ScrollState& _scroll;
    SelectionState& _selection;
    const ScrollPolicySelector& _policy;
};

} // namespace yview
