#pragma once

#include <yview/result.hpp>
#include <yview/scroll-state.h>
#include <string>

namespace yview {

// How the offset is derived on every render
enum class ScrollPolicy {
    None,          // manual; clamp only
    AutoScroll,    // keep the selected item visible
    ScrollToEnd,   // always pinned to the bottom
    StickyScroll,  // pinned to the bottom until the user scrolls away
};

const char* toString(ScrollPolicy policy);
Result<ScrollPolicy> parseScrollPolicy(const std::string& name);

//=============================================================================
// ScrollPolicySelector - holds the single active policy
//
// Enabling a second follow policy while another one is active is a
// configuration error. Re-enabling the active one, or selecting None
// (which clears it), always succeeds.
//=============================================================================
class ScrollPolicySelector {
public:
    ScrollPolicy current() const { return _policy; }
    bool is(ScrollPolicy p) const { return _policy == p; }

    Result<void> select(ScrollPolicy policy);

private:
    ScrollPolicy _policy = ScrollPolicy::None;
};

// Per-render offset resolution, after content and viewport heights are set.
// selectedTop/selectedBottom are the selected item's row range [top, bottom).
void resolveScrollPolicy(ScrollPolicy policy, ScrollState& scroll,
                         int selectedTop, int selectedBottom);

} // namespace yview
