#include <yview/scroll-policy.h>
#include <ytrace/ytrace.hpp>

namespace yview {

const char* toString(ScrollPolicy policy) {
    switch (policy) {
        case ScrollPolicy::None: return "none";
        case ScrollPolicy::AutoScroll: return "auto-scroll";
        case ScrollPolicy::ScrollToEnd: return "scroll-to-end";
        case ScrollPolicy::StickyScroll: return "sticky-scroll";
    }
    return "none";
}

Result<ScrollPolicy> parseScrollPolicy(const std::string& name) {
    if (name == "none") return ScrollPolicy::None;
    if (name == "auto-scroll" || name == "auto") return ScrollPolicy::AutoScroll;
    if (name == "scroll-to-end" || name == "end") return ScrollPolicy::ScrollToEnd;
    if (name == "sticky-scroll" || name == "sticky") return ScrollPolicy::StickyScroll;
    return Err<ScrollPolicy>("unknown scroll policy: " + name, ErrorCode::Configuration);
}

Result<void> ScrollPolicySelector::select(ScrollPolicy policy) {
    if (policy == ScrollPolicy::None || policy == _policy) {
        _policy = policy;
        return Ok();
    }
    if (_policy != ScrollPolicy::None) {
        ywarn("ScrollPolicySelector: cannot enable {} while {} is active",
              toString(policy), toString(_policy));
        return Err<void>(std::string("cannot enable ") + toString(policy) +
                             ": " + toString(_policy) + " is already active",
                         ErrorCode::Configuration);
    }
    _policy = policy;
    return Ok();
}

void resolveScrollPolicy(ScrollPolicy policy, ScrollState& scroll,
                         int selectedTop, int selectedBottom) {
    switch (policy) {
        case ScrollPolicy::None:
            scroll.clamp();
            break;

        case ScrollPolicy::AutoScroll:
            scroll.clamp();
            scroll.ensureVisible(selectedTop, selectedBottom);
            break;

        case ScrollPolicy::ScrollToEnd:
            scroll.scrollToEnd();
            break;

        case ScrollPolicy::StickyScroll: {
            scroll.clamp();
            int max = scroll.maxScroll();
            bool atBottom = max > 0 && scroll.offset() >= max;
            if (atBottom) {
                scroll.setUserScrolledAway(false);
            }
            if (!scroll.userScrolledAway()) {
                scroll.scrollToEnd();
            }
            break;
        }
    }
}

} // namespace yview
