//=============================================================================
// Scroll Policy Tests
//
// Policy exclusivity, per-render offset resolution and sticky following
//=============================================================================

#include <boost/ut.hpp>
#include <yview/key-bindings.h>
#include <yview/list-view.h>
#include <yview/scroll-policy.h>

#include <string>

using namespace boost::ut;
using namespace yview;

static std::vector<ListItem> numberedItems(int count) {
    std::vector<ListItem> items;
    for (int i = 0; i < count; ++i) {
        items.emplace_back("item " + std::to_string(i));
    }
    return items;
}

suite scroll_policy_selector_tests = [] {
    "second exclusive policy is a configuration error"_test = [] {
        ScrollPolicySelector sel;
        expect(sel.select(ScrollPolicy::AutoScroll).has_value());

        auto res = sel.select(ScrollPolicy::StickyScroll);
        expect(!res.has_value());
        if (!res) {
            expect(res.error().code() == ErrorCode::Configuration);
        }
        expect(sel.current() == ScrollPolicy::AutoScroll) << "failed select keeps the active policy";

        expect(!sel.select(ScrollPolicy::ScrollToEnd).has_value());
    };

    "re-enabling the same policy or None never fails"_test = [] {
        ScrollPolicySelector sel;
        expect(sel.select(ScrollPolicy::None).has_value());
        expect(sel.select(ScrollPolicy::StickyScroll).has_value());
        expect(sel.select(ScrollPolicy::StickyScroll).has_value());
        expect(sel.select(ScrollPolicy::None).has_value());
        expect(sel.current() == ScrollPolicy::None);
        expect(sel.select(ScrollPolicy::ScrollToEnd).has_value()) << "None clears the active policy";
    };

    "view reports the conflict with the cause chained"_test = [] {
        ListView view;
        expect(view.setScrollPolicy(ScrollPolicy::ScrollToEnd).has_value());
        auto res = view.setScrollPolicy(ScrollPolicy::AutoScroll);
        expect(!res.has_value());
        if (!res) {
            expect(res.error().code() == ErrorCode::Configuration);
            expect(res.error().cause() != nullptr);
            expect(error_msg(res).find("scroll-to-end") != std::string::npos);
        }
    };

    "policy names round trip"_test = [] {
        for (auto p : {ScrollPolicy::None, ScrollPolicy::AutoScroll,
                       ScrollPolicy::ScrollToEnd, ScrollPolicy::StickyScroll}) {
            auto parsed = parseScrollPolicy(toString(p));
            expect(parsed.has_value() && *parsed == p) << toString(p);
        }
        auto bad = parseScrollPolicy("sideways");
        expect(!bad.has_value());
        if (!bad) {
            expect(bad.error().code() == ErrorCode::Configuration);
        }
    };
};

suite scroll_policy_resolution_tests = [] {
    "ScrollToEnd pins the offset every render"_test = [] {
        ScrollState s;
        s.setContentHeight(10);
        s.setViewportHeight(3);
        resolveScrollPolicy(ScrollPolicy::ScrollToEnd, s, 0, 1);
        expect(s.offset() == 7_i);
        s.setContentHeight(12);
        resolveScrollPolicy(ScrollPolicy::ScrollToEnd, s, 0, 1);
        expect(s.offset() == 9_i);
    };

    "AutoScroll follows the selected range"_test = [] {
        ScrollState s;
        s.setContentHeight(10);
        s.setViewportHeight(3);
        resolveScrollPolicy(ScrollPolicy::AutoScroll, s, 6, 8);
        expect(s.offset() == 5_i);
        resolveScrollPolicy(ScrollPolicy::AutoScroll, s, 1, 2);
        expect(s.offset() == 1_i);
    };

    "StickyScroll starts glued to the bottom"_test = [] {
        ScrollState s;
        s.setContentHeight(10);
        s.setViewportHeight(3);
        resolveScrollPolicy(ScrollPolicy::StickyScroll, s, 0, 1);
        expect(s.offset() == 7_i);
        expect(!s.userScrolledAway());
    };

    "StickyScroll re-engages on reaching the bottom"_test = [] {
        ScrollState s;
        s.setContentHeight(10);
        s.setViewportHeight(3);
        s.setUserScrolledAway(true);
        s.setOffset(7);
        resolveScrollPolicy(ScrollPolicy::StickyScroll, s, 0, 1);
        expect(!s.userScrolledAway());
    };

    "appended items stay glued to the bottom"_test = [] {
        ListView view;
        expect(view.setScrollPolicy(ScrollPolicy::StickyScroll).has_value());
        Rect area{0, 0, 20, 3};

        for (int i = 0; i < 20; ++i) {
            view.addItem("line " + std::to_string(i));
            view.render(area, RenderItemFn{});
            const auto& s = view.scrollState();
            expect(s.offset() == s.maxScroll()) << "after" << i + 1 << "items";
            expect(!s.userScrolledAway());
        }

        for (auto& item : numberedItems(50)) {
            view.addItem(std::move(item));
        }
        view.render(area, RenderItemFn{});
        expect(view.scrollState().offset() == 67_i);
        expect(view.scrollState().offset() == view.scrollState().maxScroll());
    };

    "MoveUp detaches and End re-attaches"_test = [] {
        ListView view(numberedItems(10));
        expect(view.setScrollPolicy(ScrollPolicy::StickyScroll).has_value());
        Rect area{0, 0, 20, 3};

        view.render(area, RenderItemFn{});
        expect(view.scrollState().offset() == 7_i);

        expect(view.handleKey(KeyEvent::of(Key::Up)));
        expect(view.scrollState().userScrolledAway());
        expect(view.scrollState().offset() == 6_i) << "exactly one row up";

        view.addItem("late arrival");
        view.render(area, RenderItemFn{});
        expect(view.scrollState().offset() == 6_i) << "stays put while scrolled away";

        expect(view.handleKey(KeyEvent::of(Key::End)));
        expect(!view.scrollState().userScrolledAway());
        expect(view.scrollState().offset() == 6_i) << "End only clears the flag";

        view.render(area, RenderItemFn{});
        expect(view.scrollState().offset() == view.scrollState().maxScroll());
        expect(view.scrollState().offset() == 8_i);
    };

    "MoveUp at the top clamps at zero"_test = [] {
        ListView view(numberedItems(2));
        expect(view.setScrollPolicy(ScrollPolicy::StickyScroll).has_value());
        view.render({0, 0, 20, 5}, RenderItemFn{});
        view.navigate(NavAction::MoveUp);
        expect(view.scrollState().offset() == 0_i);
        expect(view.scrollState().userScrolledAway());
    };
};
