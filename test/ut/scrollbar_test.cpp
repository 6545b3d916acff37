//=============================================================================
// Scrollbar Tests
//
// Thumb projection and the AsNeeded reservation decision
//=============================================================================

#include <boost/ut.hpp>
#include <yview/scrollbar.h>

using namespace boost::ut;
using namespace yview;

suite scrollbar_projection_tests = [] {
    "thumb size is proportional, at least one cell"_test = [] {
        auto m = projectScrollbar(100, 10, 0, 10);
        expect(m.thumbSize == 1_i);
        expect(m.thumbPosition == 0_i);

        m = projectScrollbar(20, 10, 0, 10);
        expect(m.thumbSize == 5_i);

        m = projectScrollbar(1000000, 3, 0, 3);
        expect(m.thumbSize == 1_i);
    };

    "thumb position spans the free track"_test = [] {
        expect(projectScrollbar(100, 10, 90, 10).thumbPosition == 9_i);
        expect(projectScrollbar(100, 10, 45, 10).thumbPosition == 5_i);
        expect(projectScrollbar(20, 10, 5, 10).thumbPosition == 3_i);
        expect(projectScrollbar(20, 10, 10, 10).thumbPosition == 5_i);
    };

    "position is clamped into range"_test = [] {
        expect(projectScrollbar(20, 10, 99, 10).thumbPosition == 5_i);
        expect(projectScrollbar(20, 10, -4, 10).thumbPosition == 0_i);
    };

    "content that fits gets a full-length thumb"_test = [] {
        auto m = projectScrollbar(5, 10, 0, 10);
        expect(m == ScrollbarMetrics{0, 10, 10});
        m = projectScrollbar(0, 0, 0, 4);
        expect(m.thumbSize == 4_i);
    };

    "track length defaults to the viewport"_test = [] {
        auto m = projectScrollbar(10, 4, 6);
        expect(m == ScrollbarMetrics{2, 2, 4});
    };

    "empty track"_test = [] {
        expect(projectScrollbar(100, 10, 5, 0) == ScrollbarMetrics{});
    };
};

suite scrollbar_policy_tests = [] {
    "AsNeeded speculates from the item count"_test = [] {
        expect(!speculateScrollbar(ScrollbarPolicy::AsNeeded, 5, 5));
        expect(speculateScrollbar(ScrollbarPolicy::AsNeeded, 6, 5));
        expect(speculateScrollbar(ScrollbarPolicy::Always, 0, 5));
        expect(!speculateScrollbar(ScrollbarPolicy::Never, 100, 5));
    };

    "final decision uses the measured height"_test = [] {
        expect(!finalizeScrollbar(ScrollbarPolicy::AsNeeded, 5, 5));
        expect(finalizeScrollbar(ScrollbarPolicy::AsNeeded, 6, 5));
        expect(finalizeScrollbar(ScrollbarPolicy::Always, 0, 5));
        expect(!finalizeScrollbar(ScrollbarPolicy::Never, 100, 5));
    };

    "policy names"_test = [] {
        expect(parseScrollbarPolicy("as-needed").value_or(ScrollbarPolicy::Never) == ScrollbarPolicy::AsNeeded);
        expect(parseScrollbarPolicy("always").value_or(ScrollbarPolicy::Never) == ScrollbarPolicy::Always);
        auto bad = parseScrollbarPolicy("sometimes");
        expect(!bad.has_value());
        if (!bad) {
            expect(bad.error().code() == ErrorCode::Configuration);
        }
    };
};
