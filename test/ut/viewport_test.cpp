//=============================================================================
// Viewport Tests
//
// Visible window over variable-height items
//=============================================================================

#include <boost/ut.hpp>
#include <yview/viewport.h>

using namespace boost::ut;
using namespace yview;

suite viewport_tests = [] {
    "straddling first item shows its remaining rows"_test = [] {
        auto vp = computeViewport({2, 3, 1, 4}, 3, 4);

        expect(vp.firstIndex == 1_i);
        expect(vp.skipRows == 1_i);
        expect(vp.slices.size() == 3_ul);
        if (vp.slices.size() != 3) return;

        // item 1: rows 1..2 of 3
        expect(vp.slices[0] == ViewportSlice{1, 1, 2, 0});
        // item 2: its single row
        expect(vp.slices[1] == ViewportSlice{2, 0, 1, 2});
        // item 3: first row of 4
        expect(vp.slices[2] == ViewportSlice{3, 0, 1, 3});
        expect(vp.lastIndex() == 3_i);
    };

    "offset at item boundary starts on that item"_test = [] {
        auto vp = computeViewport({2, 3, 1, 4}, 2, 3);
        expect(vp.firstIndex == 1_i);
        expect(vp.skipRows == 0_i);
        expect(vp.slices.size() == 1_ul);
        expect(vp.slices[0] == ViewportSlice{1, 0, 3, 0});
    };

    "last slice is bottom clipped"_test = [] {
        auto vp = computeViewport({5, 5}, 0, 7);
        expect(vp.slices.size() == 2_ul);
        expect(vp.slices[1] == ViewportSlice{1, 0, 2, 5});
    };

    "degenerate inputs give an empty viewport"_test = [] {
        expect(computeViewport({}, 0, 10).empty());
        expect(computeViewport({1, 2}, 0, 0).empty());
        expect(computeViewport({1, 2}, 0, -4).empty());
        expect(computeViewport({1, 2}, 3, 5).empty()) << "offset at total height";
        expect(computeViewport({1, 2}, 10, 5).empty()) << "offset past total height";
        expect(computeViewport({}, 0, 10).lastIndex() == -1_i);
    };

    "heights below one count as one row"_test = [] {
        auto vp = computeViewport({0, -2, 1}, 0, 5);
        expect(vp.slices.size() == 3_ul);
        for (int i = 0; i < 3; ++i) {
            expect(vp.slices[i].rows == 1_i);
            expect(vp.slices[i].y == i);
        }
    };

    "sliceAt maps viewport rows to items"_test = [] {
        auto vp = computeViewport({2, 3, 1, 4}, 3, 4);
        expect(vp.sliceAt(0)->index == 1_i);
        expect(vp.sliceAt(1)->index == 1_i);
        expect(vp.sliceAt(2)->index == 2_i);
        expect(vp.sliceAt(3)->index == 3_i);
        expect(vp.sliceAt(4) == nullptr);
    };

    "cumulative tops end with total height"_test = [] {
        auto tops = cumulativeTops({2, 3, 1, 4});
        expect(tops == std::vector<int>{0, 2, 5, 6, 10});
    };
};
