//=============================================================================
// Grid Surface Tests
//
// In-memory cell grid and the UTF-8 helpers it relies on
//=============================================================================

#include <boost/ut.hpp>
#include <yview/grid-surface.h>
#include <yview/utf8.h>

#include <string>
#include <vector>

using namespace boost::ut;
using namespace yview;

suite grid_surface_tests = [] {
    "text is clipped to maxWidth and the surface"_test = [] {
        GridSurface s(6, 2);
        s.drawText(1, 0, "abcdef", {}, 3);
        expect(s.rowText(0) == " abc  ");
        s.drawText(4, 1, "xyz", {});
        expect(s.rowText(1) == "    xy");
        s.drawText(-1, 1, "12", {});
        expect(s.rowText(1) == "2   xy");
        s.drawText(0, 5, "ignored", {});
        expect(s.toString() == " abc\n2   xy");
    };

    "multi-byte glyphs take one cell each"_test = [] {
        GridSurface s(5, 1);
        s.drawText(0, 0, "├──▶x", {});
        expect(s.symbolAt(0, 0) == "├");
        expect(s.symbolAt(3, 0) == "▶");
        expect(s.symbolAt(4, 0) == "x");
    };

    "fillStyle patches cells inside the surface"_test = [] {
        GridSurface s(4, 2);
        s.drawText(0, 0, "ab", Style::foreground(7));
        s.fillStyle({1, 0, 10, 1}, Style::reversed());
        expect(!s.styleAt(0, 0).has(Style::ATTR_REVERSED));
        expect(s.styleAt(1, 0).has(Style::ATTR_REVERSED));
        expect(s.styleAt(1, 0).fg == std::optional<uint32_t>(7u));
        expect(s.styleAt(3, 0).has(Style::ATTR_REVERSED));
        expect(!s.styleAt(1, 1).has(Style::ATTR_REVERSED));
    };

    "plain border"_test = [] {
        GridSurface s(5, 3);
        s.drawBorder({0, 0, 5, 3}, BorderType::Plain, "", {});
        expect(s.rowText(0) == "┌───┐");
        expect(s.rowText(1) == "│   │");
        expect(s.rowText(2) == "└───┘");
    };

    "wide glyphs take two cells"_test = [] {
        GridSurface s(4, 1);
        s.drawText(0, 0, "日a", {});
        expect(s.symbolAt(0, 0) == "日");
        expect(s.symbolAt(1, 0) == "") << "continuation cell";
        expect(s.symbolAt(2, 0) == "a");
        expect(s.rowText(0) == "日a ");
    };

    "a wide glyph that does not fit is dropped"_test = [] {
        GridSurface s(4, 1);
        s.drawText(0, 0, "a日", {}, 2);
        expect(s.symbolAt(0, 0) == "a");
        expect(s.symbolAt(1, 0) == " ");
        expect(s.symbolAt(2, 0) == " ");
    };

    "out of range cells read as blank"_test = [] {
        GridSurface s(2, 2);
        expect(s.symbolAt(-1, 0) == " ");
        expect(s.symbolAt(2, 2) == " ");
    };
};

suite utf8_tests = [] {
    "width counts display cells"_test = [] {
        expect(utf8::width("abc") == 3_i);
        expect(utf8::width("├── ") == 4_i);
        expect(utf8::width("") == 0_i);
        expect(utf8::width("日本") == 4_i);
        expect(utf8::width("e\u0301") == 1_i) << "combining accent takes no cell";
        expect(utf8::width("\xF0\x9F\x98\x80") == 2_i);
        expect(utf8::glyphs("e\u0301x").size() == 2_ul);
    };

    "truncate and wrap measure wide glyphs"_test = [] {
        expect(utf8::truncate("日本語", 5) == "日本");
        expect(utf8::truncate("a日", 2) == "a");
        expect(utf8::wrap("日本語", 4) == std::vector<std::string>{"日本", "語"});
    };

    "truncate keeps whole codepoints"_test = [] {
        expect(utf8::truncate("├──x", 2) == "├─");
        expect(utf8::truncate("abc", 10) == "abc");
        expect(utf8::truncate("abc", 0) == "");
    };

    "decode and encode"_test = [] {
        auto cps = utf8::decode("a▶");
        expect(cps == std::vector<uint32_t>{'a', 0x25B6});
        expect(utf8::encode(0x25B6) == "▶");
        expect(utf8::encode(0x1F600) == "\xF0\x9F\x98\x80");
    };

    "wrap breaks on spaces and splits long words"_test = [] {
        expect(utf8::wrap("hello world foo", 5) == std::vector<std::string>{"hello", "world", "foo"});
        expect(utf8::wrap("abcdefgh", 3) == std::vector<std::string>{"abc", "def", "gh"});
        expect(utf8::wrap("a b\nc", 10) == std::vector<std::string>{"a b", "c"});
        expect(utf8::wrap("", 4) == std::vector<std::string>{""});
    };
};
