//=============================================================================
// Style Tests
//=============================================================================

#include <boost/ut.hpp>
#include <yview/style.h>

using namespace boost::ut;
using namespace yview;

namespace {

class FixedResolver : public StyleResolver {
public:
    explicit FixedResolver(Style s) : _style(s) {}
    std::optional<Style> resolve(const std::string& selector) const override {
        if (selector == "known") return _style;
        return std::nullopt;
    }

private:
    Style _style;
};

} // namespace

suite style_tests = [] {
    "colors parse to ABGR"_test = [] {
        expect(parseColor("#FF0000").value() == 0xFF0000FFu);
        expect(parseColor("#00ff00").value() == 0xFF00FF00u);
        expect(parseColor("0x80112233").value() == 0x80112233u);
    };

    "invalid colors are parse errors"_test = [] {
        for (const char* text : {"red", "#12", "#GGGGGG", "0x", "0xZZ", ""}) {
            auto res = parseColor(text);
            expect(!res.has_value()) << text;
            if (!res) {
                expect(res.error().code() == ErrorCode::Parse);
            }
        }
    };

    "style strings"_test = [] {
        auto s = parseStyle("bold reversed fg=#00FF00");
        expect(s.has_value());
        if (!s) return;
        expect(s->has(Style::ATTR_BOLD));
        expect(s->has(Style::ATTR_REVERSED));
        expect(!s->has(Style::ATTR_ITALIC));
        expect(s->fg == std::optional<uint32_t>(0xFF00FF00u));
        expect(!s->bg.has_value());

        expect(parseStyle("").value().isEmpty());
        expect(!parseStyle("blinking").has_value());

        auto bad = parseStyle("bg=#nope");
        expect(!bad.has_value());
        if (!bad) {
            expect(bad.error().cause() != nullptr);
        }
    };

    "patch overlays colours and accumulates attributes"_test = [] {
        Style base{0xFF000001u, 0xFF000002u, Style::ATTR_BOLD};
        Style over{0xFF000003u, std::nullopt, Style::ATTR_UNDERLINE};
        auto s = base.patch(over);
        expect(s.fg == std::optional<uint32_t>(0xFF000003u));
        expect(s.bg == std::optional<uint32_t>(0xFF000002u));
        expect(s.has(Style::ATTR_BOLD) && s.has(Style::ATTR_UNDERLINE));
    };

    "explicit beats resolved beats fallback"_test = [] {
        FixedResolver resolver(Style::foreground(1));
        Style fallback = Style::reversed();

        expect(resolveStyle(std::nullopt, nullptr, "known", fallback) == fallback);
        expect(resolveStyle(std::nullopt, &resolver, "unknown", fallback) == fallback);
        expect(resolveStyle(std::nullopt, &resolver, "known", fallback) == Style::foreground(1));
        expect(resolveStyle(Style::foreground(2), &resolver, "known", fallback) == Style::foreground(2));
    };
};
