//=============================================================================
// Key Bindings Tests
//=============================================================================

#include <boost/ut.hpp>
#include <yview/key-bindings.h>

using namespace boost::ut;
using namespace yview;

suite key_name_tests = [] {
    "named keys and aliases"_test = [] {
        expect(parseKeyName("up").value() == KeyEvent::of(Key::Up));
        expect(parseKeyName("pgdn").value() == KeyEvent::of(Key::PageDown));
        expect(parseKeyName("PageUp").value() == KeyEvent::of(Key::PageUp));
        expect(parseKeyName("esc").value() == KeyEvent::of(Key::Escape));
        expect(parseKeyName("escape").value() == KeyEvent::of(Key::Escape));
        expect(parseKeyName("enter").value() == KeyEvent::of(Key::Enter));
        expect(parseKeyName("space").value() == KeyEvent::ch(' '));
    };

    "single characters keep their case"_test = [] {
        expect(parseKeyName("G").value() == KeyEvent::ch('G'));
        expect(parseKeyName("g").value() == KeyEvent::ch('g'));
        expect(parseKeyName("+").value() == KeyEvent::ch('+'));
    };

    "modifiers"_test = [] {
        expect(parseKeyName("ctrl+f").value() == KeyEvent::ch('f', MOD_CTRL));
        expect(parseKeyName("Ctrl+Alt+down").value() == KeyEvent::of(Key::Down, MOD_CTRL | MOD_ALT));
    };

    "unknown names are parse errors"_test = [] {
        auto res = parseKeyName("hyper");
        expect(!res.has_value());
        if (!res) {
            expect(res.error().code() == ErrorCode::Parse);
        }
        expect(!parseKeyName("").has_value());
        expect(!parseKeyName("super+x").has_value());
    };
};

suite key_binding_tests = [] {
    "standard preset"_test = [] {
        auto b = KeyBindings::standard();
        expect(b.actionFor(KeyEvent::of(Key::Up)) == std::optional(NavAction::MoveUp));
        expect(b.actionFor(KeyEvent::of(Key::PageDown)) == std::optional(NavAction::PageDown));
        expect(b.actionFor(KeyEvent::of(Key::Enter)) == std::optional(NavAction::Select));
        expect(b.actionFor(KeyEvent::ch(' ')) == std::optional(NavAction::Select));
        expect(!b.actionFor(KeyEvent::ch('j')).has_value());
    };

    "vim preset extends standard"_test = [] {
        auto b = KeyBindings::vim();
        expect(b.actionFor(KeyEvent::of(Key::Up)) == std::optional(NavAction::MoveUp));
        expect(b.actionFor(KeyEvent::ch('j')) == std::optional(NavAction::MoveDown));
        expect(b.actionFor(KeyEvent::ch('h')) == std::optional(NavAction::MoveLeft));
        expect(b.actionFor(KeyEvent::ch('G')) == std::optional(NavAction::End));
        expect(b.actionFor(KeyEvent::ch('f', MOD_CTRL)) == std::optional(NavAction::PageDown));
        expect(!b.actionFor(KeyEvent::ch('f')).has_value());
    };

    "bind replaces an existing binding for the key"_test = [] {
        auto b = KeyBindings::standard();
        b.bind(NavAction::End, KeyEvent::ch(' '));
        expect(b.actionFor(KeyEvent::ch(' ')) == std::optional(NavAction::End));
        expect(b.keysFor(NavAction::Select).size() == 1_ul);

        b.unbind(KeyEvent::of(Key::Enter));
        expect(b.keysFor(NavAction::Select).empty());
    };

    "presets by name"_test = [] {
        expect(KeyBindings::preset("vim").has_value());
        expect(KeyBindings::preset("standard").has_value());
        auto bad = KeyBindings::preset("emacs");
        expect(!bad.has_value());
        if (!bad) {
            expect(bad.error().code() == ErrorCode::Configuration);
        }
    };
};
