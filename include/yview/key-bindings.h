#pragma once

#include <yview/result.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace yview {

enum class Key {
    Char,
    Up,
    Down,
    Left,
    Right,
    PageUp,
    PageDown,
    Home,
    End,
    Enter,
    Tab,
    Escape,
    Backspace,
};

enum KeyMods : int {
    MOD_NONE  = 0,
    MOD_SHIFT = 1 << 0,
    MOD_CTRL  = 1 << 1,
    MOD_ALT   = 1 << 2,
};

struct KeyEvent {
    Key key = Key::Char;
    uint32_t codepoint = 0;  // Key::Char only
    int mods = MOD_NONE;

    static KeyEvent of(Key key, int mods = MOD_NONE) { return {key, 0, mods}; }
    static KeyEvent ch(uint32_t codepoint, int mods = MOD_NONE) { return {Key::Char, codepoint, mods}; }

    bool operator==(const KeyEvent& o) const = default;
};

struct MouseEvent {
    enum class Kind {
        Press,
        ScrollUp,
        ScrollDown,
    };

    Kind kind = Kind::Press;
    int x = 0;
    int y = 0;
};

enum class NavAction {
    MoveUp,
    MoveDown,
    MoveLeft,
    MoveRight,
    PageUp,
    PageDown,
    Home,
    End,
    Select,
};

const char* toString(NavAction action);

// "up", "pgdn", "ctrl+f", "G", "space", ...
Result<KeyEvent> parseKeyName(const std::string& name);

//=============================================================================
// KeyBindings - key to navigation action table
//=============================================================================
class KeyBindings {
public:
    // Arrows, PageUp/PageDown, Home/End, Enter/Space
    static KeyBindings standard();
    // standard plus k j h l g G, Ctrl-B / Ctrl-F
    static KeyBindings vim();
    // "standard" or "vim"
    static Result<KeyBindings> preset(const std::string& name);

    void bind(NavAction action, const KeyEvent& key);
    void unbind(const KeyEvent& key);

    std::optional<NavAction> actionFor(const KeyEvent& key) const;
    std::vector<KeyEvent> keysFor(NavAction action) const;

private:
    std::vector<std::pair<KeyEvent, NavAction>> _bindings;
};

} // namespace yview
