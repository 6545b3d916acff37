#include <yview/key-bindings.h>
#include <yview/utf8.h>

#include <algorithm>
#include <cctype>
#include <map>

namespace yview {

const char* toString(NavAction action) {
    switch (action) {
        case NavAction::MoveUp: return "move-up";
        case NavAction::MoveDown: return "move-down";
        case NavAction::MoveLeft: return "move-left";
        case NavAction::MoveRight: return "move-right";
        case NavAction::PageUp: return "page-up";
        case NavAction::PageDown: return "page-down";
        case NavAction::Home: return "home";
        case NavAction::End: return "end";
        case NavAction::Select: return "select";
    }
    return "unknown";
}

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const std::map<std::string, Key>& keyNames() {
    static const std::map<std::string, Key> names = {
        {"up", Key::Up},
        {"down", Key::Down},
        {"left", Key::Left},
        {"right", Key::Right},
        {"enter", Key::Enter},
        {"return", Key::Enter},
        {"tab", Key::Tab},
        {"escape", Key::Escape},
        {"esc", Key::Escape},
        {"backspace", Key::Backspace},
        {"home", Key::Home},
        {"end", Key::End},
        {"pageup", Key::PageUp},
        {"pgup", Key::PageUp},
        {"pagedown", Key::PageDown},
        {"pgdn", Key::PageDown},
    };
    return names;
}

} // namespace

Result<KeyEvent> parseKeyName(const std::string& name) {
    if (name.empty()) {
        return Err<KeyEvent>("empty key name", ErrorCode::Parse);
    }

    int mods = MOD_NONE;
    std::string rest = name;
    // Modifier prefixes; a lone "+" is the plus key
    while (rest.size() > 1) {
        auto plus = rest.find('+');
        if (plus == std::string::npos || plus == 0) break;
        std::string mod = lower(rest.substr(0, plus));
        if (mod == "ctrl" || mod == "control") {
            mods |= MOD_CTRL;
        } else if (mod == "alt" || mod == "meta") {
            mods |= MOD_ALT;
        } else if (mod == "shift") {
            mods |= MOD_SHIFT;
        } else {
            return Err<KeyEvent>("unknown key modifier: " + mod, ErrorCode::Parse);
        }
        rest = rest.substr(plus + 1);
    }

    auto codepoints = utf8::decode(rest);
    if (codepoints.size() == 1) {
        return KeyEvent::ch(codepoints[0], mods);
    }

    std::string key = lower(rest);
    if (key == "space") {
        return KeyEvent::ch(' ', mods);
    }
    auto it = keyNames().find(key);
    if (it == keyNames().end()) {
        return Err<KeyEvent>("unknown key name: " + name, ErrorCode::Parse);
    }
    return KeyEvent::of(it->second, mods);
}

KeyBindings KeyBindings::standard() {
    KeyBindings b;
    b.bind(NavAction::MoveUp, KeyEvent::of(Key::Up));
    b.bind(NavAction::MoveDown, KeyEvent::of(Key::Down));
    b.bind(NavAction::MoveLeft, KeyEvent::of(Key::Left));
    b.bind(NavAction::MoveRight, KeyEvent::of(Key::Right));
    b.bind(NavAction::PageUp, KeyEvent::of(Key::PageUp));
    b.bind(NavAction::PageDown, KeyEvent::of(Key::PageDown));
    b.bind(NavAction::Home, KeyEvent::of(Key::Home));
    b.bind(NavAction::End, KeyEvent::of(Key::End));
    b.bind(NavAction::Select, KeyEvent::of(Key::Enter));
    b.bind(NavAction::Select, KeyEvent::ch(' '));
    return b;
}

KeyBindings KeyBindings::vim() {
    KeyBindings b = standard();
    b.bind(NavAction::MoveUp, KeyEvent::ch('k'));
    b.bind(NavAction::MoveDown, KeyEvent::ch('j'));
    b.bind(NavAction::MoveLeft, KeyEvent::ch('h'));
    b.bind(NavAction::MoveRight, KeyEvent::ch('l'));
    b.bind(NavAction::Home, KeyEvent::ch('g'));
    b.bind(NavAction::End, KeyEvent::ch('G'));
    b.bind(NavAction::PageUp, KeyEvent::ch('b', MOD_CTRL));
    b.bind(NavAction::PageDown, KeyEvent::ch('f', MOD_CTRL));
    return b;
}

Result<KeyBindings> KeyBindings::preset(const std::string& name) {
    if (name == "standard") return standard();
    if (name == "vim") return vim();
    return Err<KeyBindings>("unknown key bindings preset: " + name, ErrorCode::Configuration);
}

void KeyBindings::bind(NavAction action, const KeyEvent& key) {
    unbind(key);
    _bindings.emplace_back(key, action);
}

void KeyBindings::unbind(const KeyEvent& key) {
    std::erase_if(_bindings, [&](const auto& b) { return b.first == key; });
}

std::optional<NavAction> KeyBindings::actionFor(const KeyEvent& key) const {
    for (const auto& [k, action] : _bindings) {
        if (k == key) return action;
    }
    return std::nullopt;
}

std::vector<KeyEvent> KeyBindings::keysFor(NavAction action) const {
    std::vector<KeyEvent> keys;
    for (const auto& [k, a] : _bindings) {
        if (a == action) keys.push_back(k);
    }
    return keys;
}

} // namespace yview
