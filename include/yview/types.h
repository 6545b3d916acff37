#pragma once

#include <algorithm>
#include <any>
#include <optional>
#include <string>
#include <vector>

namespace yview {

// Value type for opaque item payloads
using Value = std::any;

// Helper to get value from std::any
template<typename T>
std::optional<T> getAs(const Value& v) {
    try {
        return std::any_cast<T>(v);
    } catch (const std::bad_any_cast&) {
        return std::nullopt;
    }
}

//=============================================================================
// Rect - cell-aligned rectangle on a surface
//=============================================================================
struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool isEmpty() const { return width <= 0 || height <= 0; }
    int right() const { return x + width; }
    int bottom() const { return y + height; }

    bool contains(int px, int py) const {
        return px >= x && px < right() && py >= y && py < bottom();
    }

    // Shrink by margin on every side, never below zero size
    Rect inner(int margin) const {
        return {x + margin, y + margin,
                std::max(0, width - 2 * margin),
                std::max(0, height - 2 * margin)};
    }

    bool operator==(const Rect& o) const = default;
};

} // namespace yview
