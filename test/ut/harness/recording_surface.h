#pragma once

//=============================================================================
// Recording Surface
//
// Surface that captures every draw call so tests can check what a view
// drew and where, without a real terminal.
//=============================================================================

#include <yview/surface.h>

#include <string>
#include <vector>

namespace yview::test {

struct TextCall {
    int x;
    int y;
    std::string text;
    Style style;
    int maxWidth;
};

struct FillCall {
    Rect area;
    Style style;
};

struct BorderCall {
    Rect area;
    BorderType type;
    std::string title;
};

class RecordingSurface : public Surface {
public:
    RecordingSurface(int width = 80, int height = 24)
        : _width(width), _height(height) {}

    int width() const override { return _width; }
    int height() const override { return _height; }

    void drawText(int x, int y, const std::string& text,
                  const Style& style, int maxWidth = -1) override {
        _texts.push_back({x, y, text, style, maxWidth});
    }

    void fillStyle(const Rect& area, const Style& style) override {
        _fills.push_back({area, style});
    }

    void drawBorder(const Rect& area, BorderType type,
                    const std::string& title, const Style& style) override {
        _borders.push_back({area, type, title});
        Surface::drawBorder(area, type, title, style);
    }

    const std::vector<TextCall>& texts() const { return _texts; }
    const std::vector<FillCall>& fills() const { return _fills; }
    const std::vector<BorderCall>& borders() const { return _borders; }

    // Text calls whose text equals the given string
    std::vector<TextCall> textsEqual(const std::string& text) const {
        std::vector<TextCall> out;
        for (const auto& t : _texts) {
            if (t.text == text) out.push_back(t);
        }
        return out;
    }

    void clear() {
        _texts.clear();
        _fills.clear();
        _borders.clear();
    }

private:
    int _width;
    int _height;
    std::vector<TextCall> _texts;
    std::vector<FillCall> _fills;
    std::vector<BorderCall> _borders;
};

// Row with trailing blanks removed
inline std::string trimmed(std::string row) {
    row.erase(row.find_last_not_of(' ') + 1);
    return row;
}

} // namespace yview::test
