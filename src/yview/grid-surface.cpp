#include <yview/grid-surface.h>
#include <yview/utf8.h>

#include <algorithm>

namespace yview {

GridSurface::GridSurface(int width, int height)
    : _width(std::max(0, width)), _height(std::max(0, height)),
      _cells(static_cast<size_t>(_width) * _height) {}

void GridSurface::drawText(int x, int y, const std::string& text,
                           const Style& style, int maxWidth) {
    if (y < 0 || y >= _height) return;

    int limit = maxWidth < 0 ? _width : std::min(_width, x + maxWidth);
    int cx = x;
    for (auto& glyph : utf8::glyphs(text)) {
        if (glyph == "\n") break;
        int gw = std::max(1, utf8::width(glyph));
        if (cx + gw > limit) break;
        for (int i = 0; i < gw; ++i) {
            if (cx + i < 0) continue;
            auto& c = _cells[static_cast<size_t>(y) * _width + cx + i];
            // Wide glyphs leave an empty continuation cell; one cut by the
            // left edge shows as blank
            if (cx < 0) {
                c.symbol = " ";
            } else {
                c.symbol = i == 0 ? glyph : std::string();
            }
            c.style = c.style.patch(style);
        }
        cx += gw;
    }
}

void GridSurface::fillStyle(const Rect& area, const Style& style) {
    int x0 = std::max(0, area.x);
    int y0 = std::max(0, area.y);
    int x1 = std::min(_width, area.right());
    int y1 = std::min(_height, area.bottom());
    for (int y = y0; y < y1; ++y) {
        for (int x = x0; x < x1; ++x) {
            auto& c = _cells[static_cast<size_t>(y) * _width + x];
            c.style = c.style.patch(style);
        }
    }
}

void GridSurface::clear() {
    std::fill(_cells.begin(), _cells.end(), Cell{});
}

const GridSurface::Cell& GridSurface::cell(int x, int y) const {
    static const Cell empty;
    if (x < 0 || y < 0 || x >= _width || y >= _height) {
        return empty;
    }
    return _cells[static_cast<size_t>(y) * _width + x];
}

std::string GridSurface::rowText(int y) const {
    std::string row;
    for (int x = 0; x < _width; ++x) {
        row += cell(x, y).symbol;
    }
    return row;
}

std::string GridSurface::toString() const {
    std::string out;
    for (int y = 0; y < _height; ++y) {
        std::string row = rowText(y);
        row.erase(row.find_last_not_of(' ') + 1);
        if (y > 0) out += '\n';
        out += row;
    }
    return out;
}

} // namespace yview
