#pragma once

#include <yview/surface.h>
#include <string>
#include <vector>

namespace yview {

//=============================================================================
// GridSurface - in-memory cell grid
//
// A wide glyph takes two cells; the second holds an empty symbol.
//=============================================================================
class GridSurface : public Surface {
public:
    struct Cell {
        std::string symbol = " ";
        Style style;
    };

    GridSurface(int width, int height);

    int width() const override { return _width; }
    int height() const override { return _height; }

    void drawText(int x, int y, const std::string& text,
                  const Style& style, int maxWidth = -1) override;
    void fillStyle(const Rect& area, const Style& style) override;

    void clear();

    const Cell& cell(int x, int y) const;
    const std::string& symbolAt(int x, int y) const { return cell(x, y).symbol; }
    const Style& styleAt(int x, int y) const { return cell(x, y).style; }

    // Row contents, trailing blanks kept
    std::string rowText(int y) const;
    // All rows joined by '\n', trailing blanks trimmed per row
    std::string toString() const;

private:
    int _width;
    int _height;
    std::vector<Cell> _cells;
};

} // namespace yview
