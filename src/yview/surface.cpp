#include <yview/surface.h>

namespace yview {

const char* toString(BorderType type) {
    switch (type) {
        case BorderType::None: return "none";
        case BorderType::Plain: return "plain";
        case BorderType::Rounded: return "rounded";
    }
    return "none";
}

Result<BorderType> parseBorderType(const std::string& name) {
    if (name == "none") return BorderType::None;
    if (name == "plain") return BorderType::Plain;
    if (name == "rounded") return BorderType::Rounded;
    return Err<BorderType>("unknown border type: " + name, ErrorCode::Configuration);
}

void Surface::drawBorder(const Rect& area, BorderType type,
                         const std::string& title, const Style& style) {
    if (type == BorderType::None || area.width < 2 || area.height < 2) {
        return;
    }

    const bool rounded = type == BorderType::Rounded;
    const std::string tl = rounded ? "╭" : "┌";
    const std::string tr = rounded ? "╮" : "┐";
    const std::string bl = rounded ? "╰" : "└";
    const std::string br = rounded ? "╯" : "┘";

    std::string horizontal;
    for (int i = 0; i < area.width - 2; ++i) {
        horizontal += "─";
    }

    drawText(area.x, area.y, tl + horizontal + tr, style);
    drawText(area.x, area.bottom() - 1, bl + horizontal + br, style);
    for (int y = area.y + 1; y < area.bottom() - 1; ++y) {
        drawText(area.x, y, "│", style);
        drawText(area.right() - 1, y, "│", style);
    }

    if (!title.empty() && area.width > 2) {
        drawText(area.x + 1, area.y, title, style, area.width - 2);
    }
}

} // namespace yview
