#include <yview/list-view.h>
#include <yview/theme.h>
#include <yview/utf8.h>

#include <algorithm>
#include <string_view>

namespace yview {

std::vector<std::string> layoutLines(const std::string& text, int width) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = text.find('\n', start);
        std::string_view line(text);
        line = line.substr(start, nl == std::string::npos ? std::string_view::npos : nl - start);
        if (width > 0) {
            auto wrapped = utf8::wrap(line, width);
            if (wrapped.empty()) {
                lines.emplace_back();
            } else {
                lines.insert(lines.end(), wrapped.begin(), wrapped.end());
            }
        } else {
            lines.emplace_back(line);
        }
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return lines;
}

int measureLines(const std::string& text, int width) {
    return std::max(1, static_cast<int>(layoutLines(text, width).size()));
}

void drawItemLines(Surface& surface, const std::string& text, const ItemArea& area,
                   const Style& style) {
    if (area.rect.width <= 0) {
        return;
    }
    auto lines = layoutLines(text, area.rect.width);
    int end = std::min(static_cast<int>(lines.size()), area.clippedRows + area.rect.height);
    for (int line = std::max(0, area.clippedRows); line < end; ++line) {
        surface.drawText(area.rect.x, area.rect.y + line - area.clippedRows, lines[line],
                         style, area.rect.width);
    }
}

ListView::ListView()
    : ScrollableView(defaultTheme().listHighlightSymbol, "item") {}

ListView::ListView(std::vector<ListItem> items)
    : ListView() {
    _items = std::move(items);
}

const ListItem* ListView::selectedItem() const {
    if (_items.empty()) {
        return nullptr;
    }
    int index = std::clamp(selected(), 0, static_cast<int>(_items.size()) - 1);
    return &_items[index];
}

void ListView::render(const Rect& area, const RenderItemFn& renderItem, Surface* surface) {
    const int total = itemCount();
    auto frame = layout(area, surface, total, [this](int index, int width) {
        const auto& item = _items[index];
        return _measure ? _measure(item, width) : measureLines(item.text, width);
    });

    for (const auto& slice : frame.viewport.slices) {
        ItemArea ia = itemArea(frame, slice);
        if (surface) {
            if (_itemStyle && ia.rect.width > 0) {
                Style style = _itemStyle(slice.index, total);
                if (!style.isEmpty()) {
                    surface->fillStyle(ia.rect, style);
                }
            }
            drawSelection(*surface, frame, ia);
        }
        if (renderItem) {
            renderItem(_items[slice.index], ia);
        }
    }

    if (surface) {
        drawScrollbar(*surface, frame);
    }
}

void ListView::render(const Rect& area, Surface& surface) {
    render(area, [&surface](const ListItem& item, const ItemArea& ia) {
        drawItemLines(surface, item.text, ia);
    }, &surface);
}

int ListView::preferredHeight() const {
    int rows = 0;
    for (const auto& item : _items) {
        rows += measureLines(item.text);
    }
    return rows + (border() != BorderType::None ? 2 : 0);
}

int ListView::preferredWidth() const {
    int widest = 0;
    for (const auto& item : _items) {
        size_t start = 0;
        while (true) {
            size_t nl = item.text.find('\n', start);
            std::string_view line(item.text);
            line = line.substr(start, nl == std::string::npos ? std::string_view::npos : nl - start);
            widest = std::max(widest, utf8::width(line));
            if (nl == std::string::npos) break;
            start = nl + 1;
        }
    }
    int width = widest + utf8::width(highlightSymbol());
    if (border() != BorderType::None) {
        width = std::max(width, utf8::width(title()));
        width += 2;
    }
    return width;
}

} // namespace yview
