#pragma once

#include <yview/scrollable-view.h>
#include <functional>
#include <string>
#include <vector>

namespace yview {

struct ListItem {
    std::string text;
    Value data;

    ListItem() = default;
    ListItem(const char* t) : text(t) {}
    ListItem(std::string t) : text(std::move(t)) {}
    ListItem(std::string t, Value d) : text(std::move(t)), data(std::move(d)) {}
};

// Rows an item needs at the given width
using MeasureFn = std::function<int(const ListItem& item, int availableWidth)>;
using RenderItemFn = std::function<void(const ListItem& item, const ItemArea& area)>;
// Style for the item at a position, e.g. alternating rows
using ItemStyleFn = std::function<Style(int index, int total)>;

// Lines of text at a width: '\n' breaks, then word wrap when width > 0
std::vector<std::string> layoutLines(const std::string& text, int width);
// Number of layoutLines, at least 1
int measureLines(const std::string& text, int width = 0);
// Draws the item's wrapped lines that fall into the area
void drawItemLines(Surface& surface, const std::string& text, const ItemArea& area,
                   const Style& style = {});

//=============================================================================
// ListView - virtualized list of variable-height items
//=============================================================================
class ListView : public ScrollableView {
public:
    ListView();
    explicit ListView(std::vector<ListItem> items);

    void setItems(std::vector<ListItem> items) { _items = std::move(items); }
    void addItem(ListItem item) { _items.push_back(std::move(item)); }
    void clear() { _items.clear(); }
    const std::vector<ListItem>& items() const { return _items; }
    size_t size() const { return _items.size(); }

    // Defaults to measureLines over the item text at the content width
    void setMeasure(MeasureFn measure) { _measure = std::move(measure); }
    // Applied to the content columns of each visible item before the highlight
    void setItemStyle(ItemStyleFn style) { _itemStyle = std::move(style); }

    using ScrollableView::setDirection;
    using ScrollableView::direction;

    const ListItem* selectedItem() const;

    void render(const Rect& area, const RenderItemFn& renderItem, Surface* surface = nullptr);
    // Renders item text with drawItemLines
    void render(const Rect& area, Surface& surface);

    int preferredHeight() const;
    int preferredWidth() const;

protected:
    int itemCount() const override { return static_cast<int>(_items.size()); }

private:
    std::vector<ListItem> _items;
    MeasureFn _measure;
    ItemStyleFn _itemStyle;
};

} // namespace yview
