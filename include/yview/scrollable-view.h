#pragma once

#include <yview/key-bindings.h>
#include <yview/navigation.h>
#include <yview/result.hpp>
#include <yview/scroll-policy.h>
#include <yview/scroll-state.h>
#include <yview/scrollbar.h>
#include <yview/selection-state.h>
#include <yview/style.h>
#include <yview/surface.h>
#include <yview/types.h>
#include <yview/viewport.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace yview {

// Where item 0 sits; BottomToTop stacks items upwards from the bottom edge
enum class ListDirection {
    TopToBottom,
    BottomToTop,
};

const char* toString(ListDirection direction);
Result<ListDirection> parseListDirection(const std::string& name);

// Target of one visible item, handed to the render callback
struct ItemArea {
    Rect rect;            // visible rows of the item
    int index = 0;
    int clippedRows = 0;  // leading rows scrolled off the top
    bool selected = false;
};

//=============================================================================
// ScrollableView - state and render pipeline shared by list and tree views
//
// Owns the per-instance scroll/selection state and the scroll policy.
// A render pass measures every item at the current width, resolves the
// offset through the policy, computes the visible slice and hands each
// visible item to the caller. Decoration (border, highlight symbol and
// style, scrollbar) is drawn when a Surface is given.
//=============================================================================
class ScrollableView {
public:
    virtual ~ScrollableView() = default;

    //-------------------------------------------------------------------------
    // Configuration
    //-------------------------------------------------------------------------
    Result<void> setScrollPolicy(ScrollPolicy policy);
    ScrollPolicy scrollPolicy() const { return _policy.current(); }

    void setHighlightSymbol(std::string symbol) { _highlightSymbol = std::move(symbol); }
    const std::string& highlightSymbol() const { return _highlightSymbol; }
    void setRepeatHighlightSymbol(bool repeat) { _repeatHighlightSymbol = repeat; }
    void setHighlightStyle(Style style) { _highlightStyle = style; }

    void setScrollbarPolicy(ScrollbarPolicy policy) { _scrollbarPolicy = policy; }
    ScrollbarPolicy scrollbarPolicy() const { return _scrollbarPolicy; }
    void setScrollbarThumbStyle(Style style) { _thumbStyle = style; }
    void setScrollbarTrackStyle(Style style) { _trackStyle = style; }
    void setScrollbarSymbols(std::string thumb, std::string track);

    void setTitle(std::string title) { _title = std::move(title); }
    const std::string& title() const { return _title; }
    void setBorder(BorderType border) { _border = border; }
    BorderType border() const { return _border; }
    void setBorderStyle(Style style) { _borderStyle = style; }

    void setStyleResolver(std::shared_ptr<const StyleResolver> resolver) { _styleResolver = std::move(resolver); }

    void setKeyBindings(KeyBindings bindings) { _bindings = std::move(bindings); }
    const KeyBindings& keyBindings() const { return _bindings; }
    KeyBindings& keyBindings() { return _bindings; }
    void setMouseScrollStep(int step) { _mouseScrollStep = std::max(1, step); }
    int mouseScrollStep() const { return _mouseScrollStep; }

    //-------------------------------------------------------------------------
    // State
    //-------------------------------------------------------------------------
    const ScrollState& scrollState() const { return _scroll; }
    ScrollState& scrollState() { return _scroll; }
    int selected() const { return _selection.selected(); }
    void select(int index);

    //-------------------------------------------------------------------------
    // Selection moves (policy independent)
    //-------------------------------------------------------------------------
    void selectPrevious();
    void selectNext();
    void selectFirst();
    void selectLast();
    void pageUp();
    void pageDown();

    // Manual scrolling; under StickyScroll this detaches from / re-attaches
    // to the bottom
    void scrollBy(int delta);
    void scrollToTop();
    void scrollToEnd();

    //-------------------------------------------------------------------------
    // Input
    //-------------------------------------------------------------------------
    bool navigate(NavAction action) { return handleAction(action); }
    bool handleKey(const KeyEvent& key);
    bool handleMouse(const MouseEvent& mouse);

    //-------------------------------------------------------------------------
    // Results of the last render
    //-------------------------------------------------------------------------
    const Viewport& lastViewport() const { return _lastViewport; }
    const Rect& itemsArea() const { return _itemsArea; }
    bool scrollbarVisible() const { return _scrollbarVisible; }
    const ScrollbarMetrics& scrollbarMetrics() const { return _scrollbarMetrics; }

protected:
    ScrollableView(std::string highlightSymbol, std::string selectorPrefix);

    // Items navigated over (as of now)
    virtual int itemCount() const = 0;
    // MoveLeft / MoveRight / Select are unhandled here
    virtual bool handleAction(NavAction action);

    using RowMeasure = std::function<int(int index, int contentWidth)>;

    struct Frame {
        Rect inner;      // inside the border
        Rect content;    // inner minus highlight column and scrollbar
        Rect scrollbar;  // empty when hidden
        std::vector<int> heights;
        std::vector<int> tops;
        Viewport viewport;
        int symbolWidth = 0;
        bool showScrollbar = false;
    };

    // Measure, resolve scroll policy, compute the viewport.
    // Draws the border when surface is given.
    Frame layout(const Rect& area, Surface* surface, int count, const RowMeasure& measure);

    ItemArea itemArea(const Frame& frame, const ViewportSlice& slice) const;

    // Highlight style and symbol of the selected item
    void drawSelection(Surface& surface, const Frame& frame, const ItemArea& item) const;
    void drawScrollbar(Surface& surface, const Frame& frame) const;

    Style resolved(const std::optional<Style>& explicitStyle, const std::string& selector,
                   const Style& fallback) const;
    const std::string& selectorPrefix() const { return _selectorPrefix; }

    void setDirection(ListDirection direction) { _direction = direction; }
    ListDirection direction() const { return _direction; }

    NavigationController navigation() { return NavigationController(_scroll, _selection, _policy); }

    ScrollState _scroll;
    SelectionState _selection;

private:
    ScrollPolicySelector _policy;

    std::string _selectorPrefix;
    std::string _highlightSymbol;
    bool _repeatHighlightSymbol = false;
    std::optional<Style> _highlightStyle;

    ScrollbarPolicy _scrollbarPolicy = ScrollbarPolicy::AsNeeded;
    std::optional<Style> _thumbStyle;
    std::optional<Style> _trackStyle;
    std::string _thumbSymbol;
    std::string _trackSymbol;

    std::string _title;
    BorderType _border = BorderType::None;
    std::optional<Style> _borderStyle;

    ListDirection _direction = ListDirection::TopToBottom;

    std::shared_ptr<const StyleResolver> _styleResolver;
    KeyBindings _bindings = KeyBindings::standard();
    int _mouseScrollStep;

    Viewport _lastViewport;
    Rect _itemsArea;
    bool _scrollbarVisible = false;
    ScrollbarMetrics _scrollbarMetrics;
};

} // namespace yview
