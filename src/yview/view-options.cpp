#include <yview/view-options.h>
#include <yview/key-bindings.h>
#include <yview/list-view.h>
#include <yview/tree-view.h>
#include <ytrace/ytrace.hpp>

namespace yview {

Result<ViewOptions> ViewOptions::fromConfig(const Config& config) {
    ViewOptions opts;

    if (auto name = config.get<std::string>(Config::KEY_SCROLL_POLICY)) {
        auto policy = parseScrollPolicy(*name);
        if (!policy) {
            return Err<ViewOptions>(std::string("invalid ") + Config::KEY_SCROLL_POLICY, policy);
        }
        opts.scrollPolicy = *policy;
    }

    opts.highlightSymbol = config.get<std::string>(Config::KEY_HIGHLIGHT_SYMBOL);

    if (auto text = config.get<std::string>(Config::KEY_HIGHLIGHT_STYLE)) {
        auto style = parseStyle(*text);
        if (!style) {
            return Err<ViewOptions>(std::string("invalid ") + Config::KEY_HIGHLIGHT_STYLE, style);
        }
        opts.highlightStyle = *style;
    }

    if (auto name = config.get<std::string>(Config::KEY_SCROLLBAR_POLICY)) {
        auto policy = parseScrollbarPolicy(*name);
        if (!policy) {
            return Err<ViewOptions>(std::string("invalid ") + Config::KEY_SCROLLBAR_POLICY, policy);
        }
        opts.scrollbarPolicy = *policy;
    }

    for (auto [key, target] : {std::pair{Config::KEY_SCROLLBAR_THUMB_COLOR, &opts.thumbColor},
                               std::pair{Config::KEY_SCROLLBAR_TRACK_COLOR, &opts.trackColor}}) {
        if (auto text = config.get<std::string>(key)) {
            auto color = parseColor(*text);
            if (!color) {
                return Err<ViewOptions>(std::string("invalid ") + key, color);
            }
            *target = *color;
        }
    }

    opts.title = config.get<std::string>(Config::KEY_TITLE, "");

    if (auto name = config.get<std::string>(Config::KEY_BORDER)) {
        auto border = parseBorderType(*name);
        if (!border) {
            return Err<ViewOptions>(std::string("invalid ") + Config::KEY_BORDER, border);
        }
        opts.border = *border;
    }

    if (auto name = config.get<std::string>(Config::KEY_LIST_DIRECTION)) {
        auto direction = parseListDirection(*name);
        if (!direction) {
            return Err<ViewOptions>(std::string("invalid ") + Config::KEY_LIST_DIRECTION, direction);
        }
        opts.direction = *direction;
    }

    if (auto name = config.get<std::string>(Config::KEY_GUIDE_STYLE)) {
        auto guides = parseGuideStyle(*name);
        if (!guides) {
            return Err<ViewOptions>(std::string("invalid ") + Config::KEY_GUIDE_STYLE, guides);
        }
        opts.guideStyle = *guides;
    }

    opts.indentWidth = config.get<int>(Config::KEY_INDENT_WIDTH, 0);
    opts.leafIndicator = config.get<std::string>(Config::KEY_LEAF_INDICATOR, "");

    opts.bindings = config.get<std::string>(Config::KEY_BINDINGS, "standard");
    if (auto res = KeyBindings::preset(opts.bindings); !res) {
        return Err<ViewOptions>(std::string("invalid ") + Config::KEY_BINDINGS, res);
    }

    opts.mouseScrollStep = config.get<int>(Config::KEY_MOUSE_SCROLL_STEP, 3);
    if (opts.mouseScrollStep < 1) {
        return Err<ViewOptions>(std::string(Config::KEY_MOUSE_SCROLL_STEP) + " must be >= 1",
                                ErrorCode::Configuration);
    }

    ydebug("ViewOptions: policy={} scrollbar={} bindings={}",
           toString(opts.scrollPolicy), toString(opts.scrollbarPolicy), opts.bindings);
    return opts;
}

Result<void> ViewOptions::applyTo(ScrollableView& view) const {
    if (auto res = view.setScrollPolicy(scrollPolicy); !res) {
        return res;
    }
    if (highlightSymbol) {
        view.setHighlightSymbol(*highlightSymbol);
    }
    if (highlightStyle) {
        view.setHighlightStyle(*highlightStyle);
    }
    view.setScrollbarPolicy(scrollbarPolicy);
    if (thumbColor) {
        view.setScrollbarThumbStyle(Style::foreground(*thumbColor));
    }
    if (trackColor) {
        view.setScrollbarTrackStyle(Style::foreground(*trackColor));
    }
    view.setTitle(title);
    view.setBorder(border);

    auto keys = KeyBindings::preset(bindings);
    if (!keys) {
        return Err<void>("cannot apply view options", keys);
    }
    view.setKeyBindings(std::move(*keys));
    view.setMouseScrollStep(mouseScrollStep);
    return Ok();
}

Result<void> ViewOptions::applyTo(ListView& view) const {
    if (auto res = applyTo(static_cast<ScrollableView&>(view)); !res) {
        return res;
    }
    view.setDirection(direction);
    return Ok();
}

Result<void> ViewOptions::applyTo(TreeView& view) const {
    if (auto res = applyTo(static_cast<ScrollableView&>(view)); !res) {
        return res;
    }
    view.setGuideStyle(guideStyle);
    view.setIndentWidth(indentWidth);
    view.setLeafIndicator(leafIndicator);
    return Ok();
}

} // namespace yview
