#pragma once

#include <yview/config.h>
#include <yview/flattened-view.h>
#include <yview/result.hpp>
#include <yview/scroll-policy.h>
#include <yview/scrollable-view.h>
#include <yview/scrollbar.h>
#include <yview/style.h>
#include <yview/surface.h>
#include <cstdint>
#include <optional>
#include <string>

namespace yview {

class ListView;
class TreeView;

//=============================================================================
// ViewOptions - view settings read from Config
//=============================================================================
struct ViewOptions {
    ScrollPolicy scrollPolicy = ScrollPolicy::None;
    std::optional<std::string> highlightSymbol;
    std::optional<Style> highlightStyle;
    ScrollbarPolicy scrollbarPolicy = ScrollbarPolicy::AsNeeded;
    std::optional<uint32_t> thumbColor;
    std::optional<uint32_t> trackColor;
    std::string title;
    BorderType border = BorderType::None;

    ListDirection direction = ListDirection::TopToBottom;

    GuideStyle guideStyle = GuideStyle::Unicode;
    int indentWidth = 0;
    std::string leafIndicator;

    std::string bindings = "standard";
    int mouseScrollStep = 3;

    static Result<ViewOptions> fromConfig(const Config& config);

    Result<void> applyTo(ScrollableView& view) const;
    // Common settings plus the list direction
    Result<void> applyTo(ListView& view) const;
    // Common settings plus guides and indicators
    Result<void> applyTo(TreeView& view) const;
};

} // namespace yview
