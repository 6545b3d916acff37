#pragma once

#include <yview/style.h>
#include <string>

namespace yview {

//=============================================================================
// Theme - built-in defaults used when neither an explicit style nor the
// resolver provides one
//=============================================================================
struct Theme {
    Style highlight       = Style::reversed();
    Style scrollbarThumb  = {};
    Style scrollbarTrack  = {};
    Style border          = {};
    Style guide           = {};

    std::string listHighlightSymbol = ">> ";
    std::string treeHighlightSymbol = "> ";
    std::string expandedIndicator   = "▼ ";
    std::string collapsedIndicator  = "▶ ";

    std::string scrollbarThumbSymbol = "█";
    std::string scrollbarTrackSymbol = "│";

    int mouseScrollStep = 3;
};

inline const Theme& defaultTheme() {
    static Theme t;
    return t;
}

} // namespace yview
