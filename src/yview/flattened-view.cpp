#include <yview/flattened-view.h>
#include <yview/utf8.h>

namespace yview {

FlattenedView FlattenedView::build(const TreeModel& model) {
    FlattenedView view;
    std::vector<bool> ancestorsLast;
    auto roots = model.roots();
    for (size_t i = 0; i < roots.size(); ++i) {
        view.visit(model, roots[i], nullptr, 0, i + 1 == roots.size(), ancestorsLast);
    }
    return view;
}

FlattenedView FlattenedView::build(const std::vector<TreeNode::Ptr>& roots) {
    return build(TreeNodeModel(roots));
}

void FlattenedView::visit(const TreeModel& model, NodeRef node, NodeRef parent, int depth,
                          bool isLast, std::vector<bool>& ancestorsLast) {
    if (!node) return;

    _entries.push_back({node, parent, depth, isLast, ancestorsLast});

    if (model.isLeaf(node) || !model.isExpanded(node)) {
        return;
    }
    auto children = model.children(node);
    ancestorsLast.push_back(isLast);
    for (size_t i = 0; i < children.size(); ++i) {
        visit(model, children[i], node, depth + 1, i + 1 == children.size(), ancestorsLast);
    }
    ancestorsLast.pop_back();
}

std::optional<size_t> FlattenedView::indexOf(const void* node) const {
    for (size_t i = 0; i < _entries.size(); ++i) {
        if (_entries[i].node == node) return i;
    }
    return std::nullopt;
}

std::optional<size_t> FlattenedView::parentIndex(size_t index) const {
    if (index >= _entries.size() || !_entries[index].parent) {
        return std::nullopt;
    }
    NodeRef parent = _entries[index].parent;
    for (size_t i = index; i-- > 0;) {
        if (_entries[i].node == parent) return i;
    }
    return std::nullopt;
}

//=============================================================================
// Guides
//=============================================================================

const GuideSymbols& guideSymbols(GuideStyle style) {
    static const GuideSymbols unicode{"├── ", "└── ", "│   ", "    "};
    static const GuideSymbols ascii{"+-- ", "+-- ", "|   ", "    "};
    static const GuideSymbols none{"", "", "", ""};
    switch (style) {
        case GuideStyle::Unicode: return unicode;
        case GuideStyle::Ascii: return ascii;
        case GuideStyle::None: return none;
    }
    return none;
}

const char* toString(GuideStyle style) {
    switch (style) {
        case GuideStyle::Unicode: return "unicode";
        case GuideStyle::Ascii: return "ascii";
        case GuideStyle::None: return "none";
    }
    return "none";
}

Result<GuideStyle> parseGuideStyle(const std::string& name) {
    if (name == "unicode") return GuideStyle::Unicode;
    if (name == "ascii") return GuideStyle::Ascii;
    if (name == "none") return GuideStyle::None;
    return Err<GuideStyle>("unknown guide style: " + name, ErrorCode::Configuration);
}

namespace {

std::string fitSegment(const std::string& segment, int indentWidth) {
    if (indentWidth <= 0) return segment;
    int w = utf8::width(segment);
    if (w >= indentWidth) return utf8::truncate(segment, indentWidth);
    return segment + std::string(indentWidth - w, ' ');
}

} // namespace

std::string buildGuidePrefix(const FlatEntry& entry, GuideStyle style, int indentWidth) {
    if (entry.depth == 0 || style == GuideStyle::None) {
        return {};
    }
    const auto& sym = guideSymbols(style);
    std::string prefix;

    // ancestorsLast[0] is the root, whose column is never drawn
    for (size_t i = 1; i < entry.ancestorsLast.size(); ++i) {
        prefix += fitSegment(entry.ancestorsLast[i] ? sym.space : sym.vertical, indentWidth);
    }
    prefix += fitSegment(entry.isLast ? sym.lastBranch : sym.branch, indentWidth);
    return prefix;
}

} // namespace yview
