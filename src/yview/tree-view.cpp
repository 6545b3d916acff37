#include <yview/list-view.h>
#include <yview/theme.h>
#include <yview/tree-view.h>
#include <yview/utf8.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>

namespace yview {

TreeView::TreeView()
    : ScrollableView(defaultTheme().treeHighlightSymbol, "node"),
      _nodes(std::make_shared<TreeNodeModel>()),
      _model(_nodes),
      _expandedIndicator(defaultTheme().expandedIndicator),
      _collapsedIndicator(defaultTheme().collapsedIndicator) {}

TreeView::TreeView(std::vector<TreeNode::Ptr> roots)
    : TreeView() {
    _nodes->setRoots(std::move(roots));
}

TreeView::TreeView(TreeModel::Ptr model)
    : TreeView() {
    setModel(std::move(model));
}

void TreeView::setRoots(std::vector<TreeNode::Ptr> roots) {
    _nodes->setRoots(std::move(roots));
    _model = _nodes;
}

void TreeView::addRoot(TreeNode::Ptr root) {
    _nodes->addRoot(std::move(root));
    _model = _nodes;
}

void TreeView::setModel(TreeModel::Ptr model) {
    _model = model ? std::move(model) : _nodes;
}

void TreeView::setExpandIndicators(std::string expanded, std::string collapsed) {
    _expandedIndicator = std::move(expanded);
    _collapsedIndicator = std::move(collapsed);
}

const std::string& TreeView::indicatorFor(NodeRef node) const {
    if (_model->isLeaf(node)) {
        return _leafIndicator;
    }
    return _model->isExpanded(node) ? _expandedIndicator : _collapsedIndicator;
}

//-----------------------------------------------------------------------------
// Navigation
//-----------------------------------------------------------------------------

void TreeView::expand() {
    auto flat = flatten();
    int n = static_cast<int>(flat.size());
    if (n == 0) return;

    _selection.clampTo(n);
    int index = _selection.selected();
    NodeRef node = flat[index].node;
    if (_model->isLeaf(node)) {
        return;
    }
    if (_model->isExpanded(node)) {
        // First child directly follows its expanded parent
        if (index + 1 < n) {
            _selection.select(index + 1, n);
        }
    } else {
        ydebug("TreeView: expand '{}'", _model->label(node));
        _model->setExpanded(node, true);
    }
}

void TreeView::collapse() {
    auto flat = flatten();
    int n = static_cast<int>(flat.size());
    if (n == 0) return;

    _selection.clampTo(n);
    int index = _selection.selected();
    NodeRef node = flat[index].node;
    if (!_model->isLeaf(node) && _model->isExpanded(node)) {
        ydebug("TreeView: collapse '{}'", _model->label(node));
        _model->setExpanded(node, false);
        return;
    }
    if (auto parent = flat.parentIndex(index)) {
        _selection.select(static_cast<int>(*parent), n);
    }
}

void TreeView::toggle() {
    if (NodeRef node = selectedNode(); node && !_model->isLeaf(node)) {
        _model->setExpanded(node, !_model->isExpanded(node));
    }
}

NodeRef TreeView::selectedNode() const {
    auto flat = flatten();
    if (flat.empty()) {
        return nullptr;
    }
    int index = std::clamp(_selection.selected(), 0, static_cast<int>(flat.size()) - 1);
    return flat[index].node;
}

bool TreeView::handleAction(NavAction action) {
    switch (action) {
        case NavAction::MoveRight:
            expand();
            return true;
        case NavAction::MoveLeft:
            collapse();
            return true;
        case NavAction::Select:
            toggle();
            return true;
        default:
            return ScrollableView::handleAction(action);
    }
}

//-----------------------------------------------------------------------------
// Render
//-----------------------------------------------------------------------------

void TreeView::render(const Rect& area, const RenderNodeFn& renderNode, Surface* surface) {
    _flat = FlattenedView::build(*_model);
    const int n = static_cast<int>(_flat.size());

    std::vector<std::string> prefixes(n);
    std::vector<int> decoWidths(n);
    for (int i = 0; i < n; ++i) {
        prefixes[i] = buildGuidePrefix(_flat[i], _guideStyle, _indentWidth);
        decoWidths[i] = utf8::width(prefixes[i]) + utf8::width(indicatorFor(_flat[i].node));
    }

    auto frame = layout(area, surface, n, [&](int index, int width) {
        NodeRef node = _flat[index].node;
        int available = std::max(1, width - decoWidths[index]);
        return _measure ? _measure(node, available) : measureLines(_model->label(node), available);
    });

    Style guideLine = resolved(_guideLineStyle, "guide", defaultTheme().guide);

    for (const auto& slice : frame.viewport.slices) {
        const FlatEntry& entry = _flat[slice.index];
        ItemArea ia = itemArea(frame, slice);

        if (surface) {
            drawSelection(*surface, frame, ia);
            // Connectors go on the entry's first row only
            if (ia.clippedRows == 0 && ia.rect.width > 0) {
                const auto& prefix = prefixes[slice.index];
                int room = ia.rect.width - utf8::width(prefix);
                surface->drawText(ia.rect.x, ia.rect.y, prefix, guideLine, ia.rect.width);
                if (room > 0) {
                    surface->drawText(ia.rect.x + ia.rect.width - room, ia.rect.y,
                                      indicatorFor(entry.node), {}, room);
                }
            }
        }

        ia.rect.x += decoWidths[slice.index];
        ia.rect.width -= decoWidths[slice.index];
        if (ia.rect.width <= 0 || !renderNode) {
            continue;
        }
        renderNode(entry.node, ia);
    }

    if (surface) {
        drawScrollbar(*surface, frame);
    }
}

void TreeView::render(const Rect& area, Surface& surface) {
    render(area, [this, &surface](NodeRef node, const ItemArea& ia) {
        drawItemLines(surface, _model->label(node), ia);
    }, &surface);
}

int TreeView::preferredHeight() const {
    auto flat = flatten();
    int rows = 0;
    for (const auto& entry : flat.entries()) {
        rows += measureLines(_model->label(entry.node));
    }
    return rows + (border() != BorderType::None ? 2 : 0);
}

int TreeView::preferredWidth() const {
    auto flat = flatten();
    int widest = 0;
    for (const auto& entry : flat.entries()) {
        int w = utf8::width(buildGuidePrefix(entry, _guideStyle, _indentWidth)) +
                utf8::width(indicatorFor(entry.node)) +
                utf8::width(_model->label(entry.node));
        widest = std::max(widest, w);
    }
    int width = widest + utf8::width(highlightSymbol());
    if (border() != BorderType::None) {
        width = std::max(width, utf8::width(title()));
        width += 2;
    }
    return width;
}

} // namespace yview
