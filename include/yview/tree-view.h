#pragma once

#include <yview/flattened-view.h>
#include <yview/scrollable-view.h>
#include <yview/tree-model.h>
#include <yview/tree-node.h>
#include <functional>
#include <string>
#include <vector>

namespace yview {

using NodeMeasureFn = std::function<int(NodeRef node, int availableWidth)>;
using RenderNodeFn = std::function<void(NodeRef node, const ItemArea& area)>;

//=============================================================================
// TreeView - virtualized tree over the expanded part of a forest
//
// The selection is an index into the flattened view, which is rebuilt from
// the model on every render and every navigation step. Structural changes
// between renders keep the numeric index (clamped), not the node.
//
// Without an explicit model the view shows its own TreeNode roots; with
// one, NodeRefs handed to callbacks are whatever that model uses.
//=============================================================================
class TreeView : public ScrollableView {
public:
    TreeView();
    explicit TreeView(std::vector<TreeNode::Ptr> roots);
    explicit TreeView(TreeModel::Ptr model);

    // Switch back to the TreeNode roots
    void setRoots(std::vector<TreeNode::Ptr> roots);
    void addRoot(TreeNode::Ptr root);
    const std::vector<TreeNode::Ptr>& roots() const { return _nodes->rootNodes(); }

    // nullptr switches back to the TreeNode roots
    void setModel(TreeModel::Ptr model);
    const TreeModel& model() const { return *_model; }
    TreeModel& model() { return *_model; }

    // Defaults to the wrapped label height
    void setMeasure(NodeMeasureFn measure) { _measure = std::move(measure); }

    void setGuideStyle(GuideStyle style) { _guideStyle = style; }
    GuideStyle guideStyle() const { return _guideStyle; }
    // <= 0 uses the natural guide width
    void setIndentWidth(int width) { _indentWidth = width; }
    int indentWidth() const { return _indentWidth; }
    void setGuideLineStyle(Style style) { _guideLineStyle = style; }

    void setLeafIndicator(std::string indicator) { _leafIndicator = std::move(indicator); }
    void setExpandIndicators(std::string expanded, std::string collapsed);

    // Right: expand a collapsed node, or step into an expanded one
    void expand();
    // Left: collapse an expanded node, or select the parent
    void collapse();
    // Enter/Space: flip the expanded state of a non-leaf
    void toggle();

    // Node at the selected index, clamped into the current flattened size;
    // nullptr when the tree is empty
    NodeRef selectedNode() const;
    template<typename T>
    T* selectedAs() const { return static_cast<T*>(selectedNode()); }

    FlattenedView flatten() const { return FlattenedView::build(*_model); }
    // Flattened view used by the last render
    const FlattenedView& lastFlattened() const { return _flat; }

    void render(const Rect& area, const RenderNodeFn& renderNode, Surface* surface = nullptr);
    // Renders node labels
    void render(const Rect& area, Surface& surface);

    int preferredHeight() const;
    int preferredWidth() const;

protected:
    int itemCount() const override { return static_cast<int>(flatten().size()); }
    bool handleAction(NavAction action) override;

private:
    const std::string& indicatorFor(NodeRef node) const;

    TreeNodeModel::Ptr _nodes;
    TreeModel::Ptr _model;
    NodeMeasureFn _measure;
    FlattenedView _flat;

    GuideStyle _guideStyle = GuideStyle::Unicode;
    int _indentWidth = 0;
    std::optional<Style> _guideLineStyle;
    std::string _leafIndicator;
    std::string _expandedIndicator;
    std::string _collapsedIndicator;
};

} // namespace yview
