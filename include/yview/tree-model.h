#pragma once

#include <yview/tree-node.h>
#include <functional>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace yview {

// Opaque node handle; what it points to is up to the model
using NodeRef = void*;

//=============================================================================
// TreeModel - structure and expansion state of a tree
//
// Views only see NodeRefs and ask the model for children, leaf status,
// expansion and labels.
//=============================================================================
class TreeModel {
public:
    using Ptr = std::shared_ptr<TreeModel>;

    virtual ~TreeModel() = default;

    virtual std::vector<NodeRef> roots() const = 0;
    virtual std::vector<NodeRef> children(NodeRef node) const = 0;
    // A node without children is a leaf unless overridden
    virtual bool isLeaf(NodeRef node) const { return children(node).empty(); }
    virtual bool isExpanded(NodeRef node) const = 0;
    virtual void setExpanded(NodeRef node, bool expanded) = 0;
    virtual std::string label(NodeRef node) const = 0;
};

//=============================================================================
// TreeNodeModel - model over a forest of TreeNode
//=============================================================================
class TreeNodeModel : public TreeModel {
public:
    using Ptr = std::shared_ptr<TreeNodeModel>;

    TreeNodeModel() = default;
    explicit TreeNodeModel(std::vector<TreeNode::Ptr> roots) : _roots(std::move(roots)) {}

    void setRoots(std::vector<TreeNode::Ptr> roots) { _roots = std::move(roots); }
    void addRoot(TreeNode::Ptr root);
    const std::vector<TreeNode::Ptr>& rootNodes() const { return _roots; }

    std::vector<NodeRef> roots() const override;
    std::vector<NodeRef> children(NodeRef node) const override;
    bool isLeaf(NodeRef node) const override;
    bool isExpanded(NodeRef node) const override;
    void setExpanded(NodeRef node, bool expanded) override;
    std::string label(NodeRef node) const override;

    static TreeNode* node(NodeRef ref) { return static_cast<TreeNode*>(ref); }

private:
    std::vector<TreeNode::Ptr> _roots;
};

//=============================================================================
// FunctionalTreeModel - tree over caller-owned T described by functions
//
// Children and labels come from callbacks. Without a leaf predicate a node
// without children is a leaf. Expansion is tracked by the model itself.
// The T objects must outlive the model.
//=============================================================================
template<typename T>
class FunctionalTreeModel : public TreeModel {
public:
    using ChildrenFn = std::function<std::vector<T*>(T& node)>;
    using LabelFn = std::function<std::string(const T& node)>;
    using LeafFn = std::function<bool(const T& node)>;

    FunctionalTreeModel(std::vector<T*> roots, ChildrenFn children, LabelFn label,
                        LeafFn isLeaf = {})
        : _roots(std::move(roots)), _children(std::move(children)),
          _label(std::move(label)), _isLeaf(std::move(isLeaf)) {}

    std::vector<NodeRef> roots() const override { return refs(_roots); }

    std::vector<NodeRef> children(NodeRef node) const override {
        if (!_children) return {};
        return refs(_children(*get(node)));
    }

    bool isLeaf(NodeRef node) const override {
        return _isLeaf ? _isLeaf(*get(node)) : TreeModel::isLeaf(node);
    }

    bool isExpanded(NodeRef node) const override { return _expanded.contains(node); }

    void setExpanded(NodeRef node, bool expanded) override {
        if (expanded) {
            _expanded.insert(node);
        } else {
            _expanded.erase(node);
        }
    }

    std::string label(NodeRef node) const override {
        return _label ? _label(*get(node)) : std::string();
    }

    static T* get(NodeRef ref) { return static_cast<T*>(ref); }

private:
    static std::vector<NodeRef> refs(const std::vector<T*>& nodes) {
        std::vector<NodeRef> out;
        out.reserve(nodes.size());
        for (T* n : nodes) {
            if (n) out.push_back(n);
        }
        return out;
    }

    std::vector<T*> _roots;
    ChildrenFn _children;
    LabelFn _label;
    LeafFn _isLeaf;
    std::unordered_set<NodeRef> _expanded;
};

} // namespace yview
