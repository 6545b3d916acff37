#pragma once

#include <yview/types.h>
#include <memory>
#include <string>
#include <vector>

namespace yview {

//=============================================================================
// TreeNode - application-owned tree data
//
// Nodes hold their children but no parent reference; parent links are
// resolved per render from the flattened view.
//=============================================================================
class TreeNode {
public:
    using Ptr = std::shared_ptr<TreeNode>;

    static Ptr create(std::string label);
    static Ptr create(std::string label, std::vector<Ptr> children);

    const std::string& label() const { return _label; }
    void setLabel(std::string label) { _label = std::move(label); }

    const Value& data() const { return _data; }
    void setData(Value data) { _data = std::move(data); }

    const std::vector<Ptr>& children() const { return _children; }
    TreeNode& add(Ptr child);
    void clearChildren() { _children.clear(); }

    // A node is a leaf when marked so or when it has no children
    bool isLeaf() const { return _leaf || _children.empty(); }
    void setLeaf(bool leaf) { _leaf = leaf; }

    bool isExpanded() const { return _expanded; }
    void setExpanded(bool expanded) { _expanded = expanded; }

private:
    std::string _label;
    Value _data;
    std::vector<Ptr> _children;
    bool _leaf = false;
    bool _expanded = false;
};

} // namespace yview
