#include <yview/tree-model.h>

namespace yview {

void TreeNodeModel::addRoot(TreeNode::Ptr root) {
    if (root) {
        _roots.push_back(std::move(root));
    }
}

std::vector<NodeRef> TreeNodeModel::roots() const {
    std::vector<NodeRef> out;
    out.reserve(_roots.size());
    for (const auto& root : _roots) {
        if (root) out.push_back(root.get());
    }
    return out;
}

std::vector<NodeRef> TreeNodeModel::children(NodeRef ref) const {
    const auto& kids = node(ref)->children();
    std::vector<NodeRef> out;
    out.reserve(kids.size());
    for (const auto& child : kids) {
        out.push_back(child.get());
    }
    return out;
}

bool TreeNodeModel::isLeaf(NodeRef ref) const {
    return node(ref)->isLeaf();
}

bool TreeNodeModel::isExpanded(NodeRef ref) const {
    return node(ref)->isExpanded();
}

void TreeNodeModel::setExpanded(NodeRef ref, bool expanded) {
    node(ref)->setExpanded(expanded);
}

std::string TreeNodeModel::label(NodeRef ref) const {
    return node(ref)->label();
}

} // namespace yview
