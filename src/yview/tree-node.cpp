#include <yview/tree-node.h>

namespace yview {

TreeNode::Ptr TreeNode::create(std::string label) {
    auto node = std::make_shared<TreeNode>();
    node->_label = std::move(label);
    return node;
}

TreeNode::Ptr TreeNode::create(std::string label, std::vector<Ptr> children) {
    auto node = create(std::move(label));
    for (auto& child : children) {
        node->add(std::move(child));
    }
    return node;
}

TreeNode& TreeNode::add(Ptr child) {
    if (child) {
        _children.push_back(std::move(child));
    }
    return *this;
}

} // namespace yview
