#include <yview/document.h>
#include <yaml-cpp/yaml.h>
#include <ytrace/ytrace.hpp>

#include <fstream>
#include <sstream>

namespace yview {

namespace {

// Scalars keep their text; anything else is kept as the YAML node
Value toValue(const YAML::Node& node) {
    if (node.IsScalar()) {
        return Value(node.as<std::string>());
    }
    return Value(YAML::Clone(node));
}

Result<TreeNode::Ptr> parseTreeNode(const YAML::Node& node, const std::string& where) {
    if (node.IsScalar()) {
        auto leaf = TreeNode::create(node.as<std::string>());
        leaf->setLeaf(true);
        return leaf;
    }
    if (!node.IsMap() || !node["label"]) {
        return Err<TreeNode::Ptr>(where + ": node needs a 'label'", ErrorCode::Parse);
    }

    auto tree = TreeNode::create(node["label"].as<std::string>());
    if (node["expanded"]) {
        tree->setExpanded(node["expanded"].as<bool>());
    }
    if (node["leaf"]) {
        tree->setLeaf(node["leaf"].as<bool>());
    }
    if (node["data"]) {
        tree->setData(toValue(node["data"]));
    }
    if (const YAML::Node children = node["children"]) {
        if (!children.IsSequence()) {
            return Err<TreeNode::Ptr>(where + ": 'children' must be a sequence", ErrorCode::Parse);
        }
        for (size_t i = 0; i < children.size(); ++i) {
            auto child = parseTreeNode(children[i], where + "/" + std::to_string(i));
            if (!child) {
                return child;
            }
            tree->add(*child);
        }
    }
    return tree;
}

} // namespace

Result<std::vector<ListItem>> parseListDocument(const std::string& yaml) {
    try {
        YAML::Node root = YAML::Load(yaml);
        const YAML::Node items = root.IsMap() ? root["items"] : root;
        if (!items || !items.IsSequence()) {
            return Err<std::vector<ListItem>>("list document needs an 'items' sequence",
                                              ErrorCode::Parse);
        }

        std::vector<ListItem> result;
        result.reserve(items.size());
        for (size_t i = 0; i < items.size(); ++i) {
            const YAML::Node item = items[i];
            if (item.IsScalar()) {
                result.emplace_back(item.as<std::string>());
            } else if (item.IsMap() && item["text"]) {
                ListItem li(item["text"].as<std::string>());
                if (item["data"]) {
                    li.data = toValue(item["data"]);
                }
                result.push_back(std::move(li));
            } else {
                return Err<std::vector<ListItem>>(
                    "items/" + std::to_string(i) + ": expected text or {text, data}",
                    ErrorCode::Parse);
            }
        }
        ydebug("parseListDocument: {} items", result.size());
        return result;
    } catch (const YAML::Exception& e) {
        return Err<std::vector<ListItem>>("YAML parse error: " + std::string(e.what()),
                                          ErrorCode::Parse);
    }
}

Result<std::vector<TreeNode::Ptr>> parseTreeDocument(const std::string& yaml) {
    try {
        YAML::Node root = YAML::Load(yaml);
        const YAML::Node tree = root.IsMap() ? root["tree"] : root;
        if (!tree || !tree.IsSequence()) {
            return Err<std::vector<TreeNode::Ptr>>("tree document needs a 'tree' sequence",
                                                   ErrorCode::Parse);
        }

        std::vector<TreeNode::Ptr> roots;
        for (size_t i = 0; i < tree.size(); ++i) {
            auto node = parseTreeNode(tree[i], "tree/" + std::to_string(i));
            if (!node) {
                return Err<std::vector<TreeNode::Ptr>>("invalid tree document", node);
            }
            roots.push_back(*node);
        }
        ydebug("parseTreeDocument: {} roots", roots.size());
        return roots;
    } catch (const YAML::Exception& e) {
        return Err<std::vector<TreeNode::Ptr>>("YAML parse error: " + std::string(e.what()),
                                               ErrorCode::Parse);
    }
}

Result<std::string> loadDocumentFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<std::string>("Cannot open document: " + path, ErrorCode::Io);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace yview
