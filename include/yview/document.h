#pragma once

#include <yview/list-view.h>
#include <yview/result.hpp>
#include <yview/tree-node.h>
#include <string>
#include <vector>

namespace yview {

// items:
//   - plain text
//   - text: "multi\nline"
//     data: anything
Result<std::vector<ListItem>> parseListDocument(const std::string& yaml);

// tree:
//   - label: root
//     expanded: true
//     leaf: false
//     data: anything
//     children: [...]
Result<std::vector<TreeNode::Ptr>> parseTreeDocument(const std::string& yaml);

Result<std::string> loadDocumentFile(const std::string& path);

} // namespace yview
