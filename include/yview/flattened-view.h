#pragma once

#include <yview/result.hpp>
#include <yview/tree-model.h>
#include <yview/tree-node.h>
#include <optional>
#include <string>
#include <vector>

namespace yview {

// One visible row-group of the tree
struct FlatEntry {
    NodeRef node = nullptr;
    NodeRef parent = nullptr;  // nullptr for roots
    int depth = 0;
    bool isLast = false;              // last among its siblings
    std::vector<bool> ancestorsLast;  // isLast of each ancestor, outermost first
};

//=============================================================================
// FlattenedView - pre-order listing of the expanded part of a forest
//=============================================================================
class FlattenedView {
public:
    static FlattenedView build(const TreeModel& model);
    // Shorthand over a TreeNodeModel of the given roots
    static FlattenedView build(const std::vector<TreeNode::Ptr>& roots);

    const std::vector<FlatEntry>& entries() const { return _entries; }
    size_t size() const { return _entries.size(); }
    bool empty() const { return _entries.empty(); }
    const FlatEntry& operator[](size_t i) const { return _entries[i]; }

    std::optional<size_t> indexOf(const void* node) const;
    // Index of the entry's parent, found by scanning backwards
    std::optional<size_t> parentIndex(size_t index) const;

private:
    void visit(const TreeModel& model, NodeRef node, NodeRef parent, int depth,
               bool isLast, std::vector<bool>& ancestorsLast);

    std::vector<FlatEntry> _entries;
};

//=============================================================================
// Guides
//=============================================================================
enum class GuideStyle {
    Unicode,
    Ascii,
    None,
};

struct GuideSymbols {
    std::string branch;
    std::string lastBranch;
    std::string vertical;
    std::string space;
};

const GuideSymbols& guideSymbols(GuideStyle style);
const char* toString(GuideStyle style);
Result<GuideStyle> parseGuideStyle(const std::string& name);

// Connector prefix for an entry. indentWidth <= 0 uses the natural symbol
// width; otherwise every level is padded or truncated to indentWidth cells.
std::string buildGuidePrefix(const FlatEntry& entry, GuideStyle style, int indentWidth = 0);

} // namespace yview
