#include <codectx/ast/ast.h>

#include <algorithm>

extern "C" {
#include <tree_sitter/api.h>
}

namespace codectx::ast {

bool ASTNode::isTruncated() const {
    constexpr std::string_view suffix = "_truncated";
    return type.size() > suffix.size() &&
           std::string_view(type).substr(type.size() - suffix.size()) == suffix;
}

void TreeDeleter::operator()(TSTree* tree) const {
    if (tree) {
        ts_tree_delete(tree);
    }
}

size_t countNodes(const ASTNode& node) {
    size_t total = 1;
    for (const auto& child : node.children) {
        total += countNodes(child);
    }
    return total;
}

size_t maxDepth(const ASTNode& node) {
    size_t deepest = 0;
    for (const auto& child : node.children) {
        deepest = std::max(deepest, maxDepth(child));
    }
    return deepest + 1;
}

} // namespace codectx::ast
