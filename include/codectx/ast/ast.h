#pragma once

#include <codectx/core/types.h>

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

struct TSTree;

namespace codectx::ast {

/**
 * @brief Source span with 1-based lines and columns
 */
struct FileLocation {
    std::string filePath;
    int line = 1;
    int column = 1;
    int endLine = 1;
    int endColumn = 1;

    bool operator==(const FileLocation&) const = default;
};

/**
 * @brief Language-agnostic tree node.
 *
 * Children are owned by value. Metadata is always a JSON object.
 */
struct ASTNode {
    std::string id;
    std::string type;
    std::string value;
    FileLocation location;
    std::vector<ASTNode> children;
    nlohmann::json metadata = nlohmann::json::object();

    bool isTruncated() const;

    bool operator==(const ASTNode&) const = default;
};

struct TreeDeleter {
    void operator()(TSTree* tree) const;
};

using TreePtr = std::unique_ptr<TSTree, TreeDeleter>;

/**
 * @brief Per-file parse result.
 *
 * Owns the content copy, the converted node tree and, for grammar-backed
 * languages, the tree-sitter tree, which is released when the AST is destroyed.
 */
struct AST {
    std::string language;
    std::string content;
    Hash hash;
    std::string version;
    TimePoint parsedAt;
    std::string filePath;
    std::unique_ptr<ASTNode> root;
    TreePtr tree;
};

using ASTPtr = std::shared_ptr<AST>;

// Number of nodes in the subtree rooted at node
size_t countNodes(const ASTNode& node);

// Depth of the deepest node, the root counting as 1
size_t maxDepth(const ASTNode& node);

/**
 * @brief Pre-order visit, parent before children, siblings left to right.
 *
 * The visitor receives each node and its depth (root = 0).
 */
template <typename Visitor> void visitPreOrder(const ASTNode& node, Visitor&& visit,
                                               size_t depth = 0) {
    visit(node, depth);
    for (const auto& child : node.children) {
        visitPreOrder(child, visit, depth + 1);
    }
}

} // namespace codectx::ast
