#pragma once

#include <codectx/ast/ast.h>
#include <codectx/core/text.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/regex.hpp>
#include <nlohmann/json.hpp>

namespace codectx::parser::swift {

/**
 * @brief Swift source with comments and string contents blanked out.
 *
 * Blanking keeps every offset and newline, so matches over code() map straight
 * back to the original text. Braces are indexed once for depth and matching
 * lookups. Block comments nest; string interpolation is treated as string.
 */
class SwiftSource {
public:
    explicit SwiftSource(std::string_view content);

    std::string_view code() const { return code_; }

    // 1-based line holding offset
    int lineAt(size_t offset) const { return lines_.lineAt(offset); }

    // Number of '{' still open before offset
    int depthAt(size_t offset) const;

    // Offset of the '}' closing the '{' at open, npos when unbalanced
    size_t closingBrace(size_t open) const;

private:
    std::string code_;
    core::LineIndex lines_;
    std::vector<size_t> bracePositions_;
    std::vector<int> depthAfter_;
    std::vector<size_t> matching_;
};

/**
 * @brief Turns regex matches over one Swift file into AST nodes.
 *
 * Type bodies and callable bodies are tracked as scopes: a func whose innermost
 * scope is a type body is a method, and let/var inside a callable body is a
 * local and not extracted. Types and callables must therefore be extracted
 * before properties.
 */
class SwiftExtractor {
public:
    SwiftExtractor(std::string_view content, std::string filePath);

    void extractImports();
    void extractTypes();
    void extractTypeAliases();
    void extractAssociatedTypes();
    void extractFunctions();
    void extractInitializers();
    void extractSubscripts();
    void extractOperators();
    void extractProperties();
    void extractControlFlow();
    void extractResultBuilders();
    void extractMacros();

    // Feature counts written to the root when non-zero
    void analyzeClosures(nlohmann::json& metadata) const;
    void analyzeConcurrency(nlohmann::json& metadata) const;
    void analyzeOptionals(nlohmann::json& metadata) const;

    // Guard/defer, subscript, operator, result builder and macro counts
    void analyzeDeclarations(nlohmann::json& metadata) const;

    // Framework flags and primary_framework from the import nodes
    void detectFrameworks(nlohmann::json& metadata) const;

    size_t nodeCount() const { return nodes_.size(); }

    // Nodes in source order
    std::vector<ast::ASTNode> takeNodes();

private:
    struct Scope {
        size_t open;
        size_t close;
        bool isType;
        std::string owner;
    };

    size_t offsetOf(const boost::cmatch& m, int group) const;
    ast::ASTNode makeNode(std::string id, std::string type, const boost::cmatch& m,
                          size_t nameAt) const;

    // Appends node with an identifier child for name, ordered by nameAt
    void addNode(ast::ASTNode node, std::string_view prefix, const std::string& name,
                 size_t nameAt);

    // Records the body opened right after the match, if any
    void pushScope(const boost::cmatch& m, bool isType, std::string owner);
    const Scope* innermostScope(size_t offset) const;

    int countFeature(const boost::regex& re) const;
    int countTrailingClosures() const;
    int countNodes(std::string_view type) const;
    int countByFlag(std::string_view type, const char* flag) const;

    std::string_view content_;
    std::string filePath_;
    SwiftSource source_;
    std::vector<Scope> scopes_;
    std::vector<std::pair<size_t, ast::ASTNode>> nodes_;
};

} // namespace codectx::parser::swift
