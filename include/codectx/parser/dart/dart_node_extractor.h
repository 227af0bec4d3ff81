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

namespace codectx::parser::dart {

/**
 * @brief Brace depth at the start of every line of a buffer.
 *
 * Braces are counted without regard to strings or comments.
 */
class BraceDepths {
public:
    explicit BraceDepths(std::string_view text);

    // 1-based line holding offset
    int lineAt(size_t offset) const { return index_.lineAt(offset); }

    // Depth before the first character of the line holding offset
    int depthAt(size_t offset) const;

    int lineCount() const { return index_.lineCount(); }

private:
    core::LineIndex index_;
    std::vector<int> depths_;
};

/**
 * @brief Turns regex matches over one Dart buffer into AST nodes.
 *
 * The buffer is either a whole file or, for streaming, one chunk of it; baseLine
 * and baseOffset translate chunk positions into file positions. Every node's line
 * is the line of its declared name. Nodes accumulate in call order.
 */
class DartNodeExtractor {
public:
    DartNodeExtractor(std::string_view content, std::string filePath, bool asyncAnalysis,
                      int baseLine = 0, size_t baseOffset = 0);

    // Full-strategy steps
    void extractImports();
    void extractClasses();
    void extractMixins();
    void extractExtensions();
    void extractEnums();
    void extractTypedefs();
    void extractFunctions();
    void extractAsyncFunctions();
    void extractVariables();
    void extractPartDirectives();

    /**
     * @brief Run one named pattern for the limited and streaming strategies.
     *
     * Adds at most limit nodes and stops once the total node count reaches cap.
     * Node ids end in the line, or in the absolute byte offset when idByOffset is
     * set. Returns the number of nodes added.
     */
    size_t extractPattern(std::string_view patternName, size_t limit, size_t cap,
                          bool idByOffset);

    size_t nodeCount() const { return nodes_.size(); }

    std::vector<ast::ASTNode> takeNodes() { return std::move(nodes_); }

    /**
     * @brief Error-handling, pattern-matching, record and async counts for a file.
     *
     * Async keys are written only when asyncAnalysis is set.
     */
    static void annotateRoot(nlohmann::json& metadata, std::string_view content,
                             bool asyncAnalysis);

private:
    int lineOf(size_t offset) const { return baseLine_ + scan_.lineAt(offset); }
    size_t offsetOf(const boost::cmatch& m, int group) const;
    ast::ASTNode makeNode(std::string id, std::string type, const boost::cmatch& m,
                          int line) const;
    ast::ASTNode makeLeaf(std::string id, std::string type, std::string value, int line) const;

    // Body between the '{' closing a declaration match and its matching '}'
    std::string_view bodyAfter(const boost::cmatch& m, int* endLine) const;

    std::vector<ast::ASTNode> extractMembers(std::string_view body, const std::string& owner);
    std::vector<ast::ASTNode> extractEnumValues(std::string_view body, size_t* membersStart);

    std::string_view content_;
    std::string filePath_;
    bool asyncAnalysis_;
    int baseLine_;
    size_t baseOffset_;
    BraceDepths scan_;
    std::vector<ast::ASTNode> nodes_;
};

} // namespace codectx::parser::dart
