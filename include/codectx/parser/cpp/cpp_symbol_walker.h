#pragma once

#include <codectx/ast/ast.h>
#include <codectx/ast/symbol.h>

#include <optional>
#include <string>
#include <vector>

namespace codectx::parser::cpp {

/**
 * @brief Enclosing scope for a declaration.
 *
 * Passed by value: entering a scope produces an updated copy, so siblings never
 * observe each other's changes.
 */
struct ParentContext {
    bool inClass = false;
    std::string className;
    ast::Visibility currentAccess = ast::Visibility::Private;
    bool inNamespace = false;
    std::string namespaceName;
    int templateDepth = 0;
};

/**
 * @brief Pre-order symbol walk over a converted C++ tree.
 *
 * Class bodies are walked by a dedicated loop that tracks the latest access
 * label, so a label only affects the declarations after it.
 */
class CppSymbolWalker {
public:
    CppSymbolWalker(const ast::AST& tree, bool enableVirtualDetection)
        : tree_(tree), enableVirtualDetection_(enableVirtualDetection) {}

    std::vector<ast::Symbol> walk();

    // Name and signature helpers, also used for imports and tests
    static std::string functionName(const ast::ASTNode& node);
    static std::string className(const ast::ASTNode& node);
    static std::string namespaceName(const ast::ASTNode& node);
    static std::string fieldName(const ast::ASTNode& node);
    static std::string templateName(const ast::ASTNode& node);
    static std::string templateSignature(const ast::ASTNode& node);
    static std::string includeName(const ast::ASTNode& node);
    static std::string genericName(const ast::ASTNode& node);
    static const ast::ASTNode* findFunctionDeclarator(const ast::ASTNode& node);

    std::string functionSignature(const ast::ASTNode& node) const;

private:
    void walkNode(const ast::ASTNode& node, const ParentContext& ctx);
    void walkClassBody(const ast::ASTNode& body, const ParentContext& ctx);
    ParentContext enter(const ast::ASTNode& node, const ParentContext& ctx) const;
    std::optional<ast::Symbol> toSymbol(const ast::ASTNode& node, const ParentContext& ctx) const;
    ast::Symbol makeSymbol(const ast::ASTNode& node, std::string_view prefix, std::string name,
                           ast::SymbolKind kind) const;
    void classifyFunction(const ast::ASTNode& node, const ParentContext& ctx,
                          ast::Symbol& symbol) const;

    const ast::AST& tree_;
    bool enableVirtualDetection_;
    std::vector<ast::Symbol> symbols_;
};

} // namespace codectx::parser::cpp
