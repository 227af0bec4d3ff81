#pragma once

#include <codectx/ast/ast.h>
#include <codectx/ast/symbol.h>
#include <codectx/core/context.h>
#include <codectx/core/types.h>

#include <string>
#include <string_view>
#include <vector>

namespace codectx::parser {

/**
 * @brief Backend for one language.
 *
 * parse() builds a fresh AST with its root metadata fully populated. Symbol and
 * import extraction read the AST only.
 */
class ILanguageParser {
public:
    virtual ~ILanguageParser() = default;

    virtual std::string_view language() const = 0;

    virtual Result<ast::ASTPtr> parse(const core::ParseContext& ctx, std::string_view content,
                                      const std::string& filePath) = 0;

    virtual Result<std::vector<ast::Symbol>> extractSymbols(const ast::AST& tree) const = 0;

    virtual std::vector<ast::Import> extractImports(const ast::AST& tree) const = 0;
};

} // namespace codectx::parser
