#pragma once

#include <codectx/config/parser_config.h>
#include <codectx/core/logger.h>
#include <codectx/core/panic_handler.h>
#include <codectx/parser/language_parser.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

extern "C" {
#include <tree_sitter/api.h>
}

namespace codectx::parser::cpp {

/**
 * @brief C++ backend over the tree-sitter C++ grammar.
 *
 * The grammar is shared; every parse() call creates its own TSParser, so one
 * instance may serve concurrent parses. The produced AST owns the tree-sitter tree.
 */
class CppParser final : public ILanguageParser {
public:
    // Resolves the grammar through GrammarLoader::instance()
    CppParser(const config::ParserConfig& config, std::shared_ptr<core::ILogger> logger);

    // Uses an already loaded grammar; nullptr makes every parse fail validation
    CppParser(const TSLanguage* language, const config::ParserConfig& config,
              std::shared_ptr<core::ILogger> logger);

    std::string_view language() const override { return "cpp"; }

    Result<ast::ASTPtr> parse(const core::ParseContext& ctx, std::string_view content,
                              const std::string& filePath) override;

    Result<std::vector<ast::Symbol>> extractSymbols(const ast::AST& tree) const override;

    std::vector<ast::Import> extractImports(const ast::AST& tree) const override;

    bool isReady() const { return language_ != nullptr; }

    // Effective conversion depth cap
    int depthCap() const;

private:
    Result<void> validateInput(std::string_view content) const;
    Result<ast::ASTPtr> parseImpl(const core::ParseContext& ctx, std::string_view content,
                                  const std::string& filePath);
    ast::ASTNode convertNode(TSNode node, std::string_view content, const std::string& filePath,
                             int depth, bool& truncated) const;

    const TSLanguage* language_ = nullptr;
    std::optional<Error> initError_;
    config::ParserConfig config_;
    std::shared_ptr<core::ILogger> logger_;
    mutable core::PanicHandler panic_;
};

} // namespace codectx::parser::cpp
