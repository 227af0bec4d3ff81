#pragma once

#include <codectx/config/parser_config.h>
#include <codectx/core/logger.h>
#include <codectx/core/panic_handler.h>
#include <codectx/parser/language_parser.h>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace codectx::parser::swift {

/**
 * @brief Regex-based Swift backend.
 *
 * Covers modern Swift declarations (actors, async functions, property wrappers,
 * macros, result builders) and records framework and feature flags on the root.
 * Each extraction step is guarded; a failing step is recorded under
 * extraction_errors on the root metadata and the other steps still run.
 */
class SwiftParser final : public ILanguageParser {
public:
    using StepHook = std::function<void(std::string_view)>;

    SwiftParser(const config::ParserConfig& config, std::shared_ptr<core::ILogger> logger);

    std::string_view language() const override { return "swift"; }

    Result<ast::ASTPtr> parse(const core::ParseContext& ctx, std::string_view content,
                              const std::string& filePath) override;

    Result<std::vector<ast::Symbol>> extractSymbols(const ast::AST& tree) const override;

    std::vector<ast::Import> extractImports(const ast::AST& tree) const override;

    void setStepHook(StepHook hook) { stepHook_ = std::move(hook); }

private:
    Result<ast::ASTPtr> parseImpl(const core::ParseContext& ctx, std::string_view content,
                                  const std::string& filePath);

    config::ParserConfig config_;
    std::shared_ptr<core::ILogger> logger_;
    mutable core::PanicHandler panic_;
    StepHook stepHook_;
};

// Symbols for the declaration nodes of a Swift AST, in source order
std::vector<ast::Symbol> swiftSymbols(const ast::AST& tree);

} // namespace codectx::parser::swift
