#pragma once

#include <codectx/cache/ast_cache.h>
#include <codectx/config/parser_config.h>
#include <codectx/core/logger.h>
#include <codectx/core/panic_handler.h>
#include <codectx/parser/language_parser.h>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace codectx::parser::dart {

enum class ExtractionStrategy { Full, Limited, Streaming };

constexpr const char* strategyToString(ExtractionStrategy strategy) {
    switch (strategy) {
        case ExtractionStrategy::Full: return "full";
        case ExtractionStrategy::Limited: return "limited";
        case ExtractionStrategy::Streaming: return "streaming";
    }
    return "full";
}

inline constexpr size_t kStreamingChunkSize = 100 * 1024;
inline constexpr int kLimitedSymbolCap = 5000;
inline constexpr int kStreamingSymbolCap = 10000;

/**
 * @brief Regex-based Dart backend with Flutter detection.
 *
 * Extraction runs as a sequence of independently guarded steps; a step that
 * throws is logged and recorded on the root metadata while the nodes produced by
 * the other steps are kept.
 */
class DartParser final : public ILanguageParser {
public:
    // Receives the step name before each extraction step runs
    using StepHook = std::function<void(std::string_view)>;

    DartParser(const config::ParserConfig& config, std::shared_ptr<core::ILogger> logger,
               std::shared_ptr<cache::IAstCache> cache = nullptr);

    std::string_view language() const override { return "dart"; }

    Result<ast::ASTPtr> parse(const core::ParseContext& ctx, std::string_view content,
                              const std::string& filePath) override;

    Result<std::vector<ast::Symbol>> extractSymbols(const ast::AST& tree) const override;

    std::vector<ast::Import> extractImports(const ast::AST& tree) const override;

    ExtractionStrategy selectStrategy(size_t contentSize) const;

    void setStepHook(StepHook hook) { stepHook_ = std::move(hook); }

private:
    Result<ast::ASTPtr> parseImpl(const core::ParseContext& ctx, std::string_view content,
                                  const std::string& filePath);

    config::ParserConfig config_;
    std::shared_ptr<core::ILogger> logger_;
    std::shared_ptr<cache::IAstCache> cache_;
    mutable core::PanicHandler panic_;
    StepHook stepHook_;
};

// Symbols for every declaration node of a Dart AST, in pre-order
std::vector<ast::Symbol> dartSymbols(const ast::AST& tree);

} // namespace codectx::parser::dart
