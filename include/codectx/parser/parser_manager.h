#pragma once

#include <codectx/cache/ast_cache.h>
#include <codectx/config/parser_config.h>
#include <codectx/core/logger.h>
#include <codectx/parser/language.h>
#include <codectx/parser/language_parser.h>

#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace codectx::parser {

inline constexpr const char* kAstCacheVersion = "1.0";

/**
 * @brief Entry point of the parsing pipeline.
 *
 * Owns one backend per language and the AST cache. parse() sanitizes the path
 * before anything else, answers from the cache when the stored content hash
 * matches, and otherwise dispatches by language name. The C++ backend is
 * created on first use so a missing grammar never affects Dart or Swift.
 */
class ParserManager {
public:
    explicit ParserManager(config::ParserConfig config,
                           std::shared_ptr<core::ILogger> logger = nullptr,
                           std::shared_ptr<cache::IAstCache> cache = nullptr);
    ~ParserManager();

    ParserManager(const ParserManager&) = delete;
    ParserManager& operator=(const ParserManager&) = delete;

    Result<FileClassification> classify(std::string_view path) const;

    Result<ast::ASTPtr> parse(const core::ParseContext& ctx, std::string_view content,
                              const LanguageDescriptor& language, const std::string& path);

    // classify() followed by parse()
    Result<ast::ASTPtr> parseFile(const core::ParseContext& ctx, std::string_view content,
                                  const std::string& path);

    Result<std::vector<ast::Symbol>> extractSymbols(const ast::ASTPtr& tree);

    Result<std::vector<ast::Import>> extractImports(const ast::ASTPtr& tree);

    const std::vector<LanguageDescriptor>& supportedLanguages() const;

    // Adds or replaces the backend for name
    Result<void> registerParser(const std::string& name, std::unique_ptr<ILanguageParser> parser);

    cache::CacheStats cacheStats() const;

    const config::ParserConfig& config() const { return config_; }

private:
    Result<std::shared_ptr<ILanguageParser>> parserFor(const std::string& name);

    config::ParserConfig config_;
    std::shared_ptr<core::ILogger> logger_;
    std::shared_ptr<cache::IAstCache> cache_;
    std::vector<LanguageDescriptor> languages_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ILanguageParser>> parsers_;
};

} // namespace codectx::parser
