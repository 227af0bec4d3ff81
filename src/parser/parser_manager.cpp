#include <codectx/crypto/hasher.h>
#include <codectx/parser/cpp/cpp_parser.h>
#include <codectx/parser/dart/dart_parser.h>
#include <codectx/parser/parser_manager.h>
#include <codectx/parser/path_sanitizer.h>
#include <codectx/parser/swift/swift_parser.h>

#include <chrono>
#include <mutex>
#include <utility>

#include <fmt/format.h>

namespace codectx::parser {

ParserManager::ParserManager(config::ParserConfig config, std::shared_ptr<core::ILogger> logger,
                             std::shared_ptr<cache::IAstCache> cache)
    : config_(std::move(config)), logger_(logger ? std::move(logger) : core::makeNullLogger()),
      cache_(std::move(cache)), languages_(builtinLanguages()) {
    config_.validate();
    if (!cache_) {
        cache_ = std::make_shared<cache::AstCache>(static_cast<size_t>(config_.cache.maxSize),
                                                   config_.cache.ttl);
    }

    parsers_["dart"] = std::make_shared<dart::DartParser>(config_, logger_, cache_);
    parsers_["swift"] = std::make_shared<swift::SwiftParser>(config_, logger_);

    logger_->info("parser manager initialized", {{"languages_count", languages_.size()},
                                                 {"cache_enabled", config_.cachingEnabled()}});
}

ParserManager::~ParserManager() = default;

Result<FileClassification> ParserManager::classify(std::string_view path) const {
    return classifyPath(path, languages_);
}

Result<ast::ASTPtr> ParserManager::parse(const core::ParseContext& ctx, std::string_view content,
                                         const LanguageDescriptor& language,
                                         const std::string& path) {
    auto cleaned = sanitizePath(path);
    if (!cleaned) {
        logger_->warn("rejected file path", {{"language", language.name},
                                             {"reason", cleaned.error().message}});
        return Error{cleaned.error()}.withOperation("manager.parse");
    }
    const std::string& filePath = cleaned.value();

    // An empty path has no stable identity to cache under
    const bool useCache = config_.cachingEnabled() && !filePath.empty();
    const auto contentHash = crypto::SHA256Hasher::hashText(content);

    if (useCache) {
        auto cached = cache_->get(filePath, kAstCacheVersion);
        if (cached) {
            if (cached.value().hash == contentHash && cached.value().ast) {
                logger_->debug("AST cache hit",
                               {{"file_path", filePath}, {"language", language.name}});
                return cached.value().ast;
            }
            if (auto dropped = cache_->invalidate(filePath); !dropped) {
                logger_->warn("failed to invalidate stale AST",
                              {{"file_path", filePath}, {"error", dropped.error().toString()}});
            }
        }
    }

    auto backend = parserFor(language.name);
    if (!backend) {
        return Error{backend.error()}.withOperation("manager.parse").withFile(filePath,
                                                                              language.name);
    }

    auto parsed = backend.value()->parse(ctx.withFile(filePath, language.name), content, filePath);
    if (!parsed) {
        return parsed.error();
    }
    auto tree = std::move(parsed).value();

    if (useCache && tree) {
        auto stored = cache_->set(
            filePath,
            cache::VersionedAst{tree, contentHash, kAstCacheVersion, std::chrono::system_clock::now()});
        if (!stored) {
            logger_->warn("failed to cache AST",
                          {{"file_path", filePath}, {"error", stored.error().toString()}});
            if (tree->root) {
                tree->root->metadata["cache_error"] = stored.error().toString();
            }
        }
    }
    return tree;
}

Result<ast::ASTPtr> ParserManager::parseFile(const core::ParseContext& ctx,
                                             std::string_view content, const std::string& path) {
    auto classified = classify(path);
    if (!classified) {
        return classified.error();
    }
    return parse(ctx, content, classified.value().language, path);
}

Result<std::vector<ast::Symbol>> ParserManager::extractSymbols(const ast::ASTPtr& tree) {
    if (!tree) {
        return Error{ErrorCode::Validation, "ast is nil"}.withOperation("manager.extract_symbols");
    }
    if (!tree->root) {
        return Error{ErrorCode::Validation, "ast root is nil"}
            .withOperation("manager.extract_symbols")
            .withFile(tree->filePath, tree->language);
    }

    auto backend = parserFor(tree->language);
    if (!backend) {
        return Error{backend.error()}
            .withOperation("manager.extract_symbols")
            .withFile(tree->filePath, tree->language);
    }
    return backend.value()->extractSymbols(*tree);
}

Result<std::vector<ast::Import>> ParserManager::extractImports(const ast::ASTPtr& tree) {
    if (!tree || !tree->root) {
        return Error{ErrorCode::Validation, "ast root is nil"}.withOperation(
            "manager.extract_imports");
    }

    auto backend = parserFor(tree->language);
    if (!backend) {
        return Error{backend.error()}
            .withOperation("manager.extract_imports")
            .withFile(tree->filePath, tree->language);
    }
    return backend.value()->extractImports(*tree);
}

const std::vector<LanguageDescriptor>& ParserManager::supportedLanguages() const {
    return languages_;
}

Result<void> ParserManager::registerParser(const std::string& name,
                                           std::unique_ptr<ILanguageParser> parser) {
    if (!parser) {
        return Error{ErrorCode::Validation, "cannot register null parser"};
    }
    if (name.empty()) {
        return Error{ErrorCode::Validation, "parser name cannot be empty"};
    }

    std::unique_lock lock(mutex_);
    parsers_[name] = std::shared_ptr<ILanguageParser>(std::move(parser));
    logger_->debug("registered language parser", {{"language", name}});
    return Result<void>();
}

cache::CacheStats ParserManager::cacheStats() const {
    return cache_->stats();
}

Result<std::shared_ptr<ILanguageParser>> ParserManager::parserFor(const std::string& name) {
    {
        std::shared_lock lock(mutex_);
        if (auto it = parsers_.find(name); it != parsers_.end()) {
            return it->second;
        }
    }

    if (name != "cpp") {
        return Error{ErrorCode::UnsupportedLanguage, fmt::format("unsupported language: {}", name)};
    }

    std::unique_lock lock(mutex_);
    auto& slot = parsers_[name];
    if (!slot) {
        slot = std::make_shared<cpp::CppParser>(config_, logger_);
    }
    return slot;
}

} // namespace codectx::parser
