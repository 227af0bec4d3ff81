#include <codectx/core/text.h>
#include <codectx/crypto/hasher.h>
#include <codectx/parser/dart/dart_node_extractor.h>
#include <codectx/parser/dart/dart_parser.h>
#include <codectx/parser/dart/flutter_analyzer.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <utility>

#include <fmt/format.h>

namespace codectx::parser::dart {

namespace {

constexpr const char* kAstVersion = "1.0";

struct PatternLimit {
    std::string_view pattern;
    size_t limit;
};

constexpr std::array<PatternLimit, 9> kLimitedPatterns = {{
    {"import", 50},
    {"class", 1000},
    {"function", 500},
    {"mixin", 100},
    {"extension", 100},
    {"enum", 100},
    {"typedef", 100},
    {"asyncGenerator", 100},
    {"asyncFunction", 200},
}};

constexpr std::array<std::string_view, 9> kStreamingPatterns = {
    "class",  "mixin",  "extension",      "enum",         "function",
    "typedef", "import", "asyncGenerator", "asyncFunction"};

bool isAsyncPattern(std::string_view pattern) {
    return pattern == "asyncGenerator" || pattern == "asyncFunction";
}

void recordStepFailure(nlohmann::json& metadata, std::string_view step) {
    metadata["has_errors"] = true;
    metadata["error_count"] = metadata.value("error_count", 0) + 1;
    metadata["extraction_errors"].push_back(std::string(step));
}

} // namespace

DartParser::DartParser(const config::ParserConfig& config, std::shared_ptr<core::ILogger> logger,
                       std::shared_ptr<cache::IAstCache> cache)
    : config_(config), logger_(logger ? std::move(logger) : core::makeNullLogger()),
      cache_(std::move(cache)), panic_(logger_) {}

ExtractionStrategy DartParser::selectStrategy(size_t contentSize) const {
    if (contentSize > config_.performance.streamingThreshold) {
        return ExtractionStrategy::Streaming;
    }
    if (contentSize > config_.performance.limitedThreshold) {
        return ExtractionStrategy::Limited;
    }
    return ExtractionStrategy::Full;
}

Result<ast::ASTPtr> DartParser::parse(const core::ParseContext& ctx, std::string_view content,
                                      const std::string& filePath) {
    auto scoped = ctx.withFile(filePath, "dart");
    return panic_.guardResult<ast::ASTPtr>(
        scoped, "dart.parse", [&]() { return parseImpl(scoped, content, filePath); });
}

Result<ast::ASTPtr> DartParser::parseImpl(const core::ParseContext& ctx, std::string_view content,
                                          const std::string& filePath) {
    if (content.size() > config_.dart.maxFileSize) {
        return Error{ErrorCode::Validation,
                     fmt::format("file too large: {} > {} bytes", content.size(),
                                 config_.dart.maxFileSize)}
            .withOperation("dart.parse")
            .withFile(filePath, "dart");
    }

    auto started = std::chrono::steady_clock::now();
    auto result = std::make_shared<ast::AST>();
    result->language = "dart";
    result->content = std::string(content);
    result->hash = crypto::SHA256Hasher::hashText(content);
    result->version = kAstVersion;
    result->parsedAt = std::chrono::system_clock::now();
    result->filePath = filePath;

    std::string_view text = result->content;
    auto strategy = selectStrategy(text.size());
    bool asyncAnalysis = config_.dart.enableAsyncAnalysis;

    auto root = std::make_unique<ast::ASTNode>();
    root->id = "root";
    root->type = "compilation_unit";
    root->value = result->content;
    root->location = ast::FileLocation{filePath, 1, 1, core::countLines(text), 1};
    root->metadata = {{"parser", "regex"},
                      {"parse_quality", "basic"},
                      {"strategy", strategyToString(strategy)},
                      {"has_flutter", core::contains(text, "package:flutter/")},
                      {"has_errors", false},
                      {"error_count", 0},
                      {"extraction_errors", nlohmann::json::array()}};
    auto& metadata = root->metadata;

    auto runStep = [&](std::string_view step, auto&& fn) {
        auto guarded = panic_.guard(ctx, step, [&]() {
            if (stepHook_) {
                stepHook_(step);
            }
            fn();
        });
        if (!guarded) {
            logger_->error("Node extraction step failed", guarded.error(),
                           {{"extraction_step", std::string(step)}, {"file_path", filePath}});
            recordStepFailure(metadata, step);
        }
        return guarded.has_value();
    };

    switch (strategy) {
        case ExtractionStrategy::Full: {
            DartNodeExtractor extractor(text, filePath, asyncAnalysis);
            runStep("extract_imports", [&] { extractor.extractImports(); });
            runStep("extract_classes", [&] { extractor.extractClasses(); });
            runStep("extract_mixins", [&] { extractor.extractMixins(); });
            runStep("extract_extensions", [&] { extractor.extractExtensions(); });
            runStep("extract_enums", [&] { extractor.extractEnums(); });
            runStep("extract_typedefs", [&] { extractor.extractTypedefs(); });
            runStep("extract_functions", [&] { extractor.extractFunctions(); });
            runStep("extract_async_functions", [&] { extractor.extractAsyncFunctions(); });
            runStep("extract_variables", [&] { extractor.extractVariables(); });
            runStep("extract_part_directives", [&] { extractor.extractPartDirectives(); });
            root->children = extractor.takeNodes();
            break;
        }
        case ExtractionStrategy::Limited: {
            size_t cap = static_cast<size_t>(
                std::clamp(config_.performance.maxSymbols, 0, kLimitedSymbolCap));
            DartNodeExtractor extractor(text, filePath, asyncAnalysis);
            for (const auto& entry : kLimitedPatterns) {
                if (extractor.nodeCount() >= cap) {
                    break;
                }
                if (!asyncAnalysis && isAsyncPattern(entry.pattern)) {
                    continue;
                }
                runStep("pattern_matching", [&] {
                    extractor.extractPattern(entry.pattern, entry.limit, cap, false);
                });
            }
            root->children = extractor.takeNodes();
            break;
        }
        case ExtractionStrategy::Streaming: {
            size_t cap = static_cast<size_t>(
                std::clamp(config_.performance.maxSymbols, 0, kStreamingSymbolCap));
            core::LineIndex lines(text);
            bool chunkFailed = false;
            size_t offset = 0;
            while (offset < text.size() && root->children.size() < cap) {
                size_t end = std::min(offset + kStreamingChunkSize, text.size());
                std::string_view chunk = text.substr(offset, end - offset);
                if (end < text.size()) {
                    size_t lastBrace = chunk.rfind('}');
                    if (lastBrace != std::string_view::npos && lastBrace > 0 &&
                        lastBrace < chunk.size() - 1) {
                        chunk = chunk.substr(0, lastBrace + 1);
                        end = offset + lastBrace + 1;
                    }
                }

                DartNodeExtractor extractor(chunk, filePath, asyncAnalysis,
                                            lines.lineAt(offset) - 1, offset);
                size_t remaining = cap - root->children.size();
                bool ok = runStep("chunk_extraction", [&] {
                    for (auto pattern : kStreamingPatterns) {
                        if (!asyncAnalysis && isAsyncPattern(pattern)) {
                            continue;
                        }
                        extractor.extractPattern(pattern, remaining, remaining, true);
                    }
                });
                if (ok) {
                    for (auto& node : extractor.takeNodes()) {
                        root->children.push_back(std::move(node));
                    }
                } else {
                    chunkFailed = true;
                }
                offset = end;
            }
            if (root->children.size() >= cap) {
                logger_->debug("Streaming extraction reached symbol limit",
                               {{"symbols_extracted", root->children.size()}, {"max_symbols", cap}});
            }
            if (chunkFailed && cache_) {
                if (auto invalidated = cache_->invalidate(filePath); !invalidated) {
                    logger_->warn("cache invalidation failed",
                                  {{"file_path", filePath},
                                   {"error", invalidated.error().toString()}});
                }
            }
            break;
        }
    }

    runStep("analyze_patterns",
            [&] { DartNodeExtractor::annotateRoot(metadata, text, asyncAnalysis); });

    if (config_.dart.enableFlutterDetection) {
        auto integrated = panic_.guard(ctx, "integrate_flutter_analysis", [&]() {
            FlutterAnalyzer analyzer;
            FlutterAnalyzer::integrate(*root, analyzer.analyze(text));
        });
        if (!integrated) {
            metadata["flutter_integration_error"] = integrated.error().message;
        }
    }

    auto nodeCount = root->children.size();
    result->root = std::move(root);
    auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - started)
                         .count();
    logger_->info("Dart parsing completed", {{"file_path", filePath},
                                             {"strategy", strategyToString(strategy)},
                                             {"node_count", nodeCount},
                                             {"duration_ms", elapsedMs}});
    return result;
}

Result<std::vector<ast::Symbol>> DartParser::extractSymbols(const ast::AST& tree) const {
    if (!tree.root) {
        return Error{ErrorCode::Validation, "ast root is nil"}
            .withOperation("dart.extract_symbols")
            .withFile(tree.filePath, "dart");
    }
    auto ctx = core::ParseContext{}.withFile(tree.filePath, "dart");
    return panic_.guardResult<std::vector<ast::Symbol>>(
        ctx, "dart.extract_symbols",
        [&]() -> Result<std::vector<ast::Symbol>> { return dartSymbols(tree); });
}

std::vector<ast::Import> DartParser::extractImports(const ast::AST& tree) const {
    std::vector<ast::Import> imports;
    if (!tree.root) {
        return imports;
    }
    for (const auto& node : tree.root->children) {
        if (node.type != "import_statement") {
            continue;
        }
        auto path = std::find_if(node.children.begin(), node.children.end(),
                                 [](const ast::ASTNode& c) { return c.type == "string_literal"; });
        if (path == node.children.end()) {
            continue;
        }
        imports.push_back(ast::Import{path->value, node.metadata.value("alias", std::string{}),
                                      node.location.line});
    }
    return imports;
}

} // namespace codectx::parser::dart
