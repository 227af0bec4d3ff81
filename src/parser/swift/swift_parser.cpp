#include <codectx/core/text.h>
#include <codectx/crypto/hasher.h>
#include <codectx/parser/swift/swift_extractor.h>
#include <codectx/parser/swift/swift_parser.h>

#include <algorithm>
#include <chrono>
#include <utility>

#include <fmt/format.h>

namespace codectx::parser::swift {

namespace {

constexpr const char* kAstVersion = "1.0";

} // namespace

SwiftParser::SwiftParser(const config::ParserConfig& config, std::shared_ptr<core::ILogger> logger)
    : config_(config), logger_(logger ? std::move(logger) : core::makeNullLogger()),
      panic_(logger_) {}

Result<ast::ASTPtr> SwiftParser::parse(const core::ParseContext& ctx, std::string_view content,
                                       const std::string& filePath) {
    auto scoped = ctx.withFile(filePath, "swift");
    return panic_.guardResult<ast::ASTPtr>(
        scoped, "swift.parse", [&]() { return parseImpl(scoped, content, filePath); });
}

Result<ast::ASTPtr> SwiftParser::parseImpl(const core::ParseContext& ctx,
                                           std::string_view content,
                                           const std::string& filePath) {
    if (content.size() > config::kMaxFileSize) {
        return Error{ErrorCode::Validation,
                     fmt::format("file too large: {} > {} bytes", content.size(),
                                 config::kMaxFileSize)}
            .withOperation("swift.parse")
            .withFile(filePath, "swift");
    }

    auto started = std::chrono::steady_clock::now();
    auto result = std::make_shared<ast::AST>();
    result->language = "swift";
    result->content = std::string(content);
    result->hash = crypto::SHA256Hasher::hashText(content);
    result->version = kAstVersion;
    result->parsedAt = std::chrono::system_clock::now();
    result->filePath = filePath;

    std::string_view text = result->content;
    auto root = std::make_unique<ast::ASTNode>();
    root->id = "swift-root";
    root->type = "compilation_unit";
    root->value = result->content;
    root->location = ast::FileLocation{filePath, 1, 1, core::countLines(text), 1};
    root->metadata = {{"parser", "regex"},
                      {"parse_quality", "basic"},
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
            logger_->error("Swift extraction step failed", guarded.error(),
                           {{"extraction_step", std::string(step)}, {"file_path", filePath}});
            metadata["has_errors"] = true;
            metadata["error_count"] = metadata.value("error_count", 0) + 1;
            metadata["extraction_errors"].push_back(std::string(step));
        }
    };

    logger_->debug("starting Swift content parsing",
                   {{"file_path", filePath}, {"content_size", content.size()}});

    // Types and callables open the scopes that properties are checked against
    SwiftExtractor extractor(text, filePath);
    runStep("extract_imports", [&] { extractor.extractImports(); });
    runStep("extract_types", [&] { extractor.extractTypes(); });
    runStep("extract_typealiases", [&] { extractor.extractTypeAliases(); });
    runStep("extract_associated_types", [&] { extractor.extractAssociatedTypes(); });
    runStep("extract_functions", [&] { extractor.extractFunctions(); });
    runStep("extract_initializers", [&] { extractor.extractInitializers(); });
    runStep("extract_subscripts", [&] { extractor.extractSubscripts(); });
    runStep("extract_operators", [&] { extractor.extractOperators(); });
    runStep("extract_properties", [&] { extractor.extractProperties(); });
    runStep("extract_control_flow", [&] { extractor.extractControlFlow(); });
    runStep("extract_result_builders", [&] { extractor.extractResultBuilders(); });
    runStep("extract_macros", [&] { extractor.extractMacros(); });

    runStep("analyze_closures", [&] { extractor.analyzeClosures(metadata); });
    runStep("analyze_concurrency", [&] { extractor.analyzeConcurrency(metadata); });
    runStep("analyze_optionals", [&] { extractor.analyzeOptionals(metadata); });
    runStep("analyze_declarations", [&] { extractor.analyzeDeclarations(metadata); });
    runStep("detect_frameworks", [&] { extractor.detectFrameworks(metadata); });

    root->children = extractor.takeNodes();
    auto cap = static_cast<size_t>(std::max(config_.performance.maxSymbols, 0));
    if (root->children.size() > cap) {
        logger_->warn("Swift node limit reached",
                      {{"file_path", filePath},
                       {"node_count", root->children.size()},
                       {"max_symbols", cap}});
        root->children.resize(cap);
        metadata["truncated"] = true;
    }

    auto nodeCount = root->children.size();
    result->root = std::move(root);
    auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - started)
                         .count();
    logger_->info("Swift parsing completed",
                  {{"file_path", filePath}, {"node_count", nodeCount}, {"duration_ms", elapsedMs}});
    return result;
}

Result<std::vector<ast::Symbol>> SwiftParser::extractSymbols(const ast::AST& tree) const {
    if (!tree.root) {
        return Error{ErrorCode::Validation, "ast root is nil"}
            .withOperation("swift.extract_symbols")
            .withFile(tree.filePath, "swift");
    }
    auto ctx = core::ParseContext{}.withFile(tree.filePath, "swift");
    return panic_.guardResult<std::vector<ast::Symbol>>(
        ctx, "swift.extract_symbols",
        [&]() -> Result<std::vector<ast::Symbol>> { return swiftSymbols(tree); });
}

std::vector<ast::Import> SwiftParser::extractImports(const ast::AST& tree) const {
    std::vector<ast::Import> imports;
    if (!tree.root) {
        return imports;
    }
    for (const auto& node : tree.root->children) {
        if (node.type != "import_declaration" || node.children.empty()) {
            continue;
        }
        imports.push_back(ast::Import{node.children.front().value, {}, node.location.line});
    }
    return imports;
}

} // namespace codectx::parser::swift
