#include <codectx/core/text.h>
#include <codectx/crypto/hasher.h>
#include <codectx/parser/cpp/cpp_features.h>
#include <codectx/parser/cpp/cpp_parser.h>
#include <codectx/parser/cpp/cpp_symbol_walker.h>
#include <codectx/parser/cpp/grammar_loader.h>

#include <algorithm>
#include <chrono>

#include <fmt/format.h>

namespace codectx::parser::cpp {

namespace {

constexpr const char* kAstVersion = "1.0";

using TSParserPtr = std::unique_ptr<TSParser, decltype(&ts_parser_delete)>;

std::string safeSlice(std::string_view content, uint32_t start, uint32_t end) {
    if (start >= content.size() || end > content.size() || start > end) {
        return {};
    }
    return std::string(content.substr(start, end - start));
}

std::string stripIncludeDelimiters(std::string_view name) {
    name = core::trimView(name);
    if (name.size() >= 2 && ((name.front() == '"' && name.back() == '"') ||
                             (name.front() == '<' && name.back() == '>'))) {
        name = name.substr(1, name.size() - 2);
    }
    return std::string(name);
}

} // namespace

CppParser::CppParser(const config::ParserConfig& config, std::shared_ptr<core::ILogger> logger)
    : config_(config), logger_(logger ? std::move(logger) : core::makeNullLogger()),
      panic_(logger_) {
    auto grammar = GrammarLoader::instance().loadGrammar("cpp");
    if (grammar) {
        language_ = grammar->second;
    } else {
        initError_ = Error{ErrorCode::Initialization,
                           fmt::format("failed to load C++ grammar: {}", grammar.error().message)}
                         .withOperation("cpp.init");
        logger_->error("C++ grammar unavailable", initError_);
    }
}

CppParser::CppParser(const TSLanguage* language, const config::ParserConfig& config,
                     std::shared_ptr<core::ILogger> logger)
    : language_(language), config_(config),
      logger_(logger ? std::move(logger) : core::makeNullLogger()), panic_(logger_) {}

int CppParser::depthCap() const {
    int configured = config_.cpp.maxNestingDepth > 0 ? config_.cpp.maxNestingDepth
                                                     : config::kMaxNestingDepth;
    return std::min(configured, config::kHardNestingDepth);
}

Result<void> CppParser::validateInput(std::string_view content) const {
    if (initError_) {
        return *initError_;
    }
    if (!language_) {
        return Error{ErrorCode::Validation, "tree-sitter parser is nil"};
    }
    if (content.empty()) {
        return Error{ErrorCode::Validation, "content is empty"};
    }
    if (content.size() > config_.cpp.maxFileSize) {
        return Error{ErrorCode::Validation,
                     fmt::format("file too large: {} > {} bytes", content.size(),
                                 config_.cpp.maxFileSize)};
    }
    return {};
}

Result<ast::ASTPtr> CppParser::parse(const core::ParseContext& ctx, std::string_view content,
                                     const std::string& filePath) {
    auto scoped = ctx.withFile(filePath, "cpp");
    return panic_.guardResult<ast::ASTPtr>(
        scoped, "cpp.parse", [&]() { return parseImpl(scoped, content, filePath); });
}

Result<ast::ASTPtr> CppParser::parseImpl(const core::ParseContext& ctx, std::string_view content,
                                         const std::string& filePath) {
    if (auto valid = validateInput(content); !valid) {
        return Error{valid.error()}.withOperation("cpp.parse").withFile(filePath, "cpp");
    }
    if (ctx.isCancelled()) {
        return Error{ErrorCode::Parsing, "parsing cancelled before start"}
            .withOperation("cpp.parse")
            .withFile(filePath, "cpp");
    }

    logger_->debug("starting C++ content parsing",
                   {{"file_path", filePath}, {"content_size", content.size()}});

    TSParserPtr parser(ts_parser_new(), ts_parser_delete);
    if (!parser || !ts_parser_set_language(parser.get(), language_)) {
        return Error{ErrorCode::Initialization, "failed to set tree-sitter language"}
            .withOperation("cpp.parse")
            .withFile(filePath, "cpp");
    }

    auto started = std::chrono::steady_clock::now();
    ast::TreePtr tree(ts_parser_parse_string(parser.get(), nullptr, content.data(),
                                             static_cast<uint32_t>(content.size())));
    auto elapsed = std::chrono::steady_clock::now() - started;
    auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();

    if (elapsed > config_.cpp.parseTimeout) {
        Error timeout = Error{ErrorCode::Parsing, "parsing exceeded timeout"}
                            .withOperation("cpp.parse")
                            .withFile(filePath, "cpp");
        logger_->error("C++ parsing exceeded timeout", timeout,
                       {{"file_path", filePath},
                        {"duration_ms", elapsedMs},
                        {"timeout_us", config_.cpp.parseTimeout.count()},
                        {"strict", config_.cpp.strictTimeoutEnforcement}});
        if (config_.cpp.strictTimeoutEnforcement) {
            return timeout;
        }
    }

    if (!tree) {
        return Error{ErrorCode::Parsing, "failed to parse content with tree-sitter"}
            .withOperation("cpp.parse")
            .withFile(filePath, "cpp");
    }

    auto result = std::make_shared<ast::AST>();
    result->language = "cpp";
    result->content = std::string(content);
    result->hash = crypto::SHA256Hasher::hashText(content);
    result->version = kAstVersion;
    result->parsedAt = std::chrono::system_clock::now();
    result->filePath = filePath;

    TSNode rootNode = ts_tree_root_node(tree.get());
    bool truncated = false;
    result->root = std::make_unique<ast::ASTNode>(
        convertNode(rootNode, result->content, filePath, 0, truncated));

    auto& metadata = result->root->metadata;
    metadata = detectCppFeatures(rootNode, result->content);
    metadata["parser"] = "tree-sitter";
    auto nodeCount = ast::countNodes(*result->root);
    metadata["node_count"] = nodeCount;
    if (truncated) {
        metadata["truncated"] = true;
        logger_->warn("C++ tree truncated at depth cap",
                      {{"file_path", filePath}, {"max_depth", depthCap()}});
    }
    result->tree = std::move(tree);

    logger_->info("C++ parsing completed", {{"file_path", filePath},
                                            {"duration_ms", elapsedMs},
                                            {"node_count", nodeCount}});
    return result;
}

ast::ASTNode CppParser::convertNode(TSNode node, std::string_view content,
                                    const std::string& filePath, int depth,
                                    bool& truncated) const {
    ast::ASTNode out;
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    const char* kind = ts_node_type(node);

    if (depth >= depthCap()) {
        truncated = true;
        out.id = fmt::format("truncated-node-{}-{}", start, end);
        out.type = fmt::format("{}_truncated", kind ? kind : "node");
        out.value = fmt::format("// Truncated at depth {}", depth);
        out.location = ast::FileLocation{filePath, 1, 1, 1, 1};
        return out;
    }

    TSPoint startPoint = ts_node_start_point(node);
    TSPoint endPoint = ts_node_end_point(node);
    out.id = fmt::format("node-{}-{}", start, end);
    out.type = kind ? kind : "";
    out.value = safeSlice(content, start, end);
    out.location = ast::FileLocation{filePath, static_cast<int>(startPoint.row) + 1,
                                     static_cast<int>(startPoint.column) + 1,
                                     static_cast<int>(endPoint.row) + 1,
                                     static_cast<int>(endPoint.column) + 1};

    uint32_t count = ts_node_child_count(node);
    out.children.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        out.children.push_back(
            convertNode(ts_node_child(node, i), content, filePath, depth + 1, truncated));
    }
    return out;
}

Result<std::vector<ast::Symbol>> CppParser::extractSymbols(const ast::AST& tree) const {
    if (!tree.root) {
        return Error{ErrorCode::Validation, "ast root is nil"}
            .withOperation("cpp.extract_symbols")
            .withFile(tree.filePath, "cpp");
    }

    auto ctx = core::ParseContext{}.withFile(tree.filePath, "cpp");
    return panic_.guardResult<std::vector<ast::Symbol>>(
        ctx, "cpp.extract_symbols", [&]() -> Result<std::vector<ast::Symbol>> {
            CppSymbolWalker walker(tree, config_.cpp.enableVirtualDetection);
            auto symbols = walker.walk();

            auto classes = std::count_if(symbols.begin(), symbols.end(), [](const auto& s) {
                return s.kind == ast::SymbolKind::Class;
            });
            if (classes > config_.cpp.maxClassesPerFile) {
                logger_->warn("class count exceeds configured limit",
                              {{"file_path", tree.filePath},
                               {"classes", classes},
                               {"limit", config_.cpp.maxClassesPerFile}});
            }
            logger_->debug("C++ symbols extracted",
                           {{"file_path", tree.filePath}, {"symbols", symbols.size()}});
            return symbols;
        });
}

std::vector<ast::Import> CppParser::extractImports(const ast::AST& tree) const {
    std::vector<ast::Import> imports;
    if (!tree.root) {
        return imports;
    }
    ast::visitPreOrder(*tree.root, [&](const ast::ASTNode& node, size_t) {
        if (node.type == "preproc_include") {
            imports.push_back(ast::Import{
                stripIncludeDelimiters(CppSymbolWalker::includeName(node)), {},
                node.location.line});
        }
    });
    return imports;
}

} // namespace codectx::parser::cpp
