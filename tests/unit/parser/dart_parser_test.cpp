#include "test_helpers.h"
#include <gtest/gtest.h>
#include <codectx/core/text.h>
#include <codectx/parser/dart/dart_parser.h>

#include <stdexcept>

using namespace codectx;
using namespace codectx::parser::dart;
using namespace codectx::test;
using ast::SymbolKind;

namespace {

constexpr const char* kStatefulPage = R"(import 'package:flutter/material.dart';

class MyPage extends StatefulWidget {
  @override
  State<MyPage> createState() => _MyPageState();
}

class _MyPageState extends State<MyPage> {
  @override
  void initState() {
    super.initState();
  }

  @override
  Widget build(BuildContext context) {
    return Scaffold(appBar: AppBar());
  }
}
)";

const ast::ASTNode* findNode(const ast::ASTNode& root, std::string_view type,
                             std::string_view name) {
    const ast::ASTNode* found = nullptr;
    ast::visitPreOrder(root, [&](const ast::ASTNode& node, size_t) {
        if (!found && node.type == type && !node.children.empty() &&
            node.children.front().value == name) {
            found = &node;
        }
    });
    return found;
}

} // namespace

class DartParserTest : public CodectxTest {
protected:
    void SetUp() override {
        CodectxTest::SetUp();
        parser = std::make_unique<DartParser>(config::ParserConfig{}, logger);
    }

    ast::ASTPtr parse(std::string_view content, const std::string& path = "lib/main.dart") {
        auto tree = parser->parse({}, content, path);
        EXPECT_TRUE(tree) << tree.error().toString();
        return tree ? tree.value() : nullptr;
    }

    std::vector<ast::Symbol> symbols(const ast::ASTPtr& tree) {
        auto result = parser->extractSymbols(*tree);
        EXPECT_TRUE(result) << result.error().toString();
        return result ? result.value() : std::vector<ast::Symbol>{};
    }

    std::unique_ptr<DartParser> parser;
};

TEST_F(DartParserTest, StatefulWidgetScenario) {
    auto tree = parse(kStatefulPage);
    ASSERT_TRUE(tree);
    auto syms = symbols(tree);

    const auto* page = findSymbol(syms, "MyPage", SymbolKind::Widget);
    ASSERT_NE(page, nullptr);
    EXPECT_EQ(page->visibility, ast::Visibility::Public);
    EXPECT_EQ(page->metadata.value("widget_type", ""), "stateful");

    const auto* state = findSymbol(syms, "_MyPageState", SymbolKind::StateClass);
    ASSERT_NE(state, nullptr);
    EXPECT_EQ(state->visibility, ast::Visibility::Private);
    EXPECT_EQ(state->metadata.value("has_lifecycle_methods", false), true);
    EXPECT_EQ(state->metadata.value("has_build_method", false), true);

    const auto* init = findSymbol(syms, "initState", SymbolKind::LifecycleMethod);
    ASSERT_NE(init, nullptr);
    EXPECT_EQ(init->signature, "void initState()");
    EXPECT_EQ(init->location.line, 10);

    const auto* build = findSymbol(syms, "build", SymbolKind::BuildMethod);
    ASSERT_NE(build, nullptr);
    EXPECT_EQ(build->signature, "Widget build(BuildContext context)");

    const auto& meta = tree->root->metadata;
    EXPECT_EQ(meta["has_flutter"], true);
    EXPECT_EQ(meta["flutter_framework"], "material");
    EXPECT_EQ(meta["state_management"], "setState");
    EXPECT_EQ(meta["strategy"], "full");
    EXPECT_EQ(meta["has_errors"], false);
}

TEST_F(DartParserTest, EnumValuesBecomeChildren) {
    auto tree = parse("enum Color { red, green, blue }\n");
    ASSERT_TRUE(tree);
    auto syms = symbols(tree);
    ASSERT_NE(findSymbol(syms, "Color", SymbolKind::Enum), nullptr);

    const auto* node = findNode(*tree->root, "enum_declaration", "Color");
    ASSERT_NE(node, nullptr);
    std::vector<std::string> values;
    for (const auto& child : node->children) {
        if (child.type == "enum_value") {
            ASSERT_FALSE(child.children.empty());
            values.push_back(child.children.front().value);
        }
    }
    EXPECT_EQ(values, (std::vector<std::string>{"red", "green", "blue"}));
    EXPECT_EQ(node->metadata["value_count"], 3);
    EXPECT_EQ(node->metadata["is_enhanced"], false);
}

TEST_F(DartParserTest, EnhancedEnumWithMembers) {
    auto tree = parse(R"(enum Planet {
  mercury(3.7),
  venus(8.9);

  const Planet(this.gravity);
  final double gravity;

  bool isHeavy() {
    return gravity > 9;
  }
}
)");
    ASSERT_TRUE(tree);
    const auto* node = findNode(*tree->root, "enum_declaration", "Planet");
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->metadata["value_count"], 2);
    EXPECT_EQ(node->metadata["is_enhanced"], true);
    EXPECT_EQ(node->metadata["has_methods"], true);
}

TEST_F(DartParserTest, MalformedPartOfIsSkipped) {
    auto tree = parse("part of ;\n\nclass Keeper {\n}\n");
    ASSERT_TRUE(tree);
    auto syms = symbols(tree);
    EXPECT_EQ(countKind(syms, SymbolKind::Directive), 0u);
    ASSERT_NE(findSymbol(syms, "Keeper", SymbolKind::Class), nullptr);
}

TEST_F(DartParserTest, PartDirectives) {
    auto tree = parse("part 'model.g.dart';\npart of 'library.dart';\n");
    ASSERT_TRUE(tree);
    auto syms = symbols(tree);
    EXPECT_EQ(countKind(syms, SymbolKind::Directive), 2u);
    EXPECT_NE(findSymbol(syms, "model.g.dart", SymbolKind::Directive), nullptr);
}

TEST_F(DartParserTest, ImportsWithAliases) {
    auto tree = parse("import 'dart:async';\nimport 'package:app/utils.dart' as utils;\n");
    ASSERT_TRUE(tree);
    auto imports = parser->extractImports(*tree);
    ASSERT_EQ(imports.size(), 2u);
    EXPECT_EQ(imports[0], (ast::Import{"dart:async", "", 1}));
    EXPECT_EQ(imports[1], (ast::Import{"package:app/utils.dart", "utils", 2}));
}

TEST_F(DartParserTest, MixinsExtensionsTypedefs) {
    auto tree = parse(R"(mixin Logging on Service {
  void log(String m) {
    print(m);
  }
}

extension StringX on String {
  bool get isBlank => trim().isEmpty;
}

typedef Handler = void Function(int code);
typedef Ids = List<int>;
)");
    ASSERT_TRUE(tree);
    auto syms = symbols(tree);

    const auto* mixin = findSymbol(syms, "Logging", SymbolKind::Mixin);
    ASSERT_NE(mixin, nullptr);
    EXPECT_EQ(mixin->metadata["has_constraint"], true);
    EXPECT_EQ(mixin->metadata["constraint_type"], "Service");

    const auto* ext = findSymbol(syms, "StringX", SymbolKind::Extension);
    ASSERT_NE(ext, nullptr);
    EXPECT_EQ(ext->metadata["extends_type"], "String");

    const auto* handler = findSymbol(syms, "Handler", SymbolKind::Typedef);
    ASSERT_NE(handler, nullptr);
    EXPECT_EQ(handler->metadata["is_function_type"], true);
    const auto* ids = findSymbol(syms, "Ids", SymbolKind::Typedef);
    ASSERT_NE(ids, nullptr);
    EXPECT_EQ(ids->signature, "List<int>");
}

TEST_F(DartParserTest, TopLevelFunctionsAndAsync) {
    auto tree = parse(R"(void main() {
  runApp(const App());
}

Future<String> load(String id) async {
  final data = await fetch(id);
  return data;
}
)");
    ASSERT_TRUE(tree);
    auto syms = symbols(tree);
    ASSERT_NE(findSymbol(syms, "main", SymbolKind::Function), nullptr);

    const auto* load = findSymbol(syms, "load", SymbolKind::Function);
    ASSERT_NE(load, nullptr);
    EXPECT_EQ(load->metadata.value("async_type", ""), "Function");

    const auto& meta = tree->root->metadata;
    EXPECT_EQ(meta["has_async"], true);
    EXPECT_GE(meta["await_count"].get<int>(), 1);
}

TEST_F(DartParserTest, AsyncKeysOmittedWhenAnalysisDisabled) {
    auto cfg = config::ParserConfig{};
    cfg.dart.enableAsyncAnalysis = false;
    DartParser plain(cfg, logger);
    auto tree = plain.parse({}, "Future<void> run() async {\n  await go();\n}\n", "a.dart");
    ASSERT_TRUE(tree);
    EXPECT_FALSE(tree.value()->root->metadata.contains("has_async"));
    EXPECT_TRUE(tree.value()->root->metadata.contains("has_error_handling"));
}

TEST_F(DartParserTest, ErrorHandlingCounts) {
    auto tree = parse(R"(void risky() {
  try {
    go();
  } catch (e) {
    rethrow;
  } finally {
    done();
  }
}
)");
    ASSERT_TRUE(tree);
    const auto& meta = tree->root->metadata;
    EXPECT_EQ(meta["has_error_handling"], true);
    EXPECT_EQ(meta["try_count"], 1);
    EXPECT_EQ(meta["catch_count"], 1);
    EXPECT_EQ(meta["finally_count"], 1);
    EXPECT_EQ(meta["rethrow_count"], 1);
}

TEST_F(DartParserTest, FailingStepIsRecordedAndOthersSurvive) {
    parser->setStepHook([](std::string_view step) {
        if (step == "extract_classes") {
            throw std::runtime_error("boom");
        }
    });
    auto tree = parse("class Lost {\n}\n\nvoid kept() {\n  print(1);\n}\n");
    ASSERT_TRUE(tree);
    ASSERT_TRUE(tree->root);

    const auto& meta = tree->root->metadata;
    EXPECT_EQ(meta["has_errors"], true);
    EXPECT_EQ(meta["error_count"], 1);
    EXPECT_EQ(meta["extraction_errors"], nlohmann::json::array({"extract_classes"}));
    EXPECT_TRUE(logger->has("error", "Node extraction step failed"));

    auto syms = symbols(tree);
    EXPECT_EQ(findSymbol(syms, "Lost", SymbolKind::Class), nullptr);
    EXPECT_NE(findSymbol(syms, "kept", SymbolKind::Function), nullptr);
}

TEST_F(DartParserTest, StrategySelection) {
    EXPECT_EQ(parser->selectStrategy(1024), ExtractionStrategy::Full);
    EXPECT_EQ(parser->selectStrategy(50 * 1024), ExtractionStrategy::Full);
    EXPECT_EQ(parser->selectStrategy(50 * 1024 + 1), ExtractionStrategy::Limited);
    EXPECT_EQ(parser->selectStrategy(200 * 1024), ExtractionStrategy::Limited);
    EXPECT_EQ(parser->selectStrategy(200 * 1024 + 1), ExtractionStrategy::Streaming);
}

TEST_F(DartParserTest, LimitedStrategyCapsClasses) {
    std::string content;
    for (int i = 0; content.size() <= 60 * 1024; ++i) {
        content += "class Model" + std::to_string(i) + " {\n  int x = 1;\n}\n";
    }
    auto tree = parse(content);
    ASSERT_TRUE(tree);
    EXPECT_EQ(tree->root->metadata["strategy"], "limited");
    auto syms = symbols(tree);
    EXPECT_EQ(countKind(syms, SymbolKind::Class), 1000u);
}

TEST_F(DartParserTest, StreamingStrategyBoundsSymbolCount) {
    std::string content;
    for (int i = 0; content.size() <= 400 * 1024; ++i) {
        content += "class Item" + std::to_string(i) + " { }\n";
    }
    auto tree = parse(content);
    ASSERT_TRUE(tree);
    EXPECT_EQ(tree->root->metadata["strategy"], "streaming");

    auto syms = symbols(tree);
    EXPECT_LE(syms.size(), static_cast<size_t>(kStreamingSymbolCap));
    EXPECT_GT(syms.size(), 5000u);

    int lineCount = core::countLines(content);
    for (const auto& s : syms) {
        ASSERT_GE(s.location.line, 1);
        ASSERT_LE(s.location.line, lineCount);
    }
    ASSERT_FALSE(syms.empty());
    EXPECT_EQ(syms.front().name, "Item0");
    EXPECT_EQ(syms.front().location.line, 1);
}

TEST_F(DartParserTest, OversizedFileRejected) {
    auto cfg = config::ParserConfig{};
    cfg.dart.maxFileSize = 16;
    DartParser small(cfg, logger);
    auto result = small.parse({}, "class TooLarge {\n}\n", "a.dart");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::Validation);
    EXPECT_NE(result.error().message.find("file too large"), std::string::npos);
}

TEST_F(DartParserTest, SymbolsAreDeterministicAndLocated) {
    auto first = parse(kStatefulPage, "lib/page.dart");
    auto second = parse(kStatefulPage, "lib/page.dart");
    ASSERT_TRUE(first && second);
    auto a = symbols(first);
    auto b = symbols(second);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_TRUE(ast::sameSymbol(a[i], b[i])) << a[i].name;
        EXPECT_EQ(a[i].location.filePath, "lib/page.dart");
        EXPECT_EQ(a[i].language, "dart");
    }
}

TEST_F(DartParserTest, RootlessAstRejected) {
    ast::AST empty;
    auto result = parser->extractSymbols(empty);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::Validation);
}
