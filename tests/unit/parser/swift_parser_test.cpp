#include "test_helpers.h"
#include <gtest/gtest.h>
#include <codectx/parser/swift/swift_extractor.h>
#include <codectx/parser/swift/swift_parser.h>

#include <stdexcept>

using namespace codectx;
using namespace codectx::parser::swift;
using namespace codectx::test;
using ast::SymbolKind;

class SwiftParserTest : public CodectxTest {
protected:
    void SetUp() override {
        CodectxTest::SetUp();
        parser = std::make_unique<SwiftParser>(config::ParserConfig{}, logger);
    }

    ast::ASTPtr parse(std::string_view content, const std::string& path = "Sources/App.swift") {
        auto tree = parser->parse({}, content, path);
        EXPECT_TRUE(tree) << tree.error().toString();
        return tree ? tree.value() : nullptr;
    }

    std::vector<ast::Symbol> symbols(const ast::ASTPtr& tree) {
        auto result = parser->extractSymbols(*tree);
        EXPECT_TRUE(result) << result.error().toString();
        return result ? result.value() : std::vector<ast::Symbol>{};
    }

    std::unique_ptr<SwiftParser> parser;
};

TEST_F(SwiftParserTest, ActorScenario) {
    auto tree = parse("actor BankAccount { private var balance: Double = 0; "
                      "func deposit(_ a: Double) { balance += a } }");
    ASSERT_TRUE(tree);
    auto syms = symbols(tree);

    const auto* account = findSymbol(syms, "BankAccount", SymbolKind::Class);
    ASSERT_NE(account, nullptr);
    EXPECT_EQ(account->metadata.value("is_actor", false), true);

    const auto* balance = findSymbol(syms, "balance", SymbolKind::Variable);
    ASSERT_NE(balance, nullptr);
    EXPECT_EQ(balance->visibility, ast::Visibility::Private);
    EXPECT_EQ(balance->metadata.value("is_stored", false), true);
    EXPECT_EQ(balance->metadata.value("parent", ""), "BankAccount");

    const auto* deposit = findSymbol(syms, "deposit", SymbolKind::Method);
    ASSERT_NE(deposit, nullptr);
    EXPECT_EQ(deposit->id, "method-Sources/App.swift-1");
    EXPECT_EQ(countKind(syms, SymbolKind::Variable), 1u);
}

TEST_F(SwiftParserTest, ProtocolWithAssociatedType) {
    auto tree = parse(R"(protocol Container {
    associatedtype Item: Equatable
    func append(_ item: Item)
    var count: Int { get }
}

extension Array: Container where Element: Equatable {
}
)");
    ASSERT_TRUE(tree);
    auto syms = symbols(tree);

    ASSERT_NE(findSymbol(syms, "Container", SymbolKind::Interface), nullptr);

    const auto* item = findSymbol(syms, "Item", SymbolKind::Type);
    ASSERT_NE(item, nullptr);
    EXPECT_EQ(item->metadata.value("constraint", ""), "Equatable");
    EXPECT_EQ(item->metadata.value("parent", ""), "Container");
    EXPECT_EQ(item->location.line, 2);

    const auto* ext = findSymbol(syms, "Array", SymbolKind::Namespace);
    ASSERT_NE(ext, nullptr);
    EXPECT_EQ(ext->metadata.value("where_clause", ""), "Element: Equatable");
    EXPECT_EQ(ext->metadata["inherits"], nlohmann::json::array({"Container"}));
}

TEST_F(SwiftParserTest, LongConformanceListIsKept) {
    auto tree = parse("class ViewController: UIViewController, UITableViewDelegate {\n}\n"
                      "extension ViewController: UITableViewDataSource, UICollectionViewDelegate "
                      "where Self: AnyObject {\n}\n");
    ASSERT_TRUE(tree);
    auto syms = symbols(tree);

    const auto* vc = findSymbol(syms, "ViewController", SymbolKind::Class);
    ASSERT_NE(vc, nullptr);
    EXPECT_EQ(vc->metadata["inherits"],
              nlohmann::json::array({"UIViewController", "UITableViewDelegate"}));

    const auto* ext = findSymbol(syms, "ViewController", SymbolKind::Namespace);
    ASSERT_NE(ext, nullptr);
    EXPECT_EQ(ext->metadata["inherits"],
              nlohmann::json::array({"UITableViewDataSource", "UICollectionViewDelegate"}));
    EXPECT_EQ(ext->metadata.value("where_clause", ""), "Self: AnyObject");
}

TEST_F(SwiftParserTest, TypesAndVisibility) {
    auto tree = parse(R"(public final class Store<T>: ObservableObject {
}
struct Point {
}
enum Direction {
    case north, south
}
fileprivate typealias Pair<A> = (A, A)
)");
    ASSERT_TRUE(tree);
    auto syms = symbols(tree);

    const auto* store = findSymbol(syms, "Store", SymbolKind::Class);
    ASSERT_NE(store, nullptr);
    EXPECT_EQ(store->visibility, ast::Visibility::Public);
    EXPECT_EQ(store->metadata["is_final"], true);
    EXPECT_EQ(store->metadata["is_generic"], true);

    const auto* point = findSymbol(syms, "Point", SymbolKind::Struct);
    ASSERT_NE(point, nullptr);
    EXPECT_FALSE(point->visibility.has_value());

    ASSERT_NE(findSymbol(syms, "Direction", SymbolKind::Enum), nullptr);

    const auto* pair = findSymbol(syms, "Pair", SymbolKind::Type);
    ASSERT_NE(pair, nullptr);
    EXPECT_EQ(pair->visibility, ast::Visibility::Private);
    EXPECT_EQ(pair->metadata["target_type"], "(A, A)");
    EXPECT_EQ(pair->metadata["is_generic"], true);
}

TEST_F(SwiftParserTest, InitializersAndDeinit) {
    auto tree = parse(R"(class Connection {
    init?(url: String) {
    }
    convenience init() {
        self.init(url: "local")!
    }
    deinit {
    }
}
)");
    ASSERT_TRUE(tree);
    auto syms = symbols(tree);
    EXPECT_EQ(countKind(syms, SymbolKind::Constructor), 2u);

    auto failable = std::find_if(syms.begin(), syms.end(), [](const ast::Symbol& s) {
        return s.kind == SymbolKind::Constructor && s.metadata.value("is_failable", false);
    });
    ASSERT_NE(failable, syms.end());
    EXPECT_EQ(failable->location.line, 2);

    auto convenience = std::find_if(syms.begin(), syms.end(), [](const ast::Symbol& s) {
        return s.kind == SymbolKind::Constructor && s.metadata.value("is_convenience", false);
    });
    ASSERT_NE(convenience, syms.end());

    const auto* deinit = findSymbol(syms, "deinit", SymbolKind::Destructor);
    ASSERT_NE(deinit, nullptr);
    EXPECT_EQ(deinit->metadata.value("parent", ""), "Connection");
}

TEST_F(SwiftParserTest, OperatorsAndSubscripts) {
    auto tree = parse(R"(infix operator <>: AdditionPrecedence

struct Vec {
    static func + (lhs: Vec, rhs: Vec) -> Vec {
        return lhs
    }
    subscript(index: Int) -> Double {
        return 0
    }
}
)");
    ASSERT_TRUE(tree);
    auto syms = symbols(tree);

    const auto* decl = findSymbol(syms, "<>", SymbolKind::Operator);
    ASSERT_NE(decl, nullptr);
    EXPECT_EQ(decl->metadata["fixity"], "infix");
    EXPECT_EQ(decl->metadata["precedence_group"], "AdditionPrecedence");

    const auto* plus = findSymbol(syms, "+", SymbolKind::Operator);
    ASSERT_NE(plus, nullptr);
    EXPECT_EQ(plus->metadata["operator_symbol"], "+");
    EXPECT_EQ(plus->metadata["is_static"], true);

    const auto* sub = findSymbol(syms, "subscript", SymbolKind::Operator);
    ASSERT_NE(sub, nullptr);
    EXPECT_EQ(sub->metadata["return_type"], "Double");

    const auto& meta = tree->root->metadata;
    EXPECT_EQ(meta["has_operators"], true);
    EXPECT_EQ(meta["operator_declaration_count"], 1);
    EXPECT_EQ(meta["has_subscripts"], true);
}

TEST_F(SwiftParserTest, SwiftUIViewProperties) {
    auto tree = parse(R"(import SwiftUI
import Combine

struct CounterView: View {
    @State private var count = 0
    @Binding var title: String
    let step: Int = 1

    var body: some View {
        Button("Add") {
            let next = count + step
            count = next
        }
    }
}
)");
    ASSERT_TRUE(tree);
    auto syms = symbols(tree);

    const auto* count = findSymbol(syms, "count", SymbolKind::Variable);
    ASSERT_NE(count, nullptr);
    EXPECT_EQ(count->metadata["wrapper"], "@State");
    EXPECT_EQ(count->metadata["is_wrapped"], true);
    EXPECT_EQ(count->metadata["is_stored"], true);
    EXPECT_EQ(count->visibility, ast::Visibility::Private);

    const auto* title = findSymbol(syms, "title", SymbolKind::Variable);
    ASSERT_NE(title, nullptr);
    EXPECT_EQ(title->metadata["wrapper"], "@Binding");
    EXPECT_EQ(title->metadata["declared_type"], "String");

    const auto* step = findSymbol(syms, "step", SymbolKind::Variable);
    ASSERT_NE(step, nullptr);
    EXPECT_EQ(step->metadata["is_constant"], true);

    const auto* body = findSymbol(syms, "body", SymbolKind::Variable);
    ASSERT_NE(body, nullptr);
    EXPECT_EQ(body->metadata["is_computed"], true);
    EXPECT_EQ(body->metadata["declared_type"], "some View");

    EXPECT_EQ(findSymbol(syms, "next", SymbolKind::Variable), nullptr);
    EXPECT_EQ(countKind(syms, SymbolKind::Import), 2u);

    const auto& meta = tree->root->metadata;
    EXPECT_EQ(meta["has_swiftui"], true);
    EXPECT_EQ(meta["has_combine"], true);
    EXPECT_EQ(meta["has_foundation"], true);
    EXPECT_EQ(meta["primary_framework"], "swiftui");
}

TEST_F(SwiftParserTest, NoImportsMeansNoFramework) {
    auto tree = parse("struct Plain {\n}\n");
    ASSERT_TRUE(tree);
    EXPECT_EQ(tree->root->metadata["primary_framework"], "none");
    EXPECT_EQ(tree->root->metadata["has_foundation"], false);
}

TEST_F(SwiftParserTest, LocalsInsideFunctionsAreSkipped) {
    auto tree = parse(R"(let globalLimit = 10

func compute() -> Int {
    let local = 5
    var other = local * 2
    return other
}
)");
    ASSERT_TRUE(tree);
    auto syms = symbols(tree);
    ASSERT_NE(findSymbol(syms, "globalLimit", SymbolKind::Variable), nullptr);
    EXPECT_EQ(findSymbol(syms, "local", SymbolKind::Variable), nullptr);
    EXPECT_EQ(findSymbol(syms, "other", SymbolKind::Variable), nullptr);

    const auto* compute = findSymbol(syms, "compute", SymbolKind::Function);
    ASSERT_NE(compute, nullptr);
    EXPECT_EQ(compute->metadata["return_type"], "Int");
    EXPECT_FALSE(compute->visibility.has_value());
}

TEST_F(SwiftParserTest, CommentsAndStringsAreIgnored) {
    auto tree = parse(R"(// class Ghost {}
/* struct Phantom {
   /* nested */ func spooky() {}
} */
let message = "class Fake { func nope() {} }"
class Real {
}
)");
    ASSERT_TRUE(tree);
    auto syms = symbols(tree);
    EXPECT_EQ(findSymbol(syms, "Ghost", SymbolKind::Class), nullptr);
    EXPECT_EQ(findSymbol(syms, "Phantom", SymbolKind::Struct), nullptr);
    EXPECT_EQ(findSymbol(syms, "spooky", SymbolKind::Function), nullptr);
    EXPECT_EQ(findSymbol(syms, "Fake", SymbolKind::Class), nullptr);
    EXPECT_EQ(findSymbol(syms, "nope", SymbolKind::Method), nullptr);

    const auto* real = findSymbol(syms, "Real", SymbolKind::Class);
    ASSERT_NE(real, nullptr);
    EXPECT_EQ(real->location.line, 6);
}

TEST_F(SwiftParserTest, AsyncFunctionsAndAwait) {
    auto tree = parse(R"(func load(id: String) async throws -> Data {
    let data = try await fetch(id)
    for try await line in stream {
    }
    return data
}
)");
    ASSERT_TRUE(tree);
    auto syms = symbols(tree);

    const auto* load = findSymbol(syms, "load", SymbolKind::Function);
    ASSERT_NE(load, nullptr);
    EXPECT_EQ(load->metadata["is_async"], true);
    EXPECT_EQ(load->metadata["is_throwing"], true);
    EXPECT_EQ(load->metadata["return_type"], "Data");

    const auto& meta = tree->root->metadata;
    EXPECT_EQ(meta["has_async_await"], true);
    EXPECT_EQ(meta["async_function_count"], 1);
    EXPECT_EQ(meta["await_call_count"], 2);
    EXPECT_EQ(meta["has_async_sequences"], true);
}

TEST_F(SwiftParserTest, ControlFlowAndOptionals) {
    auto tree = parse(R"(func check(value: Int?) {
    guard let v = value else {
        return
    }
    defer {
        print(v)
    }
    let name = user?.name ?? "anon"
}
)");
    ASSERT_TRUE(tree);
    const auto& meta = tree->root->metadata;
    EXPECT_EQ(meta["has_control_flow"], true);
    EXPECT_EQ(meta["guard_statement_count"], 1);
    EXPECT_EQ(meta["defer_statement_count"], 1);
    EXPECT_EQ(meta["has_optionals"], true);
    EXPECT_EQ(meta["optional_binding_count"], 1);
    EXPECT_EQ(meta["nil_coalescing_count"], 1);
    EXPECT_GE(meta["optional_chaining_count"].get<int>(), 1);
}

TEST_F(SwiftParserTest, MacrosAndResultBuilders) {
    auto tree = parse(R"(@freestanding(expression)
public macro stringify<T>(_ value: T) -> (T, String) = #externalMacro(module: "M", type: "S")

@resultBuilder
struct HTMLBuilder {
}

let pair = #stringify(1 + 2)
)");
    ASSERT_TRUE(tree);
    const auto& meta = tree->root->metadata;
    EXPECT_EQ(meta["has_macros"], true);
    EXPECT_EQ(meta["macro_declaration_count"], 1);
    EXPECT_EQ(meta["macro_usage_count"], 2);
    EXPECT_EQ(meta["has_result_builders"], true);
    EXPECT_EQ(meta["result_builder_count"], 1);
}

TEST_F(SwiftParserTest, ImportsListModulesAndPaths) {
    auto tree = parse("import Foundation\n@testable import App\nimport struct Swift.Array\n");
    ASSERT_TRUE(tree);
    auto imports = parser->extractImports(*tree);
    ASSERT_EQ(imports.size(), 3u);
    EXPECT_EQ(imports[0].path, "Foundation");
    EXPECT_EQ(imports[1].path, "App");
    EXPECT_EQ(imports[2].path, "Swift.Array");
    EXPECT_EQ(imports[2].line, 3);
    EXPECT_EQ(tree->root->children[2].metadata["import_kind"], "struct");
}

TEST_F(SwiftParserTest, FailingStepIsRecorded) {
    parser->setStepHook([](std::string_view step) {
        if (step == "extract_types") {
            throw std::runtime_error("boom");
        }
    });
    auto tree = parse("class Lost {\n}\nfunc kept() {\n}\n");
    ASSERT_TRUE(tree);

    const auto& meta = tree->root->metadata;
    EXPECT_EQ(meta["has_errors"], true);
    EXPECT_EQ(meta["error_count"], 1);
    EXPECT_EQ(meta["extraction_errors"], nlohmann::json::array({"extract_types"}));
    EXPECT_TRUE(logger->has("error", "Swift extraction step failed"));

    auto syms = symbols(tree);
    EXPECT_EQ(findSymbol(syms, "Lost", SymbolKind::Class), nullptr);
    EXPECT_NE(findSymbol(syms, "kept", SymbolKind::Function), nullptr);
}

TEST_F(SwiftParserTest, NodeCountCappedByMaxSymbols) {
    auto cfg = config::ParserConfig{};
    cfg.performance.maxSymbols = 3;
    SwiftParser capped(cfg, logger);

    std::string content;
    for (int i = 0; i < 10; ++i) {
        content += "struct S" + std::to_string(i) + " {\n}\n";
    }
    auto tree = capped.parse({}, content, "Many.swift");
    ASSERT_TRUE(tree);
    EXPECT_EQ(tree.value()->root->children.size(), 3u);
    EXPECT_EQ(tree.value()->root->metadata["truncated"], true);
    EXPECT_EQ(tree.value()->root->children[0].children.front().value, "S0");
    EXPECT_TRUE(logger->has("warn", "Swift node limit reached"));
}

TEST_F(SwiftParserTest, SymbolsStayInsideTheFile) {
    const std::string content = R"(import Foundation

class Account {
    var balance: Double = 0
    func deposit(_ amount: Double) {
        balance += amount
    }
}
)";
    auto tree = parse(content, "Sources/Bank/Account.swift");
    ASSERT_TRUE(tree);
    int lines = core::countLines(content);
    for (const auto& s : symbols(tree)) {
        EXPECT_EQ(s.location.filePath, "Sources/Bank/Account.swift");
        EXPECT_GE(s.location.line, 1);
        EXPECT_LE(s.location.line, lines);
        EXPECT_EQ(s.language, "swift");
    }
}

TEST(SwiftSourceTest, BlanksCommentsAndStringsKeepingOffsets) {
    std::string text = "let a = \"{x}\" // {\nvar b = 1\n";
    SwiftSource source(text);
    ASSERT_EQ(source.code().size(), text.size());
    EXPECT_EQ(source.code().find('{'), std::string_view::npos);
    EXPECT_EQ(source.lineAt(text.find("var")), 2);
    EXPECT_EQ(source.code().substr(text.find("var"), 9), "var b = 1");
}

TEST(SwiftSourceTest, BraceDepthAndMatching) {
    std::string text = "class A {\n  func f() {\n  }\n}\n";
    SwiftSource source(text);
    size_t outer = text.find('{');
    size_t inner = text.find('{', outer + 1);
    EXPECT_EQ(source.depthAt(outer), 0);
    EXPECT_EQ(source.depthAt(inner), 1);
    EXPECT_EQ(source.closingBrace(outer), text.rfind('}'));
    EXPECT_EQ(source.closingBrace(inner), text.find('}'));
}
