#include "test_helpers.h"
#include <gtest/gtest.h>
#include <codectx/core/text.h>
#include <codectx/crypto/hasher.h>
#include <codectx/parser/parser_manager.h>

#include <atomic>

using namespace codectx;
using namespace codectx::parser;
using namespace codectx::test;

namespace {

// Counts calls and returns a one-node AST
class CountingParser final : public ILanguageParser {
public:
    explicit CountingParser(std::shared_ptr<std::atomic<int>> calls) : calls_(std::move(calls)) {}

    std::string_view language() const override { return "dart"; }

    Result<ast::ASTPtr> parse(const core::ParseContext&, std::string_view content,
                              const std::string& filePath) override {
        calls_->fetch_add(1);
        auto tree = std::make_shared<ast::AST>();
        tree->language = "dart";
        tree->content = std::string(content);
        tree->hash = crypto::SHA256Hasher::hashText(content);
        tree->version = kAstCacheVersion;
        tree->filePath = filePath;
        tree->root = std::make_unique<ast::ASTNode>();
        tree->root->id = "root";
        tree->root->type = "compilation_unit";
        return tree;
    }

    Result<std::vector<ast::Symbol>> extractSymbols(const ast::AST& tree) const override {
        ast::Symbol s;
        s.name = "Stub";
        s.kind = ast::SymbolKind::Class;
        s.location.filePath = tree.filePath;
        return std::vector<ast::Symbol>{s};
    }

    std::vector<ast::Import> extractImports(const ast::AST&) const override { return {}; }

private:
    std::shared_ptr<std::atomic<int>> calls_;
};

// Cache whose writes always fail
class FailingCache final : public cache::IAstCache {
public:
    Result<cache::VersionedAst> get(const std::string&, const std::string&) override {
        return Error{ErrorCode::NotFound, "empty"};
    }
    Result<void> set(const std::string&, cache::VersionedAst) override {
        return Error{ErrorCode::Cache, "store unavailable"};
    }
    Result<void> invalidate(const std::string&) override { return Result<void>(); }
    Result<void> clear() override { return Result<void>(); }
    size_t size() const override { return 0; }
    cache::CacheStats stats() const override { return {}; }
    void setMaxSize(size_t) override {}
    void setTTL(std::chrono::milliseconds) override {}
};

const LanguageDescriptor& language(std::string_view name) {
    for (const auto& lang : builtinLanguages()) {
        if (lang.name == name) {
            return lang;
        }
    }
    throw std::invalid_argument("unknown language");
}

} // namespace

class ParserManagerTest : public CodectxTest {
protected:
    void SetUp() override {
        CodectxTest::SetUp();
        cache = std::make_shared<cache::AstCache>(100, std::chrono::hours(1));
        manager = std::make_unique<ParserManager>(config::ParserConfig{}, logger, cache);
        calls = std::make_shared<std::atomic<int>>(0);
    }

    void useCountingDart() {
        ASSERT_TRUE(manager->registerParser("dart", std::make_unique<CountingParser>(calls)));
    }

    std::shared_ptr<cache::AstCache> cache;
    std::unique_ptr<ParserManager> manager;
    std::shared_ptr<std::atomic<int>> calls;
};

TEST_F(ParserManagerTest, LogsInitialization) {
    auto records = logger->records();
    auto it = std::find_if(records.begin(), records.end(), [](const LogRecord& r) {
        return r.message == "parser manager initialized";
    });
    ASSERT_NE(it, records.end());
    EXPECT_EQ(it->level, "info");
    ASSERT_EQ(it->fields.size(), 2u);
    EXPECT_EQ(it->fields[0].key, "languages_count");
    EXPECT_EQ(it->fields[0].value, 3);
    EXPECT_EQ(it->fields[1].key, "cache_enabled");
    EXPECT_EQ(it->fields[1].value, true);
}

TEST_F(ParserManagerTest, SupportedLanguages) {
    const auto& langs = manager->supportedLanguages();
    ASSERT_EQ(langs.size(), 3u);
    EXPECT_EQ(manager->classify("a.swift").value().language.name, "swift");
    EXPECT_EQ(manager->classify("a.rs").error().code, ErrorCode::UnsupportedLanguage);
}

TEST_F(ParserManagerTest, SecondParseWithSameContentHitsCache) {
    useCountingDart();
    core::ParseContext ctx;
    const std::string content = "class A {}";

    auto first = manager->parse(ctx, content, language("dart"), "lib/a.dart");
    ASSERT_TRUE(first) << first.error().toString();
    EXPECT_EQ(calls->load(), 1);

    auto cached = cache->get("lib/a.dart", kAstCacheVersion);
    ASSERT_TRUE(cached);
    EXPECT_EQ(cached.value().hash, crypto::SHA256Hasher::hashText(content));

    auto second = manager->parse(ctx, content, language("dart"), "lib/a.dart");
    ASSERT_TRUE(second);
    EXPECT_EQ(calls->load(), 1);
    EXPECT_EQ(second.value(), first.value());
    EXPECT_GE(manager->cacheStats().hits, 2u);
}

TEST_F(ParserManagerTest, ChangedContentReparses) {
    useCountingDart();
    core::ParseContext ctx;
    ASSERT_TRUE(manager->parse(ctx, "class A {}", language("dart"), "lib/a.dart"));
    ASSERT_TRUE(manager->parse(ctx, "class B {}", language("dart"), "lib/a.dart"));
    EXPECT_EQ(calls->load(), 2);
    EXPECT_EQ(cache->get("lib/a.dart", kAstCacheVersion).value().hash,
              crypto::SHA256Hasher::hashText("class B {}"));
}

TEST_F(ParserManagerTest, CacheKeyIsTheCleanedPath) {
    useCountingDart();
    core::ParseContext ctx;
    ASSERT_TRUE(manager->parse(ctx, "class A {}", language("dart"), "lib/./a.dart"));
    ASSERT_TRUE(manager->parse(ctx, "class A {}", language("dart"), "lib/a.dart"));
    EXPECT_EQ(calls->load(), 1);
}

TEST_F(ParserManagerTest, PathTraversalRejectedBeforeAnyWork) {
    useCountingDart();
    auto before = cache->stats();

    auto result =
        manager->parse(core::ParseContext{}, "class A {}", language("dart"), "../../../etc/passwd");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidFilePath);
    EXPECT_EQ(result.error().message, "path traversal detected");
    EXPECT_EQ(calls->load(), 0);

    auto after = cache->stats();
    EXPECT_EQ(after.size, before.size);
    EXPECT_EQ(after.hits, before.hits);
    EXPECT_EQ(after.misses, before.misses);
}

TEST_F(ParserManagerTest, NullByteAndLongPathsRejected) {
    useCountingDart();
    std::string withNul = std::string("lib/a") + '\0' + ".dart";
    EXPECT_EQ(manager->parse({}, "x", language("dart"), withNul).error().code,
              ErrorCode::InvalidFilePath);
    EXPECT_EQ(manager->parse({}, "x", language("dart"), std::string(5000, 'a')).error().code,
              ErrorCode::InvalidFilePath);
    EXPECT_EQ(calls->load(), 0);
    EXPECT_EQ(cache->size(), 0u);
}

TEST_F(ParserManagerTest, EmptyPathIsParsedButNotCached) {
    useCountingDart();
    ASSERT_TRUE(manager->parse({}, "class A {}", language("dart"), ""));
    ASSERT_TRUE(manager->parse({}, "class A {}", language("dart"), ""));
    EXPECT_EQ(calls->load(), 2);
    EXPECT_EQ(cache->size(), 0u);
}

TEST_F(ParserManagerTest, UnknownLanguageFails) {
    LanguageDescriptor kotlin{"kotlin", "Kotlin", {".kt"}};
    auto result = manager->parse({}, "fun main() {}", kotlin, "Main.kt");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::UnsupportedLanguage);
}

TEST_F(ParserManagerTest, CachingDisabledAlwaysParses) {
    auto cfg = config::ParserConfig{};
    cfg.performance.enableCaching = false;
    ParserManager uncached(cfg, logger, cache);
    ASSERT_TRUE(uncached.registerParser("dart", std::make_unique<CountingParser>(calls)));

    ASSERT_TRUE(uncached.parse({}, "class A {}", language("dart"), "lib/a.dart"));
    ASSERT_TRUE(uncached.parse({}, "class A {}", language("dart"), "lib/a.dart"));
    EXPECT_EQ(calls->load(), 2);
    EXPECT_EQ(cache->size(), 0u);
}

TEST_F(ParserManagerTest, CacheWriteFailureIsRecordedNotPropagated) {
    ParserManager failing(config::ParserConfig{}, logger, std::make_shared<FailingCache>());
    auto result = failing.parse({}, "class A {}", language("dart"), "lib/a.dart");
    ASSERT_TRUE(result) << result.error().toString();
    ASSERT_TRUE(result.value()->root);
    auto cacheError = result.value()->root->metadata.value("cache_error", std::string{});
    EXPECT_NE(cacheError.find("store unavailable"), std::string::npos);
    EXPECT_TRUE(logger->has("warn", "failed to cache AST"));
}

TEST_F(ParserManagerTest, ExtractSymbolsValidatesInput) {
    auto nullTree = manager->extractSymbols(nullptr);
    ASSERT_FALSE(nullTree);
    EXPECT_EQ(nullTree.error().code, ErrorCode::Validation);

    auto rootless = std::make_shared<ast::AST>();
    rootless->language = "dart";
    auto noRoot = manager->extractSymbols(rootless);
    ASSERT_FALSE(noRoot);
    EXPECT_EQ(noRoot.error().code, ErrorCode::Validation);
}

TEST_F(ParserManagerTest, ExtractSymbolsDispatchesByAstLanguage) {
    useCountingDart();
    auto tree = manager->parse({}, "class A {}", language("dart"), "lib/a.dart");
    ASSERT_TRUE(tree);
    auto symbols = manager->extractSymbols(tree.value());
    ASSERT_TRUE(symbols);
    ASSERT_EQ(symbols.value().size(), 1u);
    EXPECT_EQ(symbols.value()[0].name, "Stub");
}

TEST_F(ParserManagerTest, RegisterParserRejectsNull) {
    EXPECT_FALSE(manager->registerParser("dart", nullptr));
    EXPECT_FALSE(manager->registerParser("", std::make_unique<CountingParser>(calls)));
}

TEST_F(ParserManagerTest, DartEndToEnd) {
    const std::string content = R"(import 'package:flutter/material.dart';
import 'utils.dart' as utils;

class Counter {
  int value = 0;

  void increment() {
    value++;
  }
}
)";
    auto tree = manager->parseFile({}, content, "lib/counter.dart");
    ASSERT_TRUE(tree) << tree.error().toString();
    EXPECT_EQ(tree.value()->language, "dart");

    auto symbols = manager->extractSymbols(tree.value());
    ASSERT_TRUE(symbols);
    EXPECT_NE(findSymbol(symbols.value(), "Counter", ast::SymbolKind::Class), nullptr);
    for (const auto& s : symbols.value()) {
        EXPECT_EQ(s.location.filePath, "lib/counter.dart");
        EXPECT_GE(s.location.line, 1);
        EXPECT_LE(s.location.line, core::countLines(content));
    }

    auto imports = manager->extractImports(tree.value());
    ASSERT_TRUE(imports);
    ASSERT_EQ(imports.value().size(), 2u);
    EXPECT_EQ(imports.value()[0].path, "package:flutter/material.dart");
    EXPECT_EQ(imports.value()[1].path, "utils.dart");
    EXPECT_EQ(imports.value()[1].alias, "utils");
    EXPECT_EQ(imports.value()[1].line, 2);
}

TEST_F(ParserManagerTest, SwiftEndToEndIsIdempotent) {
    const std::string content = R"(import Foundation

struct Point {
    var x: Double
    var y: Double

    func length() -> Double {
        return (x * x + y * y).squareRoot()
    }
}
)";
    auto cfg = config::ParserConfig::forTesting();
    ParserManager uncached(cfg, logger);

    auto first = uncached.parseFile({}, content, "Sources/Point.swift");
    auto second = uncached.parseFile({}, content, "Sources/Point.swift");
    ASSERT_TRUE(first) << first.error().toString();
    ASSERT_TRUE(second);
    EXPECT_NE(first.value(), second.value());
    EXPECT_EQ(*first.value()->root, *second.value()->root);

    auto a = uncached.extractSymbols(first.value());
    auto b = uncached.extractSymbols(second.value());
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    ASSERT_EQ(a.value().size(), b.value().size());
    for (size_t i = 0; i < a.value().size(); ++i) {
        EXPECT_TRUE(ast::sameSymbol(a.value()[i], b.value()[i])) << a.value()[i].name;
    }

    auto imports = uncached.extractImports(first.value());
    ASSERT_TRUE(imports);
    ASSERT_EQ(imports.value().size(), 1u);
    EXPECT_EQ(imports.value()[0].path, "Foundation");
}
