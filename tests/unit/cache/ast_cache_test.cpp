#include <gtest/gtest.h>
#include <codectx/cache/ast_cache.h>

#include <thread>
#include <vector>

using namespace codectx;
using namespace codectx::cache;
using namespace std::chrono_literals;

class AstCacheTest : public ::testing::Test {
protected:
    static VersionedAst entry(const std::string& hash, const std::string& version = "1.0") {
        auto tree = std::make_shared<ast::AST>();
        tree->hash = hash;
        tree->root = std::make_unique<ast::ASTNode>();
        return VersionedAst{tree, hash, version, std::chrono::system_clock::now()};
    }
};

TEST_F(AstCacheTest, SetThenGet) {
    AstCache cache(10, 1h);
    ASSERT_TRUE(cache.set("a.dart", entry("h1")));

    auto hit = cache.get("a.dart", "1.0");
    ASSERT_TRUE(hit);
    EXPECT_EQ(hit.value().hash, "h1");
    EXPECT_EQ(cache.size(), 1u);

    auto stats = cache.stats();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 0u);
    EXPECT_EQ(stats.maxSize, 10u);
}

TEST_F(AstCacheTest, MissAndVersionMismatchAreNotFound) {
    AstCache cache(10, 1h);
    auto missing = cache.get("nope.cpp", "1.0");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    ASSERT_TRUE(cache.set("a.cpp", entry("h1", "0.9")));
    auto stale = cache.get("a.cpp", "1.0");
    ASSERT_FALSE(stale);
    EXPECT_EQ(stale.error().code, ErrorCode::NotFound);
    EXPECT_EQ(cache.stats().misses, 2u);
}

TEST_F(AstCacheTest, NullAstIsRejected) {
    AstCache cache;
    auto stored = cache.set("a.cpp", VersionedAst{nullptr, "h", "1.0", {}});
    ASSERT_FALSE(stored);
    EXPECT_EQ(stored.error().code, ErrorCode::Cache);
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(AstCacheTest, LeastRecentlyUsedIsEvicted) {
    AstCache cache(2, 1h);
    ASSERT_TRUE(cache.set("a", entry("ha")));
    ASSERT_TRUE(cache.set("b", entry("hb")));
    ASSERT_TRUE(cache.get("a", "1.0"));
    ASSERT_TRUE(cache.set("c", entry("hc")));

    EXPECT_TRUE(cache.get("a", "1.0"));
    EXPECT_FALSE(cache.get("b", "1.0"));
    EXPECT_TRUE(cache.get("c", "1.0"));
    EXPECT_EQ(cache.stats().evictions, 1u);
}

TEST_F(AstCacheTest, ReplacingKeyDoesNotEvict) {
    AstCache cache(2, 1h);
    ASSERT_TRUE(cache.set("a", entry("h1")));
    ASSERT_TRUE(cache.set("b", entry("hb")));
    ASSERT_TRUE(cache.set("a", entry("h2")));

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.get("a", "1.0").value().hash, "h2");
    EXPECT_EQ(cache.stats().evictions, 0u);
}

TEST_F(AstCacheTest, ExpiredEntryIsRemovedOnAccess) {
    AstCache cache(10, 1ms);
    ASSERT_TRUE(cache.set("a", entry("h")));
    std::this_thread::sleep_for(5ms);

    auto expired = cache.get("a", "1.0");
    ASSERT_FALSE(expired);
    EXPECT_EQ(expired.error().code, ErrorCode::NotFound);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.stats().expirations, 1u);
}

TEST_F(AstCacheTest, RemoveExpiredAndSetTTL) {
    AstCache cache(10, 1h);
    ASSERT_TRUE(cache.set("a", entry("h")));
    ASSERT_TRUE(cache.set("b", entry("h")));
    EXPECT_EQ(cache.removeExpired(), 0u);

    cache.setTTL(1ms);
    std::this_thread::sleep_for(5ms);
    EXPECT_EQ(cache.removeExpired(), 2u);
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(AstCacheTest, ShrinkingEvicts) {
    AstCache cache(5, 1h);
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(cache.set("k" + std::to_string(i), entry("h")));
    }
    cache.setMaxSize(2);
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_TRUE(cache.get("k4", "1.0"));
    EXPECT_TRUE(cache.get("k3", "1.0"));
    EXPECT_FALSE(cache.get("k0", "1.0"));
}

TEST_F(AstCacheTest, InvalidateAndClear) {
    AstCache cache;
    ASSERT_TRUE(cache.set("a", entry("h")));
    ASSERT_TRUE(cache.set("b", entry("h")));

    EXPECT_TRUE(cache.invalidate("a"));
    EXPECT_TRUE(cache.invalidate("missing"));
    EXPECT_EQ(cache.size(), 1u);

    EXPECT_TRUE(cache.clear());
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(AstCacheTest, ConcurrentAccess) {
    AstCache cache(64, 1h);
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&cache, t] {
            for (int i = 0; i < 200; ++i) {
                auto key = "file" + std::to_string((t * 7 + i) % 100);
                if (i % 3 == 0) {
                    (void)cache.set(key, entry("h"));
                } else if (i % 3 == 1) {
                    (void)cache.get(key, "1.0");
                } else {
                    (void)cache.invalidate(key);
                }
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    EXPECT_LE(cache.size(), 64u);
}
