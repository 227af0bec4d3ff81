#pragma once

#include <codectx/ast/ast.h>
#include <codectx/core/types.h>

#include <atomic>
#include <chrono>
#include <list>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace codectx::cache {

/**
 * @brief Cached parse result for one file
 */
struct VersionedAst {
    ast::ASTPtr ast;
    Hash hash;
    std::string version;
    std::chrono::system_clock::time_point insertTime;
};

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t expirations = 0;
    size_t size = 0;
    size_t maxSize = 0;
};

/**
 * @brief AST cache contract keyed by file path.
 *
 * Failures are reported as errors and are never fatal to a parse.
 */
class IAstCache {
public:
    virtual ~IAstCache() = default;

    // NotFound when absent, expired, or stored under another version
    virtual Result<VersionedAst> get(const std::string& key, const std::string& version) = 0;
    virtual Result<void> set(const std::string& key, VersionedAst entry) = 0;
    virtual Result<void> invalidate(const std::string& key) = 0;
    virtual Result<void> clear() = 0;
    virtual size_t size() const = 0;
    virtual CacheStats stats() const = 0;
    virtual void setMaxSize(size_t maxEntries) = 0;
    virtual void setTTL(std::chrono::milliseconds ttl) = 0;
};

/**
 * @brief Thread-safe LRU cache with per-entry TTL.
 *
 * A successful get refreshes recency. When full, the least recently used entry is
 * evicted; entries never read are ordered by insertion.
 */
class AstCache final : public IAstCache {
public:
    explicit AstCache(size_t maxEntries = 1000,
                      std::chrono::milliseconds ttl = std::chrono::hours(1));

    Result<VersionedAst> get(const std::string& key, const std::string& version) override;
    Result<void> set(const std::string& key, VersionedAst entry) override;
    Result<void> invalidate(const std::string& key) override;
    Result<void> clear() override;
    size_t size() const override;
    CacheStats stats() const override;
    void setMaxSize(size_t maxEntries) override;
    void setTTL(std::chrono::milliseconds ttl) override;

    // Drops expired entries, returning how many were removed
    size_t removeExpired();

private:
    struct CacheEntry {
        VersionedAst data;
        std::chrono::steady_clock::time_point insertedAt;
        std::list<std::string>::iterator lruPos;

        bool isExpired(std::chrono::milliseconds ttl) const {
            return (std::chrono::steady_clock::now() - insertedAt) > ttl;
        }
    };

    void moveToFront(CacheEntry& entry);
    void eraseEntry(std::unordered_map<std::string, CacheEntry>::iterator it);
    void evictLRU();

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, CacheEntry> entries_;
    std::list<std::string> lruList_; // front = most recently used
    size_t maxEntries_;
    std::chrono::milliseconds ttl_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> expirations_{0};
};

} // namespace codectx::cache
