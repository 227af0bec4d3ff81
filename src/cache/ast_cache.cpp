#include <codectx/cache/ast_cache.h>

#include <mutex>

namespace codectx::cache {

AstCache::AstCache(size_t maxEntries, std::chrono::milliseconds ttl)
    : maxEntries_(maxEntries == 0 ? 1 : maxEntries), ttl_(ttl) {}

Result<VersionedAst> AstCache::get(const std::string& key, const std::string& version) {
    // Exclusive: a hit reorders the LRU list
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        misses_.fetch_add(1);
        return Error{ErrorCode::NotFound, fmt::format("no cache entry for '{}'", key)};
    }

    if (it->second.isExpired(ttl_)) {
        eraseEntry(it);
        expirations_.fetch_add(1);
        misses_.fetch_add(1);
        return Error{ErrorCode::NotFound, fmt::format("cache entry for '{}' expired", key)};
    }

    if (it->second.data.version != version) {
        misses_.fetch_add(1);
        return Error{ErrorCode::NotFound,
                     fmt::format("cache entry for '{}' has version {}, wanted {}", key,
                                 it->second.data.version, version)};
    }

    moveToFront(it->second);
    hits_.fetch_add(1);
    return it->second.data;
}

Result<void> AstCache::set(const std::string& key, VersionedAst entry) {
    if (!entry.ast) {
        return Error{ErrorCode::Cache, "refusing to cache a null AST"};
    }
    if (entry.insertTime == std::chrono::system_clock::time_point{}) {
        entry.insertTime = std::chrono::system_clock::now();
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second.data = std::move(entry);
        it->second.insertedAt = std::chrono::steady_clock::now();
        moveToFront(it->second);
        return Result<void>();
    }

    while (entries_.size() >= maxEntries_) {
        evictLRU();
    }

    lruList_.push_front(key);
    CacheEntry fresh{std::move(entry), std::chrono::steady_clock::now(), lruList_.begin()};
    entries_.emplace(key, std::move(fresh));
    return Result<void>();
}

Result<void> AstCache::invalidate(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        eraseEntry(it);
    }
    return Result<void>();
}

Result<void> AstCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.clear();
    lruList_.clear();
    return Result<void>();
}

size_t AstCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

CacheStats AstCache::stats() const {
    CacheStats out;
    out.hits = hits_.load();
    out.misses = misses_.load();
    out.evictions = evictions_.load();
    out.expirations = expirations_.load();

    std::shared_lock<std::shared_mutex> lock(mutex_);
    out.size = entries_.size();
    out.maxSize = maxEntries_;
    return out;
}

void AstCache::setMaxSize(size_t maxEntries) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    maxEntries_ = maxEntries == 0 ? 1 : maxEntries;
    while (entries_.size() > maxEntries_) {
        evictLRU();
    }
}

void AstCache::setTTL(std::chrono::milliseconds ttl) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    ttl_ = ttl;
}

size_t AstCache::removeExpired() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t count = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.isExpired(ttl_)) {
            lruList_.erase(it->second.lruPos);
            it = entries_.erase(it);
            ++count;
        } else {
            ++it;
        }
    }
    expirations_.fetch_add(count);
    return count;
}

void AstCache::moveToFront(CacheEntry& entry) {
    lruList_.splice(lruList_.begin(), lruList_, entry.lruPos);
    entry.lruPos = lruList_.begin();
}

void AstCache::eraseEntry(std::unordered_map<std::string, CacheEntry>::iterator it) {
    lruList_.erase(it->second.lruPos);
    entries_.erase(it);
}

void AstCache::evictLRU() {
    if (lruList_.empty()) {
        return;
    }
    auto it = entries_.find(lruList_.back());
    if (it != entries_.end()) {
        eraseEntry(it);
    } else {
        lruList_.pop_back();
    }
    evictions_.fetch_add(1);
}

} // namespace codectx::cache
