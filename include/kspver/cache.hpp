#pragma once

#include <kspver/normalize.hpp>
#include <kspver/ordering.hpp>

#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace kspver {

struct CacheStats {
    size_t hits = 0;
    size_t misses = 0;
    size_t entries = 0;
};

// Mutex-guarded memo table. Entries are never evicted; the first value
// stored for a key wins.
template<typename K, typename V, typename Hash = std::hash<K>>
class MemoCache {
public:
    std::optional<V> find(const K& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) {
            ++misses_;
            return std::nullopt;
        }
        ++hits_;
        return it->second;
    }

    void insert(const K& key, V value) {
        std::lock_guard<std::mutex> lock(mutex_);
        map_.emplace(key, std::move(value));
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        map_.clear();
        hits_ = 0;
        misses_ = 0;
    }

    CacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        CacheStats s;
        s.hits = hits_;
        s.misses = misses_;
        s.entries = map_.size();
        return s;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<K, V, Hash> map_;
    mutable size_t hits_ = 0;
    mutable size_t misses_ = 0;
};

struct StringPairHash {
    size_t operator()(const std::pair<std::string, std::string>& p) const;
};

// Memoizes normalization (keyed by raw input) and comparison (keyed by the
// ordered pair of canonical strings, not symmetrized).
//
// A disabled cache misses every lookup and stores nothing.
class VersionCache {
public:
    VersionCache() = default;
    VersionCache(const VersionCache&) = delete;
    VersionCache& operator=(const VersionCache&) = delete;

    // Process-wide instance used when no cache is passed explicitly
    static VersionCache& shared();

    void set_enabled(bool enabled) { enabled_ = enabled; }
    bool enabled() const { return enabled_; }

    std::optional<Normalized> find_normal(const std::string& raw) const;
    void store_normal(const std::string& raw, const Normalized& n);

    std::optional<Ordering> find_order(const std::string& lhs,
                                       const std::string& rhs) const;
    void store_order(const std::string& lhs, const std::string& rhs, Ordering o);

    CacheStats normal_stats() const { return normal_.stats(); }
    CacheStats order_stats() const { return order_.stats(); }

    void clear();

private:
    std::atomic<bool> enabled_{true};
    MemoCache<std::string, Normalized> normal_;
    MemoCache<std::pair<std::string, std::string>, Ordering, StringPairHash> order_;
};

} // namespace kspver
