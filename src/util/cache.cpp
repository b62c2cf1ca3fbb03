#include <kspver/cache.hpp>
#include <kspver/log.hpp>

#include <functional>

namespace kspver {

size_t StringPairHash::operator()(const std::pair<std::string, std::string>& p) const {
    size_t h1 = std::hash<std::string>{}(p.first);
    size_t h2 = std::hash<std::string>{}(p.second);
    // boost::hash_combine
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
}

VersionCache& VersionCache::shared() {
    static VersionCache instance;
    return instance;
}

std::optional<Normalized> VersionCache::find_normal(const std::string& raw) const {
    if (!enabled_) return std::nullopt;
    auto hit = normal_.find(raw);
    if (!log::enabled(log::Debug)) return hit;
    if (hit) {
        log::trace("normalize cache hit: '%s'", raw.c_str());
    } else {
        log::debug("normalize cache miss: '%s'", raw.c_str());
    }
    return hit;
}

void VersionCache::store_normal(const std::string& raw, const Normalized& n) {
    if (!enabled_) return;
    normal_.insert(raw, n);
}

std::optional<Ordering> VersionCache::find_order(const std::string& lhs,
                                                 const std::string& rhs) const {
    if (!enabled_) return std::nullopt;
    auto hit = order_.find({lhs, rhs});
    if (!log::enabled(log::Debug)) return hit;
    if (hit) {
        log::trace("compare cache hit: %s vs %s", lhs.c_str(), rhs.c_str());
    } else {
        log::debug("compare cache miss: %s vs %s", lhs.c_str(), rhs.c_str());
    }
    return hit;
}

void VersionCache::store_order(const std::string& lhs, const std::string& rhs,
                               Ordering o) {
    if (!enabled_) return;
    order_.insert({lhs, rhs}, o);
}

void VersionCache::clear() {
    normal_.clear();
    order_.clear();
}

} // namespace kspver
