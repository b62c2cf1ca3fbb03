#include <kspver/version.hpp>
#include <kspver/cache.hpp>
#include <kspver/normalize.hpp>

#include <algorithm>

namespace kspver {

const char* ordering_name(Ordering o) {
    switch (o) {
        case Ordering::Less:    return "less";
        case Ordering::Equal:   return "equal";
        case Ordering::Greater: return "greater";
    }
    return "unknown";
}

static KspVerError incomparable(const GameVersion& a, const GameVersion& b,
                                const char* operation) {
    return KspVerError{KspVerError::Incomparable,
        a.to_string() + " and " + b.to_string() +
            " cannot be compared by " + operation,
        "only long versions (major.minor.patch) are ordered; "
        "widen short versions with to_long_min() or to_long_max()"};
}

// Numeric comparison of two digit runs of any length
static Ordering compare_digits(const std::string& a, const std::string& b) {
    size_t za = std::min(a.find_first_not_of('0'), a.size());
    size_t zb = std::min(b.find_first_not_of('0'), b.size());
    size_t la = a.size() - za;
    size_t lb = b.size() - zb;
    if (la != lb) return la < lb ? Ordering::Less : Ordering::Greater;
    int c = a.compare(za, la, b, zb, lb);
    if (c == 0) return Ordering::Equal;
    return c < 0 ? Ordering::Less : Ordering::Greater;
}

static Ordering compare_components(const std::vector<std::string>& a,
                                   const std::vector<std::string>& b) {
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        Ordering o = compare_digits(a[i], b[i]);
        if (o != Ordering::Equal) return o;
    }
    // 1.2.3 < 1.2.3.0
    if (a.size() == b.size()) return Ordering::Equal;
    return a.size() < b.size() ? Ordering::Less : Ordering::Greater;
}

// ---------------------------------------------------------------------------
// GameVersion
// ---------------------------------------------------------------------------

GameVersion::GameVersion(std::optional<std::string> version, bool is_short)
    : version_(std::move(version)),
      is_short_(version_.has_value() && is_short),
      components_(std::make_shared<Components>()) {}

Result<GameVersion> GameVersion::parse(const std::string& s) {
    return parse_opt(s, VersionCache::shared());
}

Result<GameVersion> GameVersion::parse(const std::string& s, VersionCache& cache) {
    return parse_opt(s, cache);
}

Result<GameVersion> GameVersion::parse_opt(const std::optional<std::string>& s) {
    return parse_opt(s, VersionCache::shared());
}

Result<GameVersion> GameVersion::parse_opt(const std::optional<std::string>& s,
                                           VersionCache& cache) {
    auto n = normalize(s, cache);
    if (n.is_err()) return std::move(n).error();
    return Result<GameVersion>::ok(
        GameVersion(std::move(n.value().canonical), n.value().is_short));
}

GameVersion GameVersion::any() {
    return GameVersion(std::nullopt, false);
}

std::string GameVersion::to_string() const {
    return version_ ? *version_ : "any";
}

GameVersion GameVersion::to_long_min() const {
    return to_long_min(VersionCache::shared());
}

GameVersion GameVersion::to_long_min(VersionCache& cache) const {
    if (!is_short_) return *this;
    return widen(*version_ + ".0", cache);
}

GameVersion GameVersion::to_long_max() const {
    return to_long_max(VersionCache::shared());
}

GameVersion GameVersion::to_long_max(VersionCache& cache) const {
    if (!is_short_) return *this;
    return widen(*version_ + "." + std::to_string(kPatchCeiling), cache);
}

GameVersion GameVersion::widen(const std::string& text, VersionCache& cache) {
    // `text` is a short canonical form plus one digit run, so it always parses
    auto n = normalize(text, cache);
    return GameVersion(std::move(n).value().canonical, false);
}

std::string GameVersion::short_prefix() const {
    const std::string& v = *version_;
    size_t dot = v.find('.');
    size_t second = v.find('.', dot + 1);
    return second == std::string::npos ? v : v.substr(0, second);
}

Result<GameVersion> GameVersion::short_form() const {
    if (is_any()) {
        return KspVerError{KspVerError::Incomparable,
            "the wildcard version has no short form",
            "check is_any() first"};
    }
    if (is_short_) return Result<GameVersion>::ok(*this);
    return Result<GameVersion>::ok(GameVersion(short_prefix(), true));
}

const std::vector<std::string>& GameVersion::components() const {
    std::call_once(components_->once, [this] {
        if (version_) components_->parts = split_components(*version_);
    });
    return components_->parts;
}

Result<bool> GameVersion::targets(const GameVersion& that) const {
    return targets(that, VersionCache::shared());
}

Result<bool> GameVersion::targets(const GameVersion& that, VersionCache& cache) const {
    if (!that.is_long()) {
        return incomparable(*this, that, "targets");
    }

    if (is_any()) {
        return Result<bool>::ok(true);
    }

    if (is_long()) {
        auto ord = compare(*this, that, cache);
        if (ord.is_err()) return std::move(ord).error();
        return Result<bool>::ok(ord.value() == Ordering::Equal);
    }

    // Same major.minor only needs the patch ceiling checked.
    // Long filters never take this path, so 1.2.3 does not target 1.2.4.
    auto hi = compare(that, to_long_max(cache), cache);
    if (hi.is_err()) return std::move(hi).error();
    if (short_prefix() == that.short_prefix()) {
        return Result<bool>::ok(hi.value() != Ordering::Greater);
    }

    auto lo = compare(that, to_long_min(cache), cache);
    if (lo.is_err()) return std::move(lo).error();
    return Result<bool>::ok(lo.value() != Ordering::Less &&
                            hi.value() != Ordering::Greater);
}

bool GameVersion::operator<(const GameVersion& o) const {
    return compare(*this, o).value_or_throw() == Ordering::Less;
}

bool GameVersion::operator<=(const GameVersion& o) const {
    return compare(*this, o).value_or_throw() != Ordering::Greater;
}

bool GameVersion::operator>(const GameVersion& o) const {
    return compare(*this, o).value_or_throw() == Ordering::Greater;
}

bool GameVersion::operator>=(const GameVersion& o) const {
    return compare(*this, o).value_or_throw() != Ordering::Less;
}

std::ostream& operator<<(std::ostream& os, const GameVersion& v) {
    return os << v.to_string();
}

// ---------------------------------------------------------------------------
// Comparator
// ---------------------------------------------------------------------------

Result<Ordering> compare(const GameVersion& a, const GameVersion& b) {
    return compare(a, b, VersionCache::shared());
}

Result<Ordering> compare(const GameVersion& a, const GameVersion& b,
                         VersionCache& cache) {
    if (!a.is_long() || !b.is_long()) {
        return incomparable(a, b, "compare");
    }

    const std::string& lhs = *a.version();
    const std::string& rhs = *b.version();
    if (auto hit = cache.find_order(lhs, rhs)) {
        return Result<Ordering>::ok(*hit);
    }

    Ordering o = compare_components(a.components(), b.components());
    cache.store_order(lhs, rhs, o);
    return Result<Ordering>::ok(o);
}

Result<bool> less_than(const GameVersion& a, const GameVersion& b) {
    return compare(a, b).map([](Ordering o) { return o == Ordering::Less; });
}

Result<bool> less_equal(const GameVersion& a, const GameVersion& b) {
    return compare(a, b).map([](Ordering o) { return o != Ordering::Greater; });
}

Result<bool> greater_than(const GameVersion& a, const GameVersion& b) {
    return compare(a, b).map([](Ordering o) { return o == Ordering::Greater; });
}

Result<bool> greater_equal(const GameVersion& a, const GameVersion& b) {
    return compare(a, b).map([](Ordering o) { return o != Ordering::Less; });
}

} // namespace kspver
