#pragma once

#include <kspver/ordering.hpp>
#include <kspver/result.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace kspver {

class VersionCache;

// A game release version: "any", short (major.minor) or long
// (major.minor.patch[.more]). Immutable; copies share lazily parsed state.
//
// Only long versions are ordered. Short versions must be widened with
// to_long_min() / to_long_max() first.
class GameVersion {
public:
    // Patch number to_long_max() appends to a short version
    static constexpr int kPatchCeiling = 99;

    static Result<GameVersion> parse(const std::string& s);
    static Result<GameVersion> parse(const std::string& s, VersionCache& cache);

    // std::nullopt means "unspecified" and yields the wildcard
    static Result<GameVersion> parse_opt(const std::optional<std::string>& s);
    static Result<GameVersion> parse_opt(const std::optional<std::string>& s,
                                         VersionCache& cache);

    static GameVersion any();

    bool is_any() const { return !version_.has_value(); }
    bool is_not_any() const { return version_.has_value(); }
    bool is_short() const { return is_short_; }
    bool is_long() const { return version_.has_value() && !is_short_; }

    // Canonical form; std::nullopt for the wildcard
    const std::optional<std::string>& version() const { return version_; }

    // Canonical form, or "any" for the wildcard. parse() accepts it back.
    std::string to_string() const;

    // x.y -> x.y.0; long and wildcard versions are returned unchanged.
    // The widened string goes through the normalization cache.
    GameVersion to_long_min() const;
    GameVersion to_long_min(VersionCache& cache) const;

    // x.y -> x.y.99; long and wildcard versions are returned unchanged
    GameVersion to_long_max() const;
    GameVersion to_long_max(VersionCache& cache) const;

    // major.minor of this version. Errors on the wildcard.
    Result<GameVersion> short_form() const;

    // Whether a release `that` (must be long) satisfies this version used
    // as a filter. "1.2" targets every 1.2.x up to the patch ceiling.
    Result<bool> targets(const GameVersion& that) const;
    Result<bool> targets(const GameVersion& that, VersionCache& cache) const;

    // Digit runs of the canonical form, parsed on first use. Empty for "any".
    const std::vector<std::string>& components() const;

    // Equality is on the canonical string only
    bool operator==(const GameVersion& o) const { return version_ == o.version_; }
    bool operator!=(const GameVersion& o) const { return !(*this == o); }

    // Throw VersionException unless both sides are long
    bool operator<(const GameVersion& o) const;
    bool operator<=(const GameVersion& o) const;
    bool operator>(const GameVersion& o) const;
    bool operator>=(const GameVersion& o) const;

private:
    struct Components {
        std::once_flag once;
        std::vector<std::string> parts;
    };

    GameVersion(std::optional<std::string> version, bool is_short);

    static GameVersion widen(const std::string& text, VersionCache& cache);

    // Text up to the second component; requires a non-wildcard version
    std::string short_prefix() const;

    std::optional<std::string> version_;
    bool is_short_ = false;
    std::shared_ptr<Components> components_;
};

Result<Ordering> compare(const GameVersion& a, const GameVersion& b);
Result<Ordering> compare(const GameVersion& a, const GameVersion& b,
                         VersionCache& cache);

Result<bool> less_than(const GameVersion& a, const GameVersion& b);
Result<bool> less_equal(const GameVersion& a, const GameVersion& b);
Result<bool> greater_than(const GameVersion& a, const GameVersion& b);
Result<bool> greater_equal(const GameVersion& a, const GameVersion& b);

std::ostream& operator<<(std::ostream& os, const GameVersion& v);

} // namespace kspver

namespace std {

template<>
struct hash<kspver::GameVersion> {
    size_t operator()(const kspver::GameVersion& v) const {
        return v.version() ? hash<string>{}(*v.version()) : 0;
    }
};

} // namespace std
