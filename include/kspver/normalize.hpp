#pragma once

#include <kspver/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace kspver {

class VersionCache;

// Canonical form of a raw version string
struct Normalized {
    std::optional<std::string> canonical;  // nullopt means "any"
    bool is_short = false;

    bool is_any() const { return !canonical.has_value(); }
    bool operator==(const Normalized& o) const {
        return canonical == o.canonical && is_short == o.is_short;
    }
};

// Leading-dot fix-up, "any" mapping and grammar check. Never cached.
Result<Normalized> normalize(const std::optional<std::string>& raw);

// Same as normalize(), memoized in `cache` keyed by the raw input
Result<Normalized> normalize(const std::optional<std::string>& raw, VersionCache& cache);

// Number of components if `s` is digits joined by single dots ("1.2.3" -> 3),
// or 0 if it is not.
size_t count_components(const std::string& s);

// Splits a canonical version into its digit runs. `s` must be well formed.
std::vector<std::string> split_components(const std::string& s);

} // namespace kspver
