#include <kspver/normalize.hpp>
#include <kspver/cache.hpp>
#include <kspver/log.hpp>

#include <cctype>

namespace kspver {

size_t count_components(const std::string& s) {
    size_t components = 0;
    bool in_digits = false;
    for (char c : s) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            in_digits = true;
        } else if (c == '.' && in_digits) {
            ++components;
            in_digits = false;
        } else {
            return 0;
        }
    }
    // Empty input or a trailing dot
    if (!in_digits) return 0;
    return components + 1;
}

std::vector<std::string> split_components(const std::string& s) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t dot = s.find('.', start);
        if (dot == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, dot - start));
        start = dot + 1;
    }
    return parts;
}

Result<Normalized> normalize(const std::optional<std::string>& raw) {
    Normalized n;
    if (!raw.has_value()) {
        return Result<Normalized>::ok(n);
    }

    std::string v = *raw;
    if (!v.empty() && v.front() == '.') {
        v.insert(v.begin(), '0');
    }
    if (v == "any") {
        return Result<Normalized>::ok(n);
    }

    size_t components = count_components(v);
    if (components < 2) {
        log::debug("rejecting malformed version '%s'", raw->c_str());
        return KspVerError{KspVerError::BadVersion,
            "'" + *raw + "' is not a valid game version",
            "expected \"any\", major.minor or major.minor.patch"};
    }

    n.is_short = components == 2;
    n.canonical = std::move(v);
    return Result<Normalized>::ok(std::move(n));
}

Result<Normalized> normalize(const std::optional<std::string>& raw, VersionCache& cache) {
    // Absent input is never a cache key
    if (!raw.has_value()) {
        return normalize(raw);
    }

    if (auto hit = cache.find_normal(*raw)) {
        return Result<Normalized>::ok(std::move(*hit));
    }

    auto n = normalize(raw);
    if (n.is_ok()) {
        cache.store_normal(*raw, n.value());
    }
    return n;
}

} // namespace kspver
