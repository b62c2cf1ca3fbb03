// demo_targets.cpp
//
// Checks which releases a version filter accepts, exercising GameVersion,
// Result<T>, the TOML config layer and logging.  Run it with:
//
//     ./demo_targets 0.25 0.25.2 0.26.0      # short filter
//     ./demo_targets any 1.0.5               # wildcard filter
//     ./demo_targets 1.2.3 1.2               # short release -> Incomparable
//     KSPVER_CONFIG=dev.toml ./demo_targets 0.25 0.25.2
//
// Set [log] level = "trace" in the config to watch the caches at work.

#include <kspver/cache.hpp>
#include <kspver/config.hpp>
#include <kspver/log.hpp>
#include <kspver/version.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using namespace kspver;

// Global config first, then the file named by KSPVER_CONFIG on top.
static Result<Config> load_config() {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    if (!global_path.empty() && fs::exists(global_path)) {
        auto r = Config::load(global_path);
        KSPVER_TRY(r);
        global = r.value();
    }

    std::optional<Config> local;
    if (const char* path = std::getenv("KSPVER_CONFIG")) {
        auto r = Config::load(path);
        KSPVER_TRY(r);
        local = r.value();
    }

    return Result<Config>::ok(Config::effective(global, local));
}

int main(int argc, char** argv) {
    if (argc < 3) {
        KspVerError err{KspVerError::InvalidArg,
            "expected a filter and at least one release",
            "usage: demo_targets <filter> <release>..."};
        log::error("%s", err.format().c_str());
        return 2;
    }

    auto cfg = load_config();
    if (cfg.is_err()) {
        log::error("%s", cfg.error().format().c_str());
        return 1;
    }
    cfg.value().apply(VersionCache::shared());

    auto filter = GameVersion::parse(argv[1]);
    if (filter.is_err()) {
        log::error("%s", filter.error().format().c_str());
        return 1;
    }
    log::info("filter %s covers %s .. %s",
              filter.value().to_string().c_str(),
              filter.value().to_long_min().to_string().c_str(),
              filter.value().to_long_max().to_string().c_str());

    int status = 0;
    for (int i = 2; i < argc; ++i) {
        auto matched = GameVersion::parse(argv[i]).and_then([&](GameVersion& release) {
            return filter.value().targets(release);
        });
        if (matched.is_err()) {
            log::error("%s", matched.error().format().c_str());
            status = 1;
            continue;
        }
        std::cout << argv[i] << ": " << (matched.value() ? "yes" : "no") << "\n";
    }

    auto normal = VersionCache::shared().normal_stats();
    auto order = VersionCache::shared().order_stats();
    log::debug("normalize cache: %zu entries, %zu hits, %zu misses",
               normal.entries, normal.hits, normal.misses);
    log::debug("compare cache: %zu entries, %zu hits, %zu misses",
               order.entries, order.hits, order.misses);
    return status;
}
