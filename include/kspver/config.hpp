#pragma once

#include <kspver/log.hpp>
#include <kspver/result.hpp>
#include <optional>
#include <string>

namespace kspver {

class VersionCache;

// Layered configuration: global < local (local wins)
//
//   [log]
//   level = "debug"
//   color = false
//
//   [cache]
//   enabled = true
struct Config {
    log::Level log_level = log::Info;
    bool log_color = false;
    bool cache_enabled = true;
    // Track which fields were explicitly set (for merge)
    bool log_level_set = false;
    bool log_color_set = false;
    bool cache_enabled_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string; `source` names the origin in error messages
    static Result<Config> parse(const std::string& toml_str,
                                const std::string& source = "");

    // Merge another config on top (other's explicitly set values override this)
    void merge(const Config& other);

    // Push settings into the logger and `cache`
    void apply(VersionCache& cache) const;

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);
};

// Discover the global config file path: ~/.kspver/config.toml
std::string global_config_path();

} // namespace kspver
