#include <kspver/config.hpp>
#include <kspver/cache.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace kspver {

static KspVerError config_error(const std::string& message,
                                const toml::node& node,
                                const std::string& source) {
    return KspVerError{KspVerError::Config, message, "",
        source, static_cast<int>(node.source().begin.line)};
}

Result<Config> Config::parse(const std::string& toml_str, const std::string& source) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return KspVerError{KspVerError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", source, static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto node = lg->get("level")) {
            auto s = node->value<std::string>();
            if (!s) {
                return config_error("log.level must be a string", *node, source);
            }
            if (!log::level_from_name(*s, cfg.log_level)) {
                auto err = config_error("unknown log level '" + *s + "'", *node, source);
                err.hint = "expected one of: trace, debug, info, warn, error";
                return err;
            }
            cfg.log_level_set = true;
        }
        if (auto node = lg->get("color")) {
            auto b = node->value<bool>();
            if (!b) {
                return config_error("log.color must be a boolean", *node, source);
            }
            cfg.log_color = *b;
            cfg.log_color_set = true;
        }
    }

    // [cache] section
    if (auto cache = doc["cache"].as_table()) {
        if (auto node = cache->get("enabled")) {
            auto b = node->value<bool>();
            if (!b) {
                return config_error("cache.enabled must be a boolean", *node, source);
            }
            cfg.cache_enabled = *b;
            cfg.cache_enabled_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return KspVerError{KspVerError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    log::info("loading config %s", path.c_str());
    return Config::parse(ss.str(), path);
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log_color = other.log_color;
        log_color_set = true;
    }
    if (other.cache_enabled_set) {
        cache_enabled = other.cache_enabled;
        cache_enabled_set = true;
    }
}

void Config::apply(VersionCache& cache) const {
    log::set_level(log_level);
    // Unset color keeps the terminal autodetection
    if (log_color_set) {
        log::set_color_enabled(log_color);
    }
    if (!cache_enabled) {
        log::warn("version cache disabled by configuration");
    }
    cache.set_enabled(cache_enabled);
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.kspver/config.toml";
}

} // namespace kspver
