#include <flatlock/config.hpp>
#include <tomlplusplus/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace flatlock {

static FlatlockError config_error(const std::string& msg) {
    return FlatlockError{FlatlockError::Config, msg};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        const auto& begin = e.source().begin;
        return FlatlockError{FlatlockError::Config,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(begin.line)};
    }

    Config cfg;

    // [log] section
    if (auto section = doc["log"].as_table()) {
        if (auto node = (*section)["level"]; node) {
            auto s = node.value<std::string>();
            if (!s) return config_error("log.level must be a string");
            auto lvl = log::parse_level(*s);
            if (!lvl) {
                return FlatlockError{FlatlockError::Config,
                    "unknown log level '" + *s + "'",
                    "use one of: trace, debug, info, warn, error"};
            }
            cfg.log_level = *lvl;
        }
        if (auto node = (*section)["color"]; node) {
            auto v = node.value<bool>();
            if (!v) return config_error("log.color must be a boolean");
            cfg.log_color = *v;
        }
    }

    // [detect] section
    if (auto section = doc["detect"].as_table()) {
        if (auto node = (*section)["format"]; node) {
            auto s = node.value<std::string>();
            if (!s) return config_error("detect.format must be a string");
            auto fmt = parse_format_name(*s);
            if (!fmt) {
                return FlatlockError{FlatlockError::Config,
                    "unknown lockfile format '" + *s + "'",
                    "use one of: npm, pnpm, yarn-classic, yarn-berry"};
            }
            cfg.detect_format = *fmt;
        }
    }

    // [resolve] section
    if (auto section = doc["resolve"].as_table()) {
        auto read_flag = [&](const char* key, bool& value, bool& set) -> Status {
            auto node = (*section)[key];
            if (!node) return ok_status();
            auto v = node.value<bool>();
            if (!v) return config_error(std::string("resolve.") + key + " must be a boolean");
            value = *v;
            set = true;
            return ok_status();
        };
        FLATLOCK_TRY(read_flag("dev", cfg.resolve_dev, cfg.resolve_dev_set));
        FLATLOCK_TRY(read_flag("optional", cfg.resolve_optional, cfg.resolve_optional_set));
        FLATLOCK_TRY(read_flag("peer", cfg.resolve_peer, cfg.resolve_peer_set));
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return FlatlockError{FlatlockError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto result = Config::parse(ss.str());
    if (result.is_err()) result.error().file = path;
    return result;
}

void Config::merge(const Config& other) {
    if (other.log_level) log_level = other.log_level;
    if (other.log_color) log_color = other.log_color;
    if (other.detect_format) detect_format = other.detect_format;

    // Resolve: other overrides only explicitly-set fields
    if (other.resolve_dev_set) {
        resolve_dev = other.resolve_dev;
        resolve_dev_set = true;
    }
    if (other.resolve_optional_set) {
        resolve_optional = other.resolve_optional;
        resolve_optional_set = true;
    }
    if (other.resolve_peer_set) {
        resolve_peer = other.resolve_peer;
        resolve_peer_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

DependenciesOfOptions Config::resolve_options() const {
    DependenciesOfOptions opts;
    opts.dev = resolve_dev;
    opts.optional = resolve_optional;
    opts.peer = resolve_peer;
    return opts;
}

ParseOptions Config::parse_options() const {
    ParseOptions opts;
    opts.format = detect_format;
    return opts;
}

void Config::apply_logging() const {
    if (log_level) log::set_level(*log_level);
    if (log_color) log::set_color_enabled(*log_color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.flatlock/config.toml";
}

std::string project_config_path(const std::string& dir) {
    if (dir.empty()) return ".flatlock.toml";
    if (dir.back() == '/') return dir + ".flatlock.toml";
    return dir + "/.flatlock.toml";
}

} // namespace flatlock
