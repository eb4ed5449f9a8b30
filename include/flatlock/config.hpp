#pragma once

#include <flatlock/extract.hpp>
#include <flatlock/log.hpp>
#include <flatlock/resolver.hpp>
#include <flatlock/result.hpp>
#include <optional>
#include <string>

namespace flatlock {

// Layered configuration: global > project
// The project layer overrides the global one
struct Config {
    // [log]
    std::optional<log::Level> log_level;
    std::optional<bool> log_color;

    // [detect]
    std::optional<LockfileFormat> detect_format;

    // [resolve]
    bool resolve_dev = false;
    bool resolve_optional = true;
    bool resolve_peer = false;
    // Track which resolve fields were explicitly set (for merge)
    bool resolve_dev_set = false;
    bool resolve_optional_set = false;
    bool resolve_peer_set = false;

    // Load from a TOML config file (global or project-level)
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> project
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);

    // Options seeded from [resolve]
    DependenciesOfOptions resolve_options() const;

    // Options seeded from [detect]
    ParseOptions parse_options() const;

    // Apply [log] to the process-wide logger
    void apply_logging() const;
};

// Discover the global config file path: ~/.flatlock/config.toml
std::string global_config_path();

// <dir>/.flatlock.toml
std::string project_config_path(const std::string& dir);

} // namespace flatlock
