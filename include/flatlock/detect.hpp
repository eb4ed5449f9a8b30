#pragma once

#include <flatlock/dependency.hpp>
#include <flatlock/result.hpp>
#include <yaml-cpp/yaml.h>
#include <optional>
#include <string>

namespace flatlock {

// ---------------------------------------------------------------------------
// Lockfile format detection
// ---------------------------------------------------------------------------

// Detect the lockfile format. Non-empty content is authoritative: it is parsed
// and its structure inspected, never substring-matched. The path hint is only
// consulted when content is empty.
Result<LockfileFormat> detect_format(const std::string& content,
                                     const std::string& path_hint = "");

// File-name based guess ("package-lock.json", "pnpm-lock.yaml", "yarn.lock", ...)
std::optional<LockfileFormat> format_from_path(const std::string& path);

// Structural probes, in the order detect_format applies them
bool is_npm_lockfile(const std::string& content);
bool is_yarn_berry_lockfile(const std::string& content);
bool is_pnpm_lockfile(const std::string& content);
bool is_yarn_classic_lockfile(const std::string& content);

// ---------------------------------------------------------------------------
// pnpm lockfile eras
// ---------------------------------------------------------------------------

enum class PnpmEra {
    Shrinkwrap,  // shrinkwrap.yaml v3/v4
    V5,          // lockfileVersion: 5.x (number)
    V5Inline,    // lockfileVersion: '5.4-inlineSpecifiers'
    V6,          // lockfileVersion: '6.x'
    V9,          // lockfileVersion: '9.x'
    Unknown
};

const char* pnpm_era_name(PnpmEra era);

struct PnpmVersion {
    PnpmEra era = PnpmEra::Unknown;
    std::string version;        // raw version value as written
    bool is_shrinkwrap = false;
};

// The version fields of a pnpm lockfile, reduced to what era rules inspect
struct PnpmVersionField {
    enum Kind { Absent, Number, String };

    bool has_shrinkwrap = false;
    std::string shrinkwrap_version;
    Kind kind = Absent;
    std::string text;           // lockfileVersion as written
};

// Ordered rule table, first match wins:
//   shrinkwrapVersion present        -> Shrinkwrap
//   numeric lockfileVersion          -> V5
//   string containing inlineSpecifiers -> V5Inline
//   string starting with '9'         -> V9
//   string starting with '6'         -> V6
//   otherwise                        -> Unknown
PnpmVersion classify_pnpm_version(const PnpmVersionField& field);

// Read the version fields from a parsed pnpm lockfile and classify them
PnpmVersion detect_pnpm_version(const YAML::Node& root);

bool uses_at_separator(const PnpmVersion& v);      // name@version keys (v6, v9)
bool uses_snapshots_split(const PnpmVersion& v);   // packages + snapshots (v9)
bool uses_inline_specifiers(const PnpmVersion& v); // v5-inline, v6, v9
bool has_leading_slash(const PnpmVersion& v);      // all but v9

} // namespace flatlock
