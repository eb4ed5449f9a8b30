#include <flatlock/parsers/pnpm.hpp>
#include <flatlock/log.hpp>
#include <flatlock/parsers/yaml_node.hpp>

namespace flatlock {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static std::string strip_leading_slash(const std::string& spec) {
    return (!spec.empty() && spec[0] == '/') ? spec.substr(1) : spec;
}

// Keeps empty segments: "a//b" -> ["a", "", "b"]
static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            return parts;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

// Start of the version segment in "name/version" or "@scope/name/version",
// npos when the spec has no such segment
static size_t version_segment(const std::string& cleaned) {
    size_t slash = cleaned.find('/');
    if (slash != std::string::npos && cleaned[0] == '@') {
        slash = cleaned.find('/', slash + 1);
    }
    return slash == std::string::npos ? slash : slash + 1;
}

// The v5 peer suffix starts at the first '_' of the version segment;
// names like "string_decoder" keep theirs
static size_t v5_peer_underscore(const std::string& cleaned) {
    size_t start = version_segment(cleaned);
    if (start == std::string::npos) return start;
    return cleaned.find('_', start);
}

// "name/version[/...]" or "@scope/name/version[/...]", slash already stripped
static std::optional<PackageId> parse_slash_form(const std::string& cleaned) {
    auto parts = split(cleaned, '/');
    if (cleaned[0] == '@') {
        if (parts.size() < 3) return std::nullopt;
        if (parts[0].size() < 2 || parts[1].empty() || parts[2].empty()) {
            return std::nullopt;
        }
        return PackageId{parts[0] + "/" + parts[1], parts[2]};
    }
    if (parts.size() < 2 || parts[0].empty() || parts[1].empty()) {
        return std::nullopt;
    }
    return PackageId{parts[0], parts[1]};
}

// ---------------------------------------------------------------------------
// Spec grammar
// ---------------------------------------------------------------------------

bool is_local_spec(const std::string& spec) {
    return spec.rfind("link:", 0) == 0 || spec.rfind("file:", 0) == 0;
}

std::optional<PackageId> parse_spec_shrinkwrap(const std::string& spec) {
    if (is_local_spec(spec)) return std::nullopt;
    std::string cleaned = strip_leading_slash(spec);
    if (cleaned.empty()) return std::nullopt;
    return parse_slash_form(cleaned);
}

std::optional<PackageId> parse_spec_v5(const std::string& spec) {
    if (is_local_spec(spec)) return std::nullopt;
    std::string cleaned = strip_leading_slash(spec);
    if (cleaned.empty()) return std::nullopt;

    size_t underscore = v5_peer_underscore(cleaned);
    if (underscore != std::string::npos) cleaned.resize(underscore);
    return parse_slash_form(cleaned);
}

std::optional<PackageId> parse_spec_v6plus(const std::string& spec) {
    if (is_local_spec(spec)) return std::nullopt;
    std::string cleaned = strip_leading_slash(spec);
    if (cleaned.empty()) return std::nullopt;

    size_t paren = cleaned.find('(');
    if (paren != std::string::npos) cleaned.resize(paren);

    // Scopes never carry a version '@', so the last one separates
    size_t last_at = cleaned.rfind('@');
    if (last_at == std::string::npos || last_at == 0) return std::nullopt;

    PackageId id{cleaned.substr(0, last_at), cleaned.substr(last_at + 1)};
    if (id.name.empty() || id.version.empty()) return std::nullopt;
    return id;
}

std::optional<PackageId> parse_pnpm_spec(const std::string& spec) {
    if (is_local_spec(spec)) return std::nullopt;
    if (spec.find('(') != std::string::npos) return parse_spec_v6plus(spec);

    std::string cleaned = strip_leading_slash(spec);
    if (cleaned.empty()) return std::nullopt;
    std::string without_peer = cleaned.substr(0, v5_peer_underscore(cleaned));
    size_t last_at = without_peer.rfind('@');
    if (last_at != std::string::npos && last_at > 0 &&
        without_peer.find('/', last_at + 1) == std::string::npos) {
        return parse_spec_v6plus(spec);
    }
    return parse_spec_v5(spec);
}

std::optional<PackageId> parse_pnpm_spec_for_era(const std::string& spec, PnpmEra era) {
    switch (era) {
        case PnpmEra::Shrinkwrap: return parse_spec_shrinkwrap(spec);
        case PnpmEra::V5:
        case PnpmEra::V5Inline:   return parse_spec_v5(spec);
        case PnpmEra::V6:
        case PnpmEra::V9:         return parse_spec_v6plus(spec);
        case PnpmEra::Unknown:    break;
    }
    return parse_pnpm_spec(spec);
}

std::optional<std::string> parse_pnpm_key(const std::string& spec) {
    auto id = parse_pnpm_spec(spec);
    if (!id) return std::nullopt;
    return id->name;
}

// ---------------------------------------------------------------------------
// Peer suffixes
// ---------------------------------------------------------------------------

bool has_peer_suffix(const std::string& spec) {
    std::string cleaned = strip_leading_slash(spec);
    size_t slashes = 0;
    for (char c : cleaned) {
        if (c == '/') ++slashes;
    }
    return (!cleaned.empty() && cleaned[0] == '@') ? slashes > 2 : slashes > 1;
}

bool has_peer_suffix_v5(const std::string& spec) {
    std::string cleaned = strip_leading_slash(spec);
    return !cleaned.empty() && v5_peer_underscore(cleaned) != std::string::npos;
}

bool has_peer_suffix_v6plus(const std::string& spec) {
    return spec.find('(') != std::string::npos && spec.find(')') != std::string::npos;
}

std::optional<std::string> extract_peer_suffix(const std::string& spec) {
    std::string cleaned = strip_leading_slash(spec);
    auto parts = split(cleaned, '/');
    size_t fixed = (!cleaned.empty() && cleaned[0] == '@') ? 3 : 2;
    if (parts.size() <= fixed) return std::nullopt;

    std::string suffix;
    for (size_t i = fixed; i < parts.size(); ++i) {
        if (i > fixed) suffix += '/';
        suffix += parts[i];
    }
    return suffix;
}

std::optional<std::string> extract_peer_suffix_v5(const std::string& spec) {
    std::string cleaned = strip_leading_slash(spec);
    if (cleaned.empty()) return std::nullopt;
    size_t underscore = v5_peer_underscore(cleaned);
    if (underscore == std::string::npos) return std::nullopt;
    return cleaned.substr(underscore + 1);
}

std::optional<std::string> extract_peer_suffix_v6plus(const std::string& spec) {
    size_t paren = spec.find('(');
    if (paren == std::string::npos) return std::nullopt;
    return spec.substr(paren);
}

std::vector<PackageId> parse_peer_dependencies(const std::string& suffix) {
    std::vector<PackageId> peers;
    size_t pos = 0;
    while (true) {
        size_t open = suffix.find('(', pos);
        if (open == std::string::npos) break;
        size_t close = suffix.find(')', open + 1);
        if (close == std::string::npos) break;
        if (close == open + 1) {
            pos = open + 1;
            continue;
        }
        pos = close + 1;

        std::string peer = suffix.substr(open + 1, close - open - 1);
        size_t last_at = peer.rfind('@');
        if (last_at == std::string::npos || last_at == 0) continue;
        PackageId id{peer.substr(0, last_at), peer.substr(last_at + 1)};
        if (!id.name.empty() && !id.version.empty()) peers.push_back(std::move(id));
    }
    return peers;
}

// ---------------------------------------------------------------------------
// Loader
// ---------------------------------------------------------------------------

static FlatlockError pnpm_error(const std::string& msg, const std::string& filename,
                                int line = 0) {
    return FlatlockError{FlatlockError::Parse, msg,
                         "regenerate the lockfile with pnpm install", filename, line};
}

// "1.0.0" up to v5, {specifier, version} from v6 on
static std::string pinned_version(const YAML::Node& value) {
    if (!value.IsDefined()) return "";
    if (value.IsScalar()) return value.Scalar();
    if (value.IsMap()) return yaml_scalar(yaml_child(value, "version"));
    return "";
}

static SpecList spec_section(const YAML::Node& map, const char* key) {
    SpecList out;
    YAML::Node section = yaml_child(map, key);
    if (!section.IsDefined() || !section.IsMap()) return out;
    for (auto it = section.begin(); it != section.end(); ++it) {
        out.emplace_back(yaml_scalar(it->first), pinned_version(it->second));
    }
    return out;
}

static PackageEntry read_package(const YAML::Node& node) {
    PackageEntry entry;
    // v9 snapshots without dependencies are written as {}
    if (!node.IsDefined() || !node.IsMap()) return entry;

    YAML::Node resolution = yaml_child(node, "resolution");
    entry.integrity = yaml_scalar(yaml_child(resolution, "integrity"));
    entry.resolved = yaml_scalar(yaml_child(resolution, "tarball"));
    entry.resolution_type = yaml_scalar(yaml_child(resolution, "type"));
    entry.link = entry.resolution_type == "directory";

    entry.name = yaml_scalar(yaml_child(node, "name"));
    entry.version = yaml_scalar(yaml_child(node, "version"));
    entry.dependencies = spec_section(node, "dependencies");
    entry.optional_dependencies = spec_section(node, "optionalDependencies");
    entry.peer_dependencies = spec_section(node, "peerDependencies");
    return entry;
}

static ImporterEntry read_importer(const YAML::Node& node) {
    ImporterEntry importer;
    importer.dependencies = spec_section(node, "dependencies");
    importer.dev_dependencies = spec_section(node, "devDependencies");
    importer.optional_dependencies = spec_section(node, "optionalDependencies");
    importer.peer_dependencies = spec_section(node, "peerDependencies");
    return importer;
}

static Status load_package_map(const YAML::Node& root, const char* key,
                               PackageTable& out, const std::string& filename) {
    YAML::Node map = yaml_child(root, key);
    if (!map.IsDefined() || map.IsNull()) return ok_status();
    if (!map.IsMap()) {
        return pnpm_error(std::string("'") + key + "' must be a map", filename,
                          yaml_line(map.Mark()));
    }
    for (auto it = map.begin(); it != map.end(); ++it) {
        out.add(yaml_scalar(it->first), read_package(it->second));
    }
    return ok_status();
}

static Status load_importers(const YAML::Node& root, LockTables& tables,
                             const std::string& filename) {
    YAML::Node importers = yaml_child(root, "importers");
    if (importers.IsDefined() && !importers.IsNull()) {
        if (!importers.IsMap()) {
            return pnpm_error("'importers' must be a map", filename,
                              yaml_line(importers.Mark()));
        }
        for (auto it = importers.begin(); it != importers.end(); ++it) {
            tables.importers[yaml_scalar(it->first)] = read_importer(it->second);
        }
        return ok_status();
    }

    // Single-project lockfiles keep the root importer at the top level
    if (yaml_child(root, "dependencies").IsDefined() ||
        yaml_child(root, "devDependencies").IsDefined() ||
        yaml_child(root, "optionalDependencies").IsDefined()) {
        tables.importers["."] = read_importer(root);
    }
    return ok_status();
}

Result<LockTables> load_pnpm_tables(const std::string& content,
                                    const std::string& filename) {
    LockTables tables;
    tables.format = LockfileFormat::Pnpm;

    try {
        YAML::Node root = YAML::Load(content);
        if (!root.IsDefined() || !root.IsMap()) {
            return pnpm_error("lockfile root must be a map", filename);
        }

        tables.pnpm = detect_pnpm_version(root);
        tables.lockfile_version = tables.pnpm.version;

        FLATLOCK_TRY(load_package_map(root, "packages", tables.packages, filename));
        if (uses_snapshots_split(tables.pnpm)) {
            FLATLOCK_TRY(load_package_map(root, "snapshots", tables.snapshots, filename));
        }
        FLATLOCK_TRY(load_importers(root, tables, filename));
    } catch (const YAML::Exception& e) {
        return pnpm_error("invalid YAML: " + e.msg, filename,
                          yaml_line(e.mark));
    }

    log::debug("pnpm lockfile %s (era %s): %zu packages, %zu snapshots, %zu importers",
               tables.lockfile_version.c_str(), pnpm_era_name(tables.pnpm.era),
               tables.packages.size(), tables.snapshots.size(),
               tables.importers.size());
    return Result<LockTables>::ok(std::move(tables));
}

// ---------------------------------------------------------------------------
// Extraction
// ---------------------------------------------------------------------------

std::optional<Dependency> extract_pnpm_entry(const std::string& spec,
                                             const PackageEntry& entry,
                                             PnpmEra era) {
    auto id = parse_pnpm_spec_for_era(spec, era);
    if (!id) return std::nullopt;
    if (is_local_spec(spec) || entry.resolution_type == "directory") {
        return std::nullopt;
    }

    Dependency dep;
    dep.name = std::move(id->name);
    dep.version = std::move(id->version);
    dep.integrity = entry.integrity;
    dep.resolved = entry.resolved;
    return dep;
}

} // namespace flatlock
