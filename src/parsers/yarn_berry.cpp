#include <flatlock/parsers/yarn_berry.hpp>
#include <flatlock/parsers/yaml_node.hpp>
#include <flatlock/parsers/yarn_classic.hpp>
#include <flatlock/log.hpp>

namespace flatlock {

static const char* const k_protocol_markers[] = {
    "@npm:", "@workspace:", "@portal:", "@link:", "@patch:", "@file:",
};

std::string parse_yarn_berry_key(const std::string& key) {
    auto descriptors = split_yarn_descriptors(key);
    if (descriptors.empty()) return "";
    const std::string& first = descriptors.front();

    // Earliest marker wins: patch: locators embed a later @npm:
    size_t earliest = std::string::npos;
    for (const char* marker : k_protocol_markers) {
        size_t idx = first.find(marker);
        if (idx < earliest) earliest = idx;
    }
    if (earliest != std::string::npos) return first.substr(0, earliest);

    if (first[0] == '@') {
        size_t slash = first.find('/');
        if (slash != std::string::npos) {
            size_t at = first.find('@', slash);
            if (at != std::string::npos) return first.substr(0, at);
        }
    }
    size_t at = first.find('@');
    return at != std::string::npos ? first.substr(0, at) : first;
}

std::optional<std::string> parse_yarn_berry_resolution(const std::string& resolution) {
    if (resolution.empty()) return std::nullopt;
    size_t at = resolution[0] == '@' ? resolution.find('@', 1) : resolution.find('@');
    if (at == std::string::npos || at == 0) return std::nullopt;
    return resolution.substr(0, at);
}

std::string yarn_berry_protocol(const std::string& locator) {
    auto name = parse_yarn_berry_resolution(locator);
    if (!name) return "";
    std::string rest = locator.substr(name->size() + 1);
    size_t colon = rest.find(':');
    if (colon == std::string::npos) return "";
    return rest.substr(0, colon);
}

bool is_local_protocol(const std::string& protocol) {
    return protocol == "workspace" || protocol == "portal" || protocol == "link";
}

// ---------------------------------------------------------------------------
// Loader
// ---------------------------------------------------------------------------

static FlatlockError berry_error(const std::string& msg, const std::string& filename,
                                 int line = 0) {
    return FlatlockError{FlatlockError::Parse, msg,
                         "regenerate the lockfile with yarn install", filename, line};
}

static SpecList spec_map(const YAML::Node& node, const char* key) {
    SpecList out;
    YAML::Node section = yaml_child(node, key);
    if (!section.IsDefined() || !section.IsMap()) return out;
    for (auto it = section.begin(); it != section.end(); ++it) {
        out.emplace_back(yaml_scalar(it->first), yaml_scalar(it->second));
    }
    return out;
}

// The locator an entry resolves to; the first descriptor when unresolved
static std::string entry_locator(const std::string& key, const PackageEntry& entry) {
    if (!entry.resolved.empty()) return entry.resolved;
    auto descriptors = split_yarn_descriptors(key);
    return descriptors.empty() ? "" : descriptors.front();
}

Result<LockTables> load_yarn_berry_tables(const std::string& content,
                                          const std::string& filename) {
    LockTables tables;
    tables.format = LockfileFormat::YarnBerry;

    try {
        YAML::Node root = YAML::Load(content);
        if (!root.IsDefined() || !root.IsMap()) {
            return berry_error("lockfile root must be a map", filename);
        }

        tables.lockfile_version =
            yaml_scalar(yaml_child(yaml_child(root, "__metadata"), "version"));

        for (auto it = root.begin(); it != root.end(); ++it) {
            std::string key = yaml_scalar(it->first);
            if (key == "__metadata") continue;

            const YAML::Node& node = it->second;
            if (!node.IsDefined() || !node.IsMap()) {
                return berry_error("entry '" + key + "' must be a map", filename,
                                   yaml_line(node.Mark()));
            }

            PackageEntry entry;
            entry.version = yaml_scalar(yaml_child(node, "version"));
            entry.resolved = yaml_scalar(yaml_child(node, "resolution"));
            entry.integrity = yaml_scalar(yaml_child(node, "checksum"));
            entry.dependencies = spec_map(node, "dependencies");
            entry.optional_dependencies = spec_map(node, "optionalDependencies");
            entry.peer_dependencies = spec_map(node, "peerDependencies");
            entry.link = is_local_protocol(yarn_berry_protocol(entry_locator(key, entry)));

            tables.packages.add(std::move(key), std::move(entry));
        }
    } catch (const YAML::Exception& e) {
        return berry_error("invalid YAML: " + e.msg, filename, yaml_line(e.mark));
    }

    log::debug("yarn berry lockfile v%s: %zu entries",
               tables.lockfile_version.c_str(), tables.packages.size());
    return Result<LockTables>::ok(std::move(tables));
}

// ---------------------------------------------------------------------------
// Extraction
// ---------------------------------------------------------------------------

std::optional<Dependency> extract_yarn_berry_entry(const std::string& key,
                                                   const PackageEntry& entry) {
    if (key == "__metadata") return std::nullopt;
    if (is_local_protocol(yarn_berry_protocol(entry_locator(key, entry)))) {
        return std::nullopt;
    }

    // resolution names the real package even when the key is an alias
    auto name = parse_yarn_berry_resolution(entry.resolved);
    std::string resolved_name = name ? *name : parse_yarn_berry_key(key);
    if (resolved_name.empty() || entry.version.empty()) return std::nullopt;

    Dependency dep;
    dep.name = std::move(resolved_name);
    dep.version = entry.version;
    dep.integrity = entry.integrity;
    dep.resolved = entry.resolved;
    return dep;
}

} // namespace flatlock
