#include <flatlock/parsers/yarn_classic.hpp>
#include <flatlock/lang/parser.hpp>
#include <flatlock/log.hpp>

namespace flatlock {

static std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> split_yarn_descriptors(const std::string& key) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= key.size()) {
        size_t comma = key.find(',', start);
        if (comma == std::string::npos) comma = key.size();
        std::string part = trim(key.substr(start, comma - start));
        if (!part.empty()) out.push_back(std::move(part));
        start = comma + 1;
    }
    return out;
}

std::string parse_yarn_classic_key(const std::string& key) {
    std::string first = trim(key.substr(0, key.find(',')));
    if (first.empty()) return "";

    size_t alias = first.find("@npm:");
    if (alias != std::string::npos) return first.substr(0, alias);

    if (first[0] == '@') {
        size_t slash = first.find('/');
        if (slash != std::string::npos) {
            size_t at = first.find('@', slash);
            if (at != std::string::npos) return first.substr(0, at);
        }
        return first.substr(0, first.rfind('@'));
    }

    size_t at = first.find('@');
    return at != std::string::npos ? first.substr(0, at) : first;
}

// ---------------------------------------------------------------------------
// Loader
// ---------------------------------------------------------------------------

static SpecList spec_block(const YarnNode& node, const char* key) {
    SpecList out;
    const YarnNode* block = node.find(key);
    if (!block || !block->is_block) return out;
    for (const auto& child : block->children) {
        out.emplace_back(child.key, child.value);
    }
    return out;
}

static PackageEntry read_entry(const YarnNode& node) {
    PackageEntry entry;
    entry.version = node.get("version");
    entry.resolved = node.get("resolved");
    entry.integrity = node.get("integrity");
    entry.link = entry.resolved.rfind("file:", 0) == 0 ||
                 entry.resolved.rfind("link:", 0) == 0;
    entry.dependencies = spec_block(node, "dependencies");
    entry.optional_dependencies = spec_block(node, "optionalDependencies");
    entry.peer_dependencies = spec_block(node, "peerDependencies");
    return entry;
}

Result<LockTables> load_yarn_classic_tables(const std::string& content,
                                            const std::string& filename) {
    auto doc = parse_yarn_lock(content, filename);
    if (doc.is_err()) return std::move(doc).error();

    LockTables tables;
    tables.format = LockfileFormat::YarnClassic;
    tables.lockfile_version = doc.value().lockfile_version;

    for (const auto& node : doc.value().entries) {
        if (!node.is_block) continue;
        tables.packages.add(node.key, read_entry(node));
    }

    log::debug("yarn classic lockfile v%s: %zu entries",
               tables.lockfile_version.c_str(), tables.packages.size());
    return Result<LockTables>::ok(std::move(tables));
}

// ---------------------------------------------------------------------------
// Extraction
// ---------------------------------------------------------------------------

std::optional<Dependency> extract_yarn_classic_entry(const std::string& key,
                                                     const PackageEntry& entry) {
    if (entry.link) return std::nullopt;

    std::string name = parse_yarn_classic_key(key);
    if (name.empty() || entry.version.empty()) return std::nullopt;

    Dependency dep;
    dep.name = std::move(name);
    dep.version = entry.version;
    dep.integrity = entry.integrity;
    dep.resolved = entry.resolved;
    return dep;
}

} // namespace flatlock
