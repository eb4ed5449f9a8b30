#pragma once

#include <flatlock/dependency.hpp>
#include <flatlock/detect.hpp>
#include <flatlock/result.hpp>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace flatlock {

// One raw lockfile package, reduced to what extraction and resolution read
struct PackageEntry {
    std::string name;             // recorded "name" field (npm workspaces), often empty
    std::string version;
    std::string resolved;         // npm/yarn "resolved", pnpm tarball, berry resolution
    std::string integrity;        // npm/yarn "integrity", pnpm resolution.integrity, berry checksum
    std::string resolution_type;  // pnpm resolution.type ("directory", "git", ...)
    bool link = false;

    SpecList dependencies;
    SpecList optional_dependencies;
    SpecList peer_dependencies;
    SpecList dev_dependencies;
};

// Package entries in lockfile order with lookup by key
class PackageTable {
public:
    using value_type = std::pair<std::string, PackageEntry>;
    using const_iterator = std::vector<value_type>::const_iterator;

    // A repeated key replaces the earlier entry in place
    void add(std::string key, PackageEntry entry);

    // nullptr if the key is not in the table
    const PackageEntry* find(const std::string& key) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

private:
    std::vector<value_type> entries_;
    std::unordered_map<std::string, size_t> index_;
};

// One pnpm importer (workspace project). Values are the pinned version refs.
struct ImporterEntry {
    SpecList dependencies;
    SpecList dev_dependencies;
    SpecList optional_dependencies;
    SpecList peer_dependencies;
};

struct LockTables {
    LockfileFormat format = LockfileFormat::Npm;
    std::string lockfile_version;     // raw text
    PnpmVersion pnpm;                 // pnpm only
    PackageTable packages;
    PackageTable snapshots;           // pnpm v9
    std::map<std::string, ImporterEntry> importers;  // pnpm, keyed by workspace path
};

// Load the raw package tables of a lockfile in the given format.
// Structurally invalid input is a Parse error; nothing partial is returned.
Result<LockTables> load_tables(const std::string& content, LockfileFormat format,
                               const std::string& filename = "<input>");

} // namespace flatlock
