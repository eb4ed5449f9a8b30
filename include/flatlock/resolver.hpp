#pragma once

#include <flatlock/dependency.hpp>
#include <flatlock/lockfile.hpp>
#include <flatlock/manifest.hpp>
#include <flatlock/workspace.hpp>

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace flatlock {

struct DependenciesOfOptions {
    std::string workspace_path;   // empty = repository root
    bool dev = false;             // follow devDependencies of the manifest
    bool optional = true;         // follow optionalDependencies everywhere
    bool peer = false;            // follow peerDependencies of the manifest
    // Workspace siblings to report; links are walked with or without it
    std::optional<WorkspacePackages> workspace_packages;
};

// Raw lockfile tables plus the indexes resolution looks things up in.
// Immutable once built; shared between a set and its resolver.
class LockGraph {
public:
    // Runs extraction over the tables once, in lockfile order
    explicit LockGraph(std::shared_ptr<const LockTables> tables);

    const LockTables& tables() const { return *tables_; }
    LockfileFormat format() const { return tables_->format; }

    // Extracted records in lockfile order
    const std::vector<Dependency>& records() const { return records_; }

    // nullptr when not extracted
    const Dependency* record(const std::string& key) const;
    const Dependency* first_by_name(const std::string& name) const;

    // Every raw entry recorded for name@version: package keys first, then
    // pnpm v9 snapshots (one per peer variant)
    const std::vector<const PackageEntry*>& entries_for(const std::string& key) const;

    // yarn: the (key, entry) whose key lists this descriptor ("name@range")
    const PackageTable::value_type* find_descriptor(const std::string& descriptor) const;

private:
    void index_entry(const std::string& key, const PackageEntry& entry);

    std::shared_ptr<const LockTables> tables_;
    std::vector<Dependency> records_;
    std::unordered_map<std::string, size_t> by_key_;
    std::unordered_map<std::string, size_t> first_by_name_;
    std::unordered_map<std::string, std::vector<const PackageEntry*>> by_id_;
    std::unordered_map<std::string, const PackageTable::value_type*> by_descriptor_;
};

// A name to expand, with the version reference or range its referrer gave
struct Seed {
    std::string name;
    std::string spec;
};

// dependencies, then dev/optional/peer per the flags; first occurrence wins
std::vector<Seed> collect_seeds(const PackageManifest& manifest,
                                const DependenciesOfOptions& options);

// Decode a pnpm importer or dependency value into the package it pins:
//   "1.0.0", "1.0.0(react@18.2.0)", "1.0.0_react@18.2.0" -> {name, 1.0.0}
//   "/string-width/4.2.3", "string-width@4.2.3"           -> the aliased package
//   "link:../a", "file:../a"                              -> nullopt
std::optional<PackageId> resolve_version_ref(const std::string& name,
                                             const std::string& ref);

// Transitive closure of a workspace's declared dependencies.
// One version per name: each name is expanded once. Names that cannot be
// located are dropped and logged at debug level.
class TransitiveResolver {
public:
    explicit TransitiveResolver(const LockGraph& graph);

    // Records in discovery order, unique by name@version
    std::vector<Dependency> resolve(const PackageManifest& manifest,
                                    const DependenciesOfOptions& options) const;

private:
    struct Walk;

    // A raw entry found for a name, with the path its own dependencies are
    // looked up from (npm nesting)
    struct Located {
        const PackageEntry* entry = nullptr;
        std::string path;
    };

    // -- Importer-pinned (pnpm) ---------------------------------------------
    bool has_importer(const std::string& ws_key) const;
    std::vector<Dependency> resolve_pinned(const std::vector<Seed>& seeds,
                                           const std::string& ws_key,
                                           const DependenciesOfOptions& options) const;
    const Dependency* pinned_record(const std::string& name, const std::string& ref,
                                    const ImporterEntry& start) const;
    void follow_importer_link(Walk& walk, const std::string& target) const;

    // -- Hoisting (npm, yarn, pnpm without importers) ------------------------
    std::vector<Dependency> resolve_hoisted(const std::vector<Seed>& seeds,
                                            const DependenciesOfOptions& options) const;
    Located locate_npm(const std::string& name, const std::string& context) const;
    const PackageTable::value_type* locate_yarn(const std::string& name,
                                                const std::string& range) const;
    void follow_workspace(Walk& walk, const WorkspacePackage& ws) const;
    void follow_npm_link(Walk& walk, const PackageEntry& link) const;

    // Enqueue an entry's dependencies (+ optional when the flag is set)
    void expand_entry(Walk& walk, const PackageEntry& entry,
                      const std::string& context) const;

    const LockGraph& graph_;
};

} // namespace flatlock
