#pragma once

#include <flatlock/dependency.hpp>
#include <flatlock/extract.hpp>
#include <flatlock/manifest.hpp>
#include <flatlock/resolver.hpp>
#include <flatlock/result.hpp>
#include <json/json.h>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace flatlock {

// Immutable set of lockfile dependencies keyed by "name@version".
//
// Sets built from a lockfile keep its lock graph and can answer
// dependencies_of(). Sets produced by algebra or by dependencies_of() cannot.
class DependencySet {
public:
    using Map = std::map<std::string, Dependency>;
    using const_iterator = Map::const_iterator;

    // Parse a lockfile held in memory
    static Result<DependencySet> from_string(const std::string& content,
                                             const ParseOptions& options = {});

    // Read and parse a lockfile; options.path defaults to path
    static Result<DependencySet> from_path(const std::string& path,
                                           ParseOptions options = {});

    size_t size() const { return deps_.size(); }
    bool empty() const { return deps_.empty(); }
    std::optional<LockfileFormat> format() const { return format_; }
    bool can_traverse() const { return graph_ != nullptr; }

    bool has(const std::string& key) const;

    // nullptr when absent
    const Dependency* get(const std::string& key) const;

    const_iterator begin() const { return deps_.begin(); }
    const_iterator end() const { return deps_.end(); }

    // All sorted by key
    std::vector<std::string> keys() const;
    std::vector<Dependency> values() const;
    std::vector<std::pair<std::string, Dependency>> entries() const;
    std::vector<Dependency> to_vector() const;

    void for_each(const std::function<void(const Dependency&)>& fn) const;

    // -- Set algebra ----------------------------------------------------------
    // Results have no format and cannot traverse.

    // Left-biased on duplicate keys
    DependencySet union_with(const DependencySet& other) const;
    DependencySet intersection(const DependencySet& other) const;
    DependencySet difference(const DependencySet& other) const;

    bool is_subset_of(const DependencySet& other) const;
    bool is_superset_of(const DependencySet& other) const;
    bool is_disjoint_from(const DependencySet& other) const;

    // -- Traversal ------------------------------------------------------------

    // Transitive dependencies of one workspace. Traversal error when this set
    // cannot traverse. The result keeps format() and cannot traverse.
    Result<DependencySet> dependencies_of(const PackageManifest& manifest,
                                          const DependenciesOfOptions& options = {}) const;

    // Same, from a parsed package.json; a non-object or invalid manifest is
    // a Traversal error
    Result<DependencySet> dependencies_of(const Json::Value& manifest,
                                          const DependenciesOfOptions& options = {}) const;

    // Workspace paths recorded by the lockfile, root excluded.
    // Empty for sets that cannot traverse.
    std::vector<std::string> workspace_paths() const;

private:
    DependencySet() = default;

    Map deps_;
    std::optional<LockfileFormat> format_;
    std::shared_ptr<const LockGraph> graph_;
};

} // namespace flatlock
