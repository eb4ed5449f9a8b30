#include <flatlock/dependency_set.hpp>
#include <flatlock/log.hpp>
#include <flatlock/workspace.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace flatlock {

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

Result<DependencySet> DependencySet::from_string(const std::string& content,
                                                 const ParseOptions& options) {
    auto tables = parse_lockfile(content, options);
    if (tables.is_err()) return std::move(tables).error();

    auto shared = std::make_shared<const LockTables>(std::move(tables).value());
    auto graph = std::make_shared<const LockGraph>(shared);

    DependencySet set;
    set.format_ = shared->format;
    for (const auto& dep : graph->records()) {
        set.deps_.emplace(dep.key(), dep);
    }
    set.graph_ = std::move(graph);

    log::debug("%s lockfile: %zu unique dependencies",
               format_name(shared->format), set.deps_.size());
    return Result<DependencySet>::ok(std::move(set));
}

Result<DependencySet> DependencySet::from_path(const std::string& path,
                                               ParseOptions options) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return FlatlockError{FlatlockError::NotFound,
            "lockfile not found: " + path, "check the path or run the package manager"};
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return FlatlockError{FlatlockError::IO, "cannot open lockfile: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return FlatlockError{FlatlockError::IO, "failed to read lockfile: " + path};
    }

    if (options.path.empty()) options.path = path;
    return from_string(ss.str(), options);
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

bool DependencySet::has(const std::string& key) const {
    return deps_.count(key) > 0;
}

const Dependency* DependencySet::get(const std::string& key) const {
    auto it = deps_.find(key);
    return it == deps_.end() ? nullptr : &it->second;
}

std::vector<std::string> DependencySet::keys() const {
    std::vector<std::string> out;
    out.reserve(deps_.size());
    for (const auto& [key, dep] : deps_) out.push_back(key);
    return out;
}

std::vector<Dependency> DependencySet::values() const {
    std::vector<Dependency> out;
    out.reserve(deps_.size());
    for (const auto& [key, dep] : deps_) out.push_back(dep);
    return out;
}

std::vector<std::pair<std::string, Dependency>> DependencySet::entries() const {
    return {deps_.begin(), deps_.end()};
}

std::vector<Dependency> DependencySet::to_vector() const {
    return values();
}

void DependencySet::for_each(const std::function<void(const Dependency&)>& fn) const {
    for (const auto& [key, dep] : deps_) fn(dep);
}

// ---------------------------------------------------------------------------
// Set algebra
// ---------------------------------------------------------------------------

DependencySet DependencySet::union_with(const DependencySet& other) const {
    DependencySet out;
    out.deps_ = deps_;
    // emplace keeps the existing (left) record on duplicate keys
    for (const auto& [key, dep] : other.deps_) out.deps_.emplace(key, dep);
    return out;
}

DependencySet DependencySet::intersection(const DependencySet& other) const {
    DependencySet out;
    for (const auto& [key, dep] : deps_) {
        if (other.has(key)) out.deps_.emplace(key, dep);
    }
    return out;
}

DependencySet DependencySet::difference(const DependencySet& other) const {
    DependencySet out;
    for (const auto& [key, dep] : deps_) {
        if (!other.has(key)) out.deps_.emplace(key, dep);
    }
    return out;
}

bool DependencySet::is_subset_of(const DependencySet& other) const {
    if (deps_.size() > other.deps_.size()) return false;
    for (const auto& [key, dep] : deps_) {
        if (!other.has(key)) return false;
    }
    return true;
}

bool DependencySet::is_superset_of(const DependencySet& other) const {
    return other.is_subset_of(*this);
}

bool DependencySet::is_disjoint_from(const DependencySet& other) const {
    const DependencySet& small = deps_.size() <= other.deps_.size() ? *this : other;
    const DependencySet& large = &small == this ? other : *this;
    for (const auto& [key, dep] : small.deps_) {
        if (large.has(key)) return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Traversal
// ---------------------------------------------------------------------------

static FlatlockError traversal_error() {
    return FlatlockError{FlatlockError::Traversal,
        "set has no lockfile data to traverse",
        "call dependencies_of() on a set built by from_string() or from_path(), "
        "before any set operation"};
}

Result<DependencySet> DependencySet::dependencies_of(
    const PackageManifest& manifest,
    const DependenciesOfOptions& options) const
{
    if (!graph_) return traversal_error();

    TransitiveResolver resolver(*graph_);
    DependencySet out;
    out.format_ = format_;
    for (auto& dep : resolver.resolve(manifest, options)) {
        std::string key = dep.key();
        out.deps_.emplace(std::move(key), std::move(dep));
    }
    return Result<DependencySet>::ok(std::move(out));
}

Result<DependencySet> DependencySet::dependencies_of(
    const Json::Value& manifest,
    const DependenciesOfOptions& options) const
{
    if (!graph_) return traversal_error();
    if (!manifest.isObject()) {
        return FlatlockError{FlatlockError::Traversal,
            "package manifest must be a JSON object"};
    }

    auto parsed = PackageManifest::from_json(manifest).with_code(FlatlockError::Traversal);
    if (parsed.is_err()) return std::move(parsed).error();
    return dependencies_of(parsed.value(), options);
}

std::vector<std::string> DependencySet::workspace_paths() const {
    if (!graph_) return {};
    return lockfile_workspace_paths(graph_->tables());
}

} // namespace flatlock
