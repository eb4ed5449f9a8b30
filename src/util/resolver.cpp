#include <flatlock/resolver.hpp>
#include <flatlock/extract.hpp>
#include <flatlock/log.hpp>
#include <flatlock/parsers/pnpm.hpp>
#include <flatlock/parsers/yarn_classic.hpp>

#include <cctype>
#include <queue>
#include <unordered_set>

namespace flatlock {

// ---------------------------------------------------------------------------
// LockGraph
// ---------------------------------------------------------------------------

LockGraph::LockGraph(std::shared_ptr<const LockTables> tables)
    : tables_(std::move(tables)) {
    DependencyStream stream(tables_);
    while (auto dep = stream.next()) {
        size_t idx = records_.size();
        by_key_.emplace(dep->key(), idx);
        first_by_name_.emplace(dep->name, idx);
        records_.push_back(std::move(*dep));
    }

    for (const auto& kv : tables_->packages) {
        index_entry(kv.first, kv.second);
    }

    if (tables_->format == LockfileFormat::Pnpm) {
        for (const auto& [key, entry] : tables_->snapshots) {
            auto id = parse_pnpm_spec_for_era(key, tables_->pnpm.era);
            if (id) by_id_[dependency_key(id->name, id->version)].push_back(&entry);
        }
    }

    if (tables_->format == LockfileFormat::YarnClassic ||
        tables_->format == LockfileFormat::YarnBerry) {
        for (const auto& kv : tables_->packages) {
            for (const auto& descriptor : split_yarn_descriptors(kv.first)) {
                by_descriptor_.emplace(descriptor, &kv);
            }
        }
    }

    log::debug("lock graph: %zu records, %zu ids, %zu descriptors",
               records_.size(), by_id_.size(), by_descriptor_.size());
}

void LockGraph::index_entry(const std::string& key, const PackageEntry& entry) {
    auto dep = extract_entry(*tables_, key, entry);
    if (dep) by_id_[dep->key()].push_back(&entry);
}

const Dependency* LockGraph::record(const std::string& key) const {
    auto it = by_key_.find(key);
    return it == by_key_.end() ? nullptr : &records_[it->second];
}

const Dependency* LockGraph::first_by_name(const std::string& name) const {
    auto it = first_by_name_.find(name);
    return it == first_by_name_.end() ? nullptr : &records_[it->second];
}

const std::vector<const PackageEntry*>& LockGraph::entries_for(const std::string& key) const {
    static const std::vector<const PackageEntry*> empty;
    auto it = by_id_.find(key);
    return it == by_id_.end() ? empty : it->second;
}

const PackageTable::value_type* LockGraph::find_descriptor(const std::string& descriptor) const {
    auto it = by_descriptor_.find(descriptor);
    return it == by_descriptor_.end() ? nullptr : it->second;
}

// ---------------------------------------------------------------------------
// Seeds and version references
// ---------------------------------------------------------------------------

std::vector<Seed> collect_seeds(const PackageManifest& manifest,
                                const DependenciesOfOptions& options) {
    std::vector<Seed> seeds;
    std::unordered_set<std::string> seen;
    auto add = [&](const SpecList& specs) {
        for (const auto& [name, range] : specs) {
            if (seen.insert(name).second) seeds.push_back({name, range});
        }
    };

    add(manifest.dependencies);
    if (options.dev) add(manifest.dev_dependencies);
    if (options.optional) add(manifest.optional_dependencies);
    if (options.peer) add(manifest.peer_dependencies);
    return seeds;
}

std::optional<PackageId> resolve_version_ref(const std::string& name,
                                             const std::string& ref) {
    if (ref.empty() || is_local_spec(ref)) return std::nullopt;

    if (std::isdigit(static_cast<unsigned char>(ref[0]))) {
        size_t cut = ref.find_first_of("(_");
        return PackageId{name, ref.substr(0, cut)};
    }
    return parse_pnpm_spec(ref);
}

// ---------------------------------------------------------------------------
// Walk state
// ---------------------------------------------------------------------------

struct TransitiveResolver::Walk {
    struct Item {
        std::string name;
        std::string spec;      // pinned ref (pnpm) or range (npm, yarn)
        std::string context;   // importer or package path the reference came from
    };

    const DependenciesOfOptions& options;
    std::queue<Item> queue;
    std::unordered_set<std::string> visited;      // names
    std::unordered_set<std::string> visited_ws;   // workspace paths
    std::unordered_set<std::string> emitted;      // name@version
    std::vector<Dependency> result;

    // Hoisting only: workspace siblings by path and by name
    WorkspacePackages workspaces;
    std::unordered_map<std::string, const WorkspacePackage*> workspace_by_name;

    explicit Walk(const DependenciesOfOptions& opts) : options(opts) {}

    void emit(const Dependency& dep) {
        if (emitted.insert(dep.key()).second) result.push_back(dep);
    }

    void emit_workspace(const std::string& path) {
        auto it = workspaces.find(path);
        if (it == workspaces.end()) return;
        Dependency dep;
        dep.name = it->second.name;
        dep.version = it->second.version;
        emit(dep);
    }

    void enqueue(const SpecList& specs, const std::string& context) {
        for (const auto& [name, spec] : specs) {
            if (!visited.count(name)) queue.push({name, spec, context});
        }
    }

    // Workspace projects contribute their dev and peer sections by flag
    template<typename Sections>
    void enqueue_workspace(const Sections& s, const std::string& context) {
        enqueue(s.dependencies, context);
        if (options.dev) enqueue(s.dev_dependencies, context);
        if (options.optional) enqueue(s.optional_dependencies, context);
        if (options.peer) enqueue(s.peer_dependencies, context);
    }
};

// ---------------------------------------------------------------------------
// TransitiveResolver
// ---------------------------------------------------------------------------

TransitiveResolver::TransitiveResolver(const LockGraph& graph)
    : graph_(graph) {}

std::vector<Dependency> TransitiveResolver::resolve(
    const PackageManifest& manifest,
    const DependenciesOfOptions& options) const
{
    auto seeds = collect_seeds(manifest, options);
    std::string ws_key = options.workspace_path.empty() ? "." : options.workspace_path;

    if (graph_.format() == LockfileFormat::Pnpm && has_importer(ws_key)) {
        log::debug("resolving %zu seeds through importer '%s'",
                   seeds.size(), ws_key.c_str());
        return resolve_pinned(seeds, ws_key, options);
    }
    log::debug("resolving %zu seeds by hoisting", seeds.size());
    return resolve_hoisted(seeds, options);
}

void TransitiveResolver::expand_entry(Walk& walk, const PackageEntry& entry,
                                      const std::string& context) const {
    walk.enqueue(entry.dependencies, context);
    if (walk.options.optional) walk.enqueue(entry.optional_dependencies, context);
}

// ---------------------------------------------------------------------------
// Importer-pinned resolution
// ---------------------------------------------------------------------------

bool TransitiveResolver::has_importer(const std::string& ws_key) const {
    return graph_.tables().importers.count(ws_key) > 0;
}

static const std::string* importer_ref(const ImporterEntry& importer,
                                       const std::string& name) {
    for (const SpecList* section : {&importer.dependencies, &importer.dev_dependencies,
                                    &importer.optional_dependencies,
                                    &importer.peer_dependencies}) {
        if (const std::string* ref = find_spec(*section, name)) return ref;
    }
    return nullptr;
}

// Pinned ref, then the starting importer's ref, then the first record
const Dependency* TransitiveResolver::pinned_record(const std::string& name,
                                                    const std::string& ref,
                                                    const ImporterEntry& start) const {
    if (auto id = resolve_version_ref(name, ref)) {
        if (auto* dep = graph_.record(dependency_key(id->name, id->version))) return dep;
    }
    if (const std::string* start_ref = importer_ref(start, name)) {
        if (auto id = resolve_version_ref(name, *start_ref)) {
            if (auto* dep = graph_.record(dependency_key(id->name, id->version))) return dep;
        }
    }
    return graph_.first_by_name(name);
}

std::vector<Dependency> TransitiveResolver::resolve_pinned(
    const std::vector<Seed>& seeds,
    const std::string& ws_key,
    const DependenciesOfOptions& options) const
{
    const ImporterEntry& start = graph_.tables().importers.at(ws_key);

    Walk walk(options);
    if (options.workspace_packages) walk.workspaces = *options.workspace_packages;
    walk.visited_ws.insert(ws_key);

    for (const auto& seed : seeds) {
        const std::string* ref = importer_ref(start, seed.name);
        walk.queue.push({seed.name, ref ? *ref : "", ws_key});
    }

    while (!walk.queue.empty()) {
        auto item = std::move(walk.queue.front());
        walk.queue.pop();
        if (!walk.visited.insert(item.name).second) continue;

        // Linked siblings are always walked; they are reported only when
        // workspace_packages names them
        if (item.spec.rfind("link:", 0) == 0) {
            follow_importer_link(walk,
                resolve_relative_path(item.context, item.spec.substr(5)));
            continue;
        }

        const Dependency* dep = pinned_record(item.name, item.spec, start);
        if (!dep) {
            log::debug("unresolved dependency '%s' (%s)",
                       item.name.c_str(), item.spec.c_str());
            continue;
        }
        walk.emit(*dep);

        // Every peer variant of the package contributes its edges
        for (const PackageEntry* entry : graph_.entries_for(dep->key())) {
            expand_entry(walk, *entry, item.context);
        }
    }
    return std::move(walk.result);
}

void TransitiveResolver::follow_importer_link(Walk& walk, const std::string& target) const {
    if (!walk.visited_ws.insert(target).second) return;
    walk.emit_workspace(target);

    const auto& importers = graph_.tables().importers;
    auto it = importers.find(target);
    if (it == importers.end()) {
        log::debug("link target '%s' has no importer", target.c_str());
        return;
    }
    walk.enqueue_workspace(it->second, target);
}

// ---------------------------------------------------------------------------
// Hoisting resolution
// ---------------------------------------------------------------------------

std::vector<Dependency> TransitiveResolver::resolve_hoisted(
    const std::vector<Seed>& seeds,
    const DependenciesOfOptions& options) const
{
    Walk walk(options);
    if (options.workspace_packages) {
        walk.workspaces = *options.workspace_packages;
    } else if (graph_.format() == LockfileFormat::YarnBerry &&
               !options.workspace_path.empty()) {
        walk.workspaces = yarn_berry_workspaces(graph_.tables());
    }
    for (const auto& [path, ws] : walk.workspaces) {
        walk.workspace_by_name.emplace(ws.name, &ws);
    }
    walk.visited_ws.insert(options.workspace_path.empty() ? "." : options.workspace_path);

    for (const auto& seed : seeds) {
        walk.queue.push({seed.name, seed.spec, options.workspace_path});
    }

    const LockTables& tables = graph_.tables();
    while (!walk.queue.empty()) {
        auto item = std::move(walk.queue.front());
        walk.queue.pop();
        if (!walk.visited.insert(item.name).second) continue;

        auto ws = walk.workspace_by_name.find(item.name);
        if (ws != walk.workspace_by_name.end()) {
            follow_workspace(walk, *ws->second);
            continue;
        }

        const Dependency* dep = nullptr;
        const PackageEntry* entry = nullptr;
        std::string context = item.context;

        if (tables.format == LockfileFormat::Npm) {
            Located hit = locate_npm(item.name, item.context);
            if (hit.entry && hit.entry->link) {
                follow_npm_link(walk, *hit.entry);
                continue;
            }
            if (hit.entry && !hit.entry->version.empty()) {
                dep = graph_.record(dependency_key(item.name, hit.entry->version));
                if (dep) {
                    entry = hit.entry;
                    context = hit.path;
                }
            }
        } else if (tables.format != LockfileFormat::Pnpm) {
            if (const auto* kv = locate_yarn(item.name, item.spec)) {
                if (auto found = extract_entry(tables, kv->first, kv->second)) {
                    dep = graph_.record(found->key());
                    if (dep) entry = &kv->second;
                }
            }
        }

        if (!dep) dep = graph_.first_by_name(item.name);
        if (!dep) {
            log::debug("unresolved dependency '%s' (%s)",
                       item.name.c_str(), item.spec.c_str());
            continue;
        }
        walk.emit(*dep);

        if (entry) {
            expand_entry(walk, *entry, context);
        } else {
            for (const PackageEntry* e : graph_.entries_for(dep->key())) {
                expand_entry(walk, *e, context);
            }
        }
    }
    return std::move(walk.result);
}

// Nested node_modules of the context first, walking up to the root
TransitiveResolver::Located TransitiveResolver::locate_npm(const std::string& name,
                                                           const std::string& context) const {
    static const std::string nested = "/node_modules/";
    const PackageTable& packages = graph_.tables().packages;

    std::string dir = context;
    while (!dir.empty()) {
        std::string path = dir + nested + name;
        if (const PackageEntry* entry = packages.find(path)) return {entry, path};
        size_t cut = dir.rfind(nested);
        dir = cut == std::string::npos ? "" : dir.substr(0, cut);
    }

    std::string path = "node_modules/" + name;
    return {packages.find(path), path};
}

const PackageTable::value_type* TransitiveResolver::locate_yarn(const std::string& name,
                                                                const std::string& range) const {
    if (range.empty()) return nullptr;
    std::string normalized = range;
    if (graph_.format() == LockfileFormat::YarnBerry &&
        range.find(':') == std::string::npos) {
        normalized = "npm:" + range;
    }
    return graph_.find_descriptor(name + "@" + normalized);
}

// A workspace sibling expands through its own lockfile record
void TransitiveResolver::follow_workspace(Walk& walk, const WorkspacePackage& ws) const {
    if (!walk.visited_ws.insert(ws.path).second) return;
    walk.emit_workspace(ws.path);

    const LockTables& tables = graph_.tables();
    switch (tables.format) {
        case LockfileFormat::Npm:
            if (const PackageEntry* entry = tables.packages.find(ws.path)) {
                walk.enqueue_workspace(*entry, ws.path);
            }
            break;
        case LockfileFormat::YarnBerry:
            if (const auto* kv = graph_.find_descriptor(ws.name + "@workspace:" + ws.path)) {
                walk.enqueue_workspace(kv->second, ws.path);
            }
            break;
        case LockfileFormat::Pnpm: {
            auto it = tables.importers.find(ws.path);
            if (it != tables.importers.end()) walk.enqueue_workspace(it->second, ws.path);
            break;
        }
        case LockfileFormat::YarnClassic:
            // v1 lockfiles carry no workspace records
            break;
    }
}

// npm records workspace symlinks as "node_modules/<name>" with link: true
// and the workspace path in resolved
void TransitiveResolver::follow_npm_link(Walk& walk, const PackageEntry& link) const {
    const std::string& path = link.resolved;
    if (path.empty() || !walk.visited_ws.insert(path).second) return;
    walk.emit_workspace(path);

    if (const PackageEntry* entry = graph_.tables().packages.find(path)) {
        walk.enqueue_workspace(*entry, path);
    } else {
        log::debug("link target '%s' is not in the lockfile", path.c_str());
    }
}

} // namespace flatlock
