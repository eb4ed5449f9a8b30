#pragma once

#include <flatlock/lockfile.hpp>
#include <map>
#include <string>
#include <vector>

namespace flatlock {

// A package that lives inside the repository rather than the registry
struct WorkspacePackage {
    std::string path;     // repository-relative, as the lockfile records it
    std::string name;
    std::string version;  // "0.0.0" when the manifest has none
};

// Keyed by workspace path
using WorkspacePackages = std::map<std::string, WorkspacePackage>;

// Read <repo_dir>/<path>/package.json for each path. Unreadable or unnamed
// manifests are skipped with a warning.
WorkspacePackages load_workspace_packages(const std::vector<std::string>& paths,
                                          const std::string& repo_dir);

// Workspaces declared by "name@workspace:path" descriptors of a berry lockfile,
// the root "." included
WorkspacePackages yarn_berry_workspaces(const LockTables& tables);

// Workspace paths the lockfile knows about, the root excluded:
//   pnpm:       importers other than "."
//   npm:        package paths outside node_modules
//   yarn berry: workspace: descriptors other than "."
std::vector<std::string> lockfile_workspace_paths(const LockTables& tables);

// Join a workspace-relative link target onto a workspace path.
// ("packages/a", "../b") -> "packages/b"; an empty result is "."
std::string resolve_relative_path(const std::string& from, const std::string& rel);

} // namespace flatlock
