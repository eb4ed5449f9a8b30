#include <flatlock/workspace.hpp>
#include <flatlock/log.hpp>
#include <flatlock/manifest.hpp>
#include <flatlock/parsers/npm.hpp>
#include <flatlock/parsers/yarn_classic.hpp>
#include <filesystem>

namespace fs = std::filesystem;

namespace flatlock {

WorkspacePackages load_workspace_packages(const std::vector<std::string>& paths,
                                          const std::string& repo_dir) {
    WorkspacePackages packages;
    for (const auto& ws_path : paths) {
        fs::path manifest_path = fs::path(repo_dir) / ws_path / "package.json";
        auto manifest = PackageManifest::load(manifest_path.string());
        if (manifest.is_err()) {
            log::warn("skipping workspace '%s': %s", ws_path.c_str(),
                      manifest.error().message.c_str());
            continue;
        }

        const auto& m = manifest.value();
        if (m.name.empty()) {
            log::warn("skipping workspace '%s': package.json has no name",
                      ws_path.c_str());
            continue;
        }

        WorkspacePackage pkg;
        pkg.path = ws_path;
        pkg.name = m.name;
        pkg.version = m.version.empty() ? "0.0.0" : m.version;
        packages[ws_path] = std::move(pkg);
    }
    log::debug("loaded %zu of %zu workspace manifests", packages.size(), paths.size());
    return packages;
}

// "workspace:^" and "workspace:*" are ranges on the referring side, not paths
static bool is_workspace_range(const std::string& target) {
    if (target.empty()) return true;
    char c = target[0];
    return c == '^' || c == '~' || c == '*' || c == '<' || c == '>' || c == '=' ||
           (c >= '0' && c <= '9');
}

WorkspacePackages yarn_berry_workspaces(const LockTables& tables) {
    static const std::string marker = "@workspace:";

    WorkspacePackages packages;
    if (tables.format != LockfileFormat::YarnBerry) return packages;

    for (const auto& [key, entry] : tables.packages) {
        if (key.find(marker) == std::string::npos) continue;
        for (const auto& descriptor : split_yarn_descriptors(key)) {
            size_t idx = descriptor.find(marker);
            if (idx == std::string::npos) continue;

            std::string path = descriptor.substr(idx + marker.size());
            if (is_workspace_range(path)) continue;

            WorkspacePackage pkg;
            pkg.path = std::move(path);
            pkg.name = descriptor.substr(0, idx);
            pkg.version = entry.version.empty() ? "0.0.0" : entry.version;
            packages[pkg.path] = std::move(pkg);
        }
    }
    return packages;
}

std::vector<std::string> lockfile_workspace_paths(const LockTables& tables) {
    std::vector<std::string> paths;
    switch (tables.format) {
        case LockfileFormat::Pnpm:
            for (const auto& [path, importer] : tables.importers) {
                if (path != ".") paths.push_back(path);
            }
            break;
        case LockfileFormat::Npm:
            for (const auto& [path, entry] : tables.packages) {
                if (!path.empty() && !is_installed_path(path)) paths.push_back(path);
            }
            break;
        case LockfileFormat::YarnBerry:
            for (const auto& [path, pkg] : yarn_berry_workspaces(tables)) {
                if (path != ".") paths.push_back(path);
            }
            break;
        case LockfileFormat::YarnClassic:
            // v1 lockfiles do not record workspaces
            break;
    }
    return paths;
}

std::string resolve_relative_path(const std::string& from, const std::string& rel) {
    std::vector<std::string> parts;
    auto push_segments = [&parts](const std::string& path) {
        size_t start = 0;
        while (start <= path.size()) {
            size_t slash = path.find('/', start);
            if (slash == std::string::npos) slash = path.size();
            std::string seg = path.substr(start, slash - start);
            if (seg == "..") {
                if (!parts.empty()) parts.pop_back();
            } else if (!seg.empty() && seg != ".") {
                parts.push_back(std::move(seg));
            }
            start = slash + 1;
        }
    };
    push_segments(from);
    push_segments(rel);

    if (parts.empty()) return ".";
    std::string joined = parts.front();
    for (size_t i = 1; i < parts.size(); ++i) {
        joined += '/';
        joined += parts[i];
    }
    return joined;
}

} // namespace flatlock
