// demo_flatten.cpp
//
// Print the dependencies recorded by a lockfile, one "name@version" per line.
// Run it with:
//
//     ./demo_flatten package-lock.json
//     ./demo_flatten pnpm-lock.yaml --workspace packages/bar
//     ./demo_flatten yarn.lock --manifest package.json --dev
//     ./demo_flatten pnpm-lock.yaml --workspaces        # list workspace paths
//
// Settings come from ~/.flatlock/config.toml and ./.flatlock.toml; flags win.
// FLATLOCK_LOG=debug shows detection and resolution details on stderr.

#include <flatlock/config.hpp>
#include <flatlock/dependency_set.hpp>
#include <flatlock/log.hpp>
#include <flatlock/workspace.hpp>

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using namespace flatlock;

struct Args {
    std::string lockfile;
    std::string format;
    std::string workspace;
    std::string manifest;
    bool dev = false;
    bool peer = false;
    bool no_optional = false;
    bool list_workspaces = false;
    bool integrity = false;
};

static Result<Args> parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto take = [&](std::string& out) -> Status {
            if (i + 1 >= argc) {
                return FlatlockError{FlatlockError::InvalidArg,
                    "missing value for " + a};
            }
            out = argv[++i];
            return ok_status();
        };

        if (a == "--format") {
            FLATLOCK_TRY(take(args.format));
        } else if (a == "--workspace") {
            FLATLOCK_TRY(take(args.workspace));
        } else if (a == "--manifest") {
            FLATLOCK_TRY(take(args.manifest));
        } else if (a == "--dev") {
            args.dev = true;
        } else if (a == "--peer") {
            args.peer = true;
        } else if (a == "--no-optional") {
            args.no_optional = true;
        } else if (a == "--workspaces") {
            args.list_workspaces = true;
        } else if (a == "--integrity") {
            args.integrity = true;
        } else if (!a.empty() && a[0] == '-') {
            return FlatlockError{FlatlockError::InvalidArg, "unknown option " + a};
        } else if (args.lockfile.empty()) {
            args.lockfile = a;
        } else {
            return FlatlockError{FlatlockError::InvalidArg,
                "unexpected argument " + a};
        }
    }

    if (args.lockfile.empty()) {
        return FlatlockError{FlatlockError::InvalidArg,
            "no lockfile specified",
            "usage: demo_flatten <lockfile> [--format F] [--workspace PATH] "
            "[--manifest FILE] [--dev] [--peer] [--no-optional] [--workspaces] [--integrity]"};
    }
    return Result<Args>::ok(std::move(args));
}

// Global then project config; a missing file is not an error
static Result<Config> load_config() {
    std::optional<Config> global;
    std::optional<Config> project;

    std::string gpath = global_config_path();
    if (!gpath.empty() && fs::exists(gpath)) {
        auto cfg = Config::load(gpath);
        if (cfg.is_err()) return std::move(cfg).error();
        global = std::move(cfg).value();
    }

    std::string ppath = project_config_path(".");
    if (fs::exists(ppath)) {
        auto cfg = Config::load(ppath);
        if (cfg.is_err()) return std::move(cfg).error();
        project = std::move(cfg).value();
    }
    return Result<Config>::ok(Config::effective(global, project));
}

static Result<DependencySet> select(const DependencySet& set, const Args& args,
                                    const Config& cfg) {
    DependenciesOfOptions opts = cfg.resolve_options();
    opts.workspace_path = args.workspace;
    if (args.dev) opts.dev = true;
    if (args.peer) opts.peer = true;
    if (args.no_optional) opts.optional = false;

    fs::path repo_dir = fs::path(args.lockfile).parent_path();
    if (repo_dir.empty()) repo_dir = ".";

    std::string manifest_path = args.manifest;
    if (manifest_path.empty()) {
        manifest_path = (repo_dir / args.workspace / "package.json").string();
    }

    auto manifest = PackageManifest::load(manifest_path);
    if (manifest.is_err()) return std::move(manifest).error();

    auto paths = set.workspace_paths();
    if (!paths.empty()) {
        opts.workspace_packages = load_workspace_packages(paths, repo_dir.string());
    }
    return set.dependencies_of(manifest.value(), opts);
}

static Result<int> run(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    if (args.is_err()) return std::move(args).error();
    const Args& a = args.value();

    auto cfg = load_config();
    if (cfg.is_err()) return std::move(cfg).error();
    cfg.value().apply_logging();
    log::init_from_env();

    ParseOptions popts = cfg.value().parse_options();
    if (!a.format.empty()) {
        popts.format = parse_format_name(a.format);
        if (!popts.format) {
            return FlatlockError{FlatlockError::InvalidArg,
                "unknown format '" + a.format + "'",
                "use one of: npm, pnpm, yarn-classic, yarn-berry"};
        }
    }

    auto set = DependencySet::from_path(a.lockfile, popts);
    if (set.is_err()) return std::move(set).error();
    log::info("%s: %zu dependencies (%s)", a.lockfile.c_str(), set.value().size(),
              format_name(*set.value().format()));

    if (a.list_workspaces) {
        for (const auto& path : set.value().workspace_paths()) {
            std::cout << path << "\n";
        }
        return Result<int>::ok(0);
    }

    const DependencySet* out = &set.value();
    std::optional<DependencySet> selected;
    if (!a.workspace.empty() || !a.manifest.empty()) {
        auto deps = select(set.value(), a, cfg.value());
        if (deps.is_err()) return std::move(deps).error();
        selected = std::move(deps).value();
        out = &*selected;
    }

    out->for_each([&](const Dependency& dep) {
        std::cout << dep.key();
        if (a.integrity && !dep.integrity.empty()) std::cout << " " << dep.integrity;
        std::cout << "\n";
    });
    return Result<int>::ok(0);
}

int main(int argc, char** argv) {
    auto result = run(argc, argv);
    if (result.is_err()) {
        std::cerr << result.error().format() << "\n";
        return 1;
    }
    return result.value();
}
