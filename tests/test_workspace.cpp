#include <catch2/catch.hpp>
#include <flatlock/extract.hpp>
#include <flatlock/workspace.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace flatlock;
namespace fs = std::filesystem;

static std::string fixture_dir() {
    const char* src = std::getenv("FLATLOCK_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures";
    return "../tests/fixtures";
}

static std::string read_file(const std::string& path) {
    std::ifstream f(path);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

static LockTables load_fixture(const std::string& rel) {
    ParseOptions opts;
    opts.path = rel;
    auto r = parse_lockfile(read_file(fixture_dir() + "/" + rel), opts);
    if (r.is_err()) FAIL(r.error().format());
    return std::move(r).value();
}

// RAII temp directory
struct TempDir {
    fs::path path;

    TempDir() {
        path = fs::temp_directory_path() / ("flatlock_ws_test_" + std::to_string(
            std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    void write_file(const std::string& rel, const std::string& content) {
        fs::path full = path / rel;
        fs::create_directories(full.parent_path());
        std::ofstream f(full);
        f << content;
    }
};

// ===== Workspace manifests =====

TEST_CASE("load workspace packages from the monorepo fixture", "[workspace]") {
    auto packages = load_workspace_packages(
        {"packages/bar", "packages/foo", "packages/noname", "packages/missing"},
        fixture_dir() + "/monorepo");

    // noname has no "name"; missing has no package.json
    REQUIRE(packages.size() == 2);
    REQUIRE(packages.at("packages/bar").name == "bar");
    REQUIRE(packages.at("packages/bar").version == "0.3.0");
    REQUIRE(packages.at("packages/foo").name == "foo");
    REQUIRE(packages.at("packages/foo").path == "packages/foo");
    REQUIRE(packages.count("packages/noname") == 0);
}

TEST_CASE("workspace without a version gets 0.0.0", "[workspace]") {
    TempDir td;
    td.write_file("tools/cli/package.json", R"({"name": "cli"})");
    td.write_file("tools/broken/package.json", "{ not json");

    auto packages = load_workspace_packages({"tools/cli", "tools/broken"}, td.path.string());
    REQUIRE(packages.size() == 1);
    REQUIRE(packages.at("tools/cli").version == "0.0.0");
}

// ===== Lockfile workspaces =====

TEST_CASE("yarn berry workspaces from descriptors", "[workspace]") {
    auto tables = load_fixture("yarn-berry/yarn.lock");
    auto packages = yarn_berry_workspaces(tables);

    // "lib@workspace:^" is a range, not a path
    REQUIRE(packages.size() == 3);
    REQUIRE(packages.at(".").name == "mono");
    REQUIRE(packages.at("packages/app").name == "app");
    REQUIRE(packages.at("packages/lib").name == "lib");
    REQUIRE(packages.at("packages/lib").version == "0.0.0-use.local");
    REQUIRE(packages.count("^") == 0);
}

TEST_CASE("yarn berry workspaces is empty for other formats", "[workspace]") {
    REQUIRE(yarn_berry_workspaces(load_fixture("pnpm/pnpm-lock-v9.yaml")).empty());
}

TEST_CASE("lockfile workspace paths per format", "[workspace]") {
    REQUIRE(lockfile_workspace_paths(load_fixture("monorepo/package-lock.json")) ==
            std::vector<std::string>{"packages/bar", "packages/foo"});
    REQUIRE(lockfile_workspace_paths(load_fixture("pnpm/pnpm-lock-v9.yaml")) ==
            std::vector<std::string>{"packages/app", "packages/bar"});
    REQUIRE(lockfile_workspace_paths(load_fixture("yarn-berry/yarn.lock")) ==
            std::vector<std::string>{"packages/app", "packages/lib"});
    REQUIRE(lockfile_workspace_paths(load_fixture("yarn-classic/yarn.lock")).empty());
    REQUIRE(lockfile_workspace_paths(load_fixture("pnpm/pnpm-lock-v6.yaml")).empty());
}

// ===== Paths =====

TEST_CASE("resolve_relative_path", "[workspace]") {
    REQUIRE(resolve_relative_path("packages/a", "../b") == "packages/b");
    REQUIRE(resolve_relative_path(".", "packages/b") == "packages/b");
    REQUIRE(resolve_relative_path("", "packages/b") == "packages/b");
    REQUIRE(resolve_relative_path("packages/a", "../..") == ".");
    REQUIRE(resolve_relative_path("packages/a", "./lib") == "packages/a/lib");
    REQUIRE(resolve_relative_path("a//b/", "c") == "a/b/c");
    REQUIRE(resolve_relative_path("a", "../../../b") == "b");
}
