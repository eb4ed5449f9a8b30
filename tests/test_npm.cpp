#include <catch2/catch.hpp>
#include <flatlock/parsers/npm.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

using namespace flatlock;

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

static std::vector<std::string> extracted_keys(const LockTables& tables) {
    std::vector<std::string> out;
    for (const auto& [path, entry] : tables.packages) {
        auto dep = extract_npm_entry(path, entry);
        if (dep) out.push_back(dep->key());
    }
    return out;
}

// ===== Key grammar =====

TEST_CASE("parse_npm_key", "[npm]") {
    REQUIRE(parse_npm_key("node_modules/lodash") == "lodash");
    REQUIRE(parse_npm_key("node_modules/@babel/core") == "@babel/core");
    REQUIRE(parse_npm_key("packages/bar/node_modules/debug") == "debug");
    REQUIRE(parse_npm_key("node_modules/a/node_modules/@scope/b") == "@scope/b");
    REQUIRE(parse_npm_key("lodash") == "lodash");
}

TEST_CASE("is_installed_path", "[npm]") {
    REQUIRE(is_installed_path("node_modules/lodash"));
    REQUIRE(is_installed_path("packages/bar/node_modules/debug"));
    REQUIRE_FALSE(is_installed_path("packages/bar"));
    REQUIRE_FALSE(is_installed_path(""));
}

// ===== Loader =====

TEST_CASE("load v3 lockfile", "[npm]") {
    auto r = load_npm_tables(read_file(fixture_dir() + "/monorepo/package-lock.json"));
    REQUIRE(r.is_ok());
    const auto& tables = r.value();
    REQUIRE(tables.format == LockfileFormat::Npm);
    REQUIRE(tables.lockfile_version == "3");

    const PackageEntry* bar = tables.packages.find("node_modules/bar");
    REQUIRE(bar != nullptr);
    REQUIRE(bar->link);
    REQUIRE(bar->resolved == "packages/bar");

    const PackageEntry* ws = tables.packages.find("packages/bar");
    REQUIRE(ws != nullptr);
    REQUIRE(ws->name == "bar");
    REQUIRE(ws->dependencies.size() == 1);
    REQUIRE(ws->dev_dependencies.size() == 1);
    REQUIRE(ws->optional_dependencies.size() == 1);
    REQUIRE(*find_spec(ws->dependencies, "debug") == "^3.0.0");
}

TEST_CASE("extract skips root, workspaces and links", "[npm]") {
    auto r = load_npm_tables(read_file(fixture_dir() + "/monorepo/package-lock.json"));
    REQUIRE(r.is_ok());
    auto keys = extracted_keys(r.value());

    REQUIRE(keys == std::vector<std::string>{
        "@babel/core@7.23.0",
        "debug@4.3.4",
        "fsevents@2.3.3",
        "lodash@4.17.21",
        "ms@2.1.2",
        "debug@3.2.7",
    });
}

TEST_CASE("extract keeps integrity and resolved", "[npm]") {
    PackageEntry entry;
    entry.version = "4.17.21";
    entry.integrity = "sha512-lodash";
    entry.resolved = "https://registry.npmjs.org/lodash/-/lodash-4.17.21.tgz";

    auto dep = extract_npm_entry("node_modules/lodash", entry);
    REQUIRE(dep.has_value());
    REQUIRE(dep->name == "lodash");
    REQUIRE(dep->integrity == "sha512-lodash");
    REQUIRE(dep->resolved == entry.resolved);

    entry.version.clear();
    REQUIRE_FALSE(extract_npm_entry("node_modules/lodash", entry).has_value());
}

TEST_CASE("load v1 lockfile flattens nested dependencies", "[npm]") {
    auto r = load_npm_tables(read_file(fixture_dir() + "/npm/package-lock-v1.json"));
    REQUIRE(r.is_ok());
    const auto& tables = r.value();
    REQUIRE(tables.lockfile_version == "1");

    const PackageEntry* nested = tables.packages.find("node_modules/express/node_modules/debug");
    REQUIRE(nested != nullptr);
    REQUIRE(nested->version == "2.6.9");
    REQUIRE(*find_spec(nested->dependencies, "ms") == "2.0.0");

    const PackageEntry* local = tables.packages.find("node_modules/local-lib");
    REQUIRE(local != nullptr);
    REQUIRE(local->link);

    auto keys = extracted_keys(tables);
    REQUIRE(keys.size() == 3);
    REQUIRE(std::find(keys.begin(), keys.end(), "express@4.18.2") != keys.end());
    REQUIRE(std::find(keys.begin(), keys.end(), "debug@2.6.9") != keys.end());
    REQUIRE(std::find(keys.begin(), keys.end(), "ms@2.0.0") != keys.end());
}

TEST_CASE("load npm errors", "[npm]") {
    SECTION("invalid JSON") {
        auto r = load_npm_tables("{\"packages\": ", "package-lock.json");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == FlatlockError::Parse);
        REQUIRE(r.error().file == "package-lock.json");
    }
    SECTION("root is not an object") {
        auto r = load_npm_tables("[1, 2]");
        REQUIRE(r.is_err());
        REQUIRE(r.error().message == "lockfile root must be a JSON object");
    }
    SECTION("packages is not an object") {
        auto r = load_npm_tables(R"({"lockfileVersion": 3, "packages": []})");
        REQUIRE(r.is_err());
    }
    SECTION("package entry is not an object") {
        auto r = load_npm_tables(R"({"lockfileVersion": 3, "packages": {"node_modules/a": 1}})");
        REQUIRE(r.is_err());
        REQUIRE(r.error().message == "package entry 'node_modules/a' must be an object");
    }
}

TEST_CASE("load npm lockfile without packages", "[npm]") {
    auto r = load_npm_tables(R"({"name": "empty", "lockfileVersion": 3})");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().packages.empty());
}
