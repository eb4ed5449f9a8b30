#include <catch2/catch.hpp>
#include <flatlock/parsers/yarn_berry.hpp>
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

// ===== Key and locator grammar =====

TEST_CASE("parse_yarn_berry_key", "[yarn-berry]") {
    REQUIRE(parse_yarn_berry_key("lodash@npm:^4.17.21") == "lodash");
    REQUIRE(parse_yarn_berry_key("@babel/core@npm:^7.0.0, @babel/core@npm:^7.23.0") ==
            "@babel/core");
    REQUIRE(parse_yarn_berry_key("app@workspace:packages/app") == "app");
    REQUIRE(parse_yarn_berry_key(
        "resolve@patch:resolve@npm%3A^1.22.0#optional!builtin<compat/resolve>") == "resolve");
    REQUIRE(parse_yarn_berry_key("string-width-cjs@npm:string-width@^4.2.0") ==
            "string-width-cjs");
    REQUIRE(parse_yarn_berry_key("pkg@^1.0.0") == "pkg");
    REQUIRE(parse_yarn_berry_key("").empty());
}

TEST_CASE("parse_yarn_berry_resolution", "[yarn-berry]") {
    REQUIRE(parse_yarn_berry_resolution("string-width@npm:4.2.3").value() == "string-width");
    REQUIRE(parse_yarn_berry_resolution("@babel/core@npm:7.23.0").value() == "@babel/core");
    REQUIRE(parse_yarn_berry_resolution(
        "resolve@patch:resolve@npm%3A1.22.8#optional!builtin<compat/resolve>").value() ==
        "resolve");
    REQUIRE_FALSE(parse_yarn_berry_resolution("").has_value());
    REQUIRE_FALSE(parse_yarn_berry_resolution("lodash").has_value());
}

TEST_CASE("yarn_berry_protocol", "[yarn-berry]") {
    REQUIRE(yarn_berry_protocol("lodash@npm:4.17.21") == "npm");
    REQUIRE(yarn_berry_protocol("@s/a@workspace:packages/a") == "workspace");
    REQUIRE(yarn_berry_protocol("resolve@patch:resolve@npm%3A1.22.8") == "patch");
    REQUIRE(yarn_berry_protocol("x@portal:../x") == "portal");
    REQUIRE(yarn_berry_protocol("lodash").empty());

    REQUIRE(is_local_protocol("workspace"));
    REQUIRE(is_local_protocol("portal"));
    REQUIRE(is_local_protocol("link"));
    REQUIRE_FALSE(is_local_protocol("npm"));
    REQUIRE_FALSE(is_local_protocol("patch"));
}

// ===== Loader =====

TEST_CASE("load yarn berry lockfile", "[yarn-berry]") {
    auto r = load_yarn_berry_tables(read_file(fixture_dir() + "/yarn-berry/yarn.lock"));
    REQUIRE(r.is_ok());
    const auto& tables = r.value();
    REQUIRE(tables.format == LockfileFormat::YarnBerry);
    REQUIRE(tables.lockfile_version == "8");
    REQUIRE(tables.packages.find("__metadata") == nullptr);
    REQUIRE(tables.packages.size() == 7);

    const PackageEntry* app = tables.packages.find("app@workspace:packages/app");
    REQUIRE(app != nullptr);
    REQUIRE(app->link);
    REQUIRE(*find_spec(app->dependencies, "p-limit") == "npm:^3.1.0");

    const PackageEntry* plimit = tables.packages.find("p-limit@npm:^3.0.2, p-limit@npm:^3.1.0");
    REQUIRE(plimit != nullptr);
    REQUIRE_FALSE(plimit->link);
    REQUIRE(plimit->integrity == "10c0/plimit");
    REQUIRE(plimit->resolved == "p-limit@npm:3.1.0");
}

TEST_CASE("extract yarn berry records", "[yarn-berry]") {
    auto r = load_yarn_berry_tables(read_file(fixture_dir() + "/yarn-berry/yarn.lock"));
    REQUIRE(r.is_ok());

    std::vector<std::string> keys;
    for (const auto& [key, entry] : r.value().packages) {
        auto dep = extract_yarn_berry_entry(key, entry);
        if (dep) keys.push_back(dep->key());
    }
    // Workspaces drop out; the aliased key reports the real package name
    REQUIRE(keys == std::vector<std::string>{
        "p-limit@3.1.0",
        "resolve@1.22.8",
        "string-width@4.2.3",
        "yocto-queue@0.1.0",
    });
}

TEST_CASE("extract skips unresolved workspace descriptors", "[yarn-berry]") {
    PackageEntry entry;
    entry.version = "0.0.0-use.local";
    REQUIRE_FALSE(extract_yarn_berry_entry("lib@workspace:packages/lib", entry).has_value());
    REQUIRE_FALSE(extract_yarn_berry_entry("__metadata", entry).has_value());

    entry.version = "1.0.0";
    auto dep = extract_yarn_berry_entry("pkg@npm:^1.0.0", entry);
    REQUIRE(dep.has_value());
    REQUIRE(dep->name == "pkg");
}

TEST_CASE("load yarn berry errors", "[yarn-berry]") {
    SECTION("entry is not a map") {
        auto r = load_yarn_berry_tables("__metadata:\n  version: 8\n\"a@npm:1\": 3\n",
                                        "yarn.lock");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == FlatlockError::Parse);
        REQUIRE(r.error().message == "entry 'a@npm:1' must be a map");
        REQUIRE(r.error().line == 3);
    }
    SECTION("invalid YAML") {
        auto r = load_yarn_berry_tables("__metadata: [\n");
        REQUIRE(r.is_err());
    }
    SECTION("root is not a map") {
        auto r = load_yarn_berry_tables("just text");
        REQUIRE(r.is_err());
        REQUIRE(r.error().message == "lockfile root must be a map");
    }
}
