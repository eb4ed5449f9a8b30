#include <catch2/catch.hpp>
#include <flatlock/dependency_set.hpp>
#include <flatlock/workspace.hpp>
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

static DependencySet load_set(const std::string& rel) {
    auto r = DependencySet::from_path(fixture_dir() + "/" + rel);
    if (r.is_err()) FAIL(r.error().format());
    return std::move(r).value();
}

static Json::Value parse_json(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errs;
    REQUIRE(reader->parse(text.data(), text.data() + text.size(), &root, &errs));
    return root;
}

// ===== Construction =====

TEST_CASE("from_path loads and detects", "[set]") {
    auto set = load_set("yarn-classic/yarn.lock");
    REQUIRE(set.format() == LockfileFormat::YarnClassic);
    REQUIRE(set.size() == 7);
    REQUIRE(set.can_traverse());
    REQUIRE(set.has("lodash@4.17.21"));
    REQUIRE_FALSE(set.has("lodash@4.17.20"));

    const Dependency* lodash = set.get("lodash@4.17.21");
    REQUIRE(lodash != nullptr);
    REQUIRE(lodash->integrity == "sha512-lodash");
    REQUIRE(set.get("missing@1.0.0") == nullptr);
}

TEST_CASE("from_string with an explicit format", "[set]") {
    ParseOptions opts;
    opts.format = LockfileFormat::Pnpm;
    auto r = DependencySet::from_string(read_file(fixture_dir() + "/pnpm/pnpm-lock-v9.yaml"),
                                        opts);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 5);
    REQUIRE(r.value().format() == LockfileFormat::Pnpm);
}

TEST_CASE("from_path errors", "[set]") {
    SECTION("missing file") {
        auto r = DependencySet::from_path("/nonexistent/package-lock.json");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == FlatlockError::NotFound);
        REQUIRE(FlatlockError::stage_name(r.error().code) == std::string("read"));
    }
    SECTION("parse errors name the file") {
        std::string path = fixture_dir() + "/yarn-classic/yarn.lock";
        ParseOptions opts;
        opts.format = LockfileFormat::Npm;
        auto r = DependencySet::from_path(path, opts);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == FlatlockError::Parse);
        REQUIRE(r.error().file == path);
    }
}

// ===== Queries =====

TEST_CASE("iteration is sorted by key", "[set]") {
    auto set = load_set("yarn-berry/yarn.lock");
    auto keys = set.keys();
    REQUIRE(keys == std::vector<std::string>{
        "p-limit@3.1.0", "resolve@1.22.8", "string-width@4.2.3", "yocto-queue@0.1.0"});

    auto values = set.values();
    REQUIRE(values.size() == 4);
    REQUIRE(values[0].name == "p-limit");
    REQUIRE(set.to_vector().size() == 4);

    auto entries = set.entries();
    REQUIRE(entries[3].first == "yocto-queue@0.1.0");
    REQUIRE(entries[3].second.version == "0.1.0");

    std::vector<std::string> seen;
    set.for_each([&](const Dependency& d) { seen.push_back(d.key()); });
    REQUIRE(seen == keys);

    size_t n = 0;
    for (const auto& [key, dep] : set) {
        REQUIRE(key == dep.key());
        ++n;
    }
    REQUIRE(n == set.size());
}

// ===== Set algebra =====

TEST_CASE("set algebra", "[set]") {
    auto npm = load_set("monorepo/package-lock.json");
    auto pnpm = load_set("pnpm/pnpm-lock-v9.yaml");
    auto berry = load_set("yarn-berry/yarn.lock");

    SECTION("union") {
        auto u = pnpm.union_with(berry);
        // string-width@4.2.3 is in both
        REQUIRE(u.size() == pnpm.size() + berry.size() - 1);
        REQUIRE(u.is_superset_of(pnpm));
        REQUIRE(u.is_superset_of(berry));
        REQUIRE_FALSE(u.format().has_value());
        REQUIRE_FALSE(u.can_traverse());
    }
    SECTION("union keeps the left record") {
        auto u = pnpm.union_with(berry);
        REQUIRE(u.get("string-width@4.2.3")->integrity == "sha512-stringwidth");
        auto v = berry.union_with(pnpm);
        REQUIRE(v.get("string-width@4.2.3")->integrity == "10c0/stringwidth");
    }
    SECTION("intersection") {
        auto i = pnpm.intersection(berry);
        REQUIRE(i.keys() == std::vector<std::string>{"string-width@4.2.3"});
        REQUIRE(i.is_subset_of(pnpm));
        REQUIRE(i.is_subset_of(berry));
    }
    SECTION("difference") {
        auto d = pnpm.difference(berry);
        REQUIRE(d.size() == pnpm.size() - 1);
        REQUIRE_FALSE(d.has("string-width@4.2.3"));
        REQUIRE(d.is_disjoint_from(berry));
    }
    SECTION("disjoint sets") {
        REQUIRE(npm.is_disjoint_from(berry));
        REQUIRE_FALSE(pnpm.is_disjoint_from(berry));
    }
    SECTION("every set is a subset of itself") {
        REQUIRE(npm.is_subset_of(npm));
        REQUIRE(npm.is_superset_of(npm));
        REQUIRE(npm.difference(npm).empty());
        REQUIRE(npm.intersection(npm).size() == npm.size());
    }
}

// ===== Traversal =====

TEST_CASE("dependencies_of a workspace", "[set][resolver]") {
    auto set = load_set("monorepo/package-lock.json");
    auto manifest = PackageManifest::load(fixture_dir() + "/monorepo/packages/foo/package.json");
    REQUIRE(manifest.is_ok());

    DependenciesOfOptions opts;
    opts.workspace_path = "packages/foo";
    opts.optional = false;
    opts.workspace_packages = load_workspace_packages(set.workspace_paths(),
                                                      fixture_dir() + "/monorepo");

    auto r = set.dependencies_of(manifest.value(), opts);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().keys() == std::vector<std::string>{
        "bar@0.3.0", "debug@3.2.7", "lodash@4.17.21", "ms@2.1.2"});
    REQUIRE(r.value().format() == LockfileFormat::Npm);
    REQUIRE_FALSE(r.value().can_traverse());

    // External records are a subset of the lockfile
    REQUIRE(r.value().difference(set).keys() == std::vector<std::string>{"bar@0.3.0"});
}

TEST_CASE("dependencies_of from parsed JSON", "[set][resolver]") {
    auto set = load_set("yarn-classic/yarn.lock");

    auto r = set.dependencies_of(parse_json(R"({"dependencies": {"chalk": "^2.4.2"}})"));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().keys() == std::vector<std::string>{
        "ansi-styles@3.2.1", "chalk@2.4.2", "supports-color@5.5.0"});

    SECTION("non-object manifest") {
        auto bad = set.dependencies_of(parse_json("[1, 2]"));
        REQUIRE(bad.is_err());
        REQUIRE(bad.error().code == FlatlockError::Traversal);
    }
    SECTION("invalid section") {
        auto bad = set.dependencies_of(parse_json(R"({"dependencies": "chalk"})"));
        REQUIRE(bad.is_err());
        REQUIRE(bad.error().code == FlatlockError::Traversal);
    }
}

TEST_CASE("dependencies_of walks pnpm workspace links", "[set][resolver]") {
    auto set = load_set("pnpm/pnpm-lock-v9.yaml");

    DependenciesOfOptions opts;
    opts.workspace_path = "packages/app";
    auto r = set.dependencies_of(
        parse_json(R"({"dependencies": {"bar": "workspace:*"}})"), opts);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().keys() == std::vector<std::string>{"leftpad@1.0.0"});
}

TEST_CASE("derived sets cannot traverse", "[set][resolver]") {
    auto a = load_set("pnpm/pnpm-lock-v9.yaml");
    auto b = load_set("yarn-berry/yarn.lock");
    auto u = a.union_with(b);

    PackageManifest m;
    m.dependencies.emplace_back("string-width", "^4.2.0");
    auto r = u.dependencies_of(m);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FlatlockError::Traversal);
    REQUIRE(FlatlockError::stage_name(r.error().code) == std::string("resolve"));
    REQUIRE(u.workspace_paths().empty());
}

TEST_CASE("workspace_paths", "[set]") {
    REQUIRE(load_set("pnpm/pnpm-lock-v9.yaml").workspace_paths() ==
            std::vector<std::string>{"packages/app", "packages/bar"});
    REQUIRE(load_set("yarn-classic/yarn.lock").workspace_paths().empty());
}
