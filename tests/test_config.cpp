#include <catch2/catch.hpp>
#include <flatlock/config.hpp>

using namespace flatlock;

// ===== Parsing =====

TEST_CASE("parse config with log section", "[config]") {
    auto r = Config::parse(R"(
[log]
level = "debug"
color = false
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log_level == log::Debug);
    REQUIRE(r.value().log_color == false);
}

TEST_CASE("parse config with detect section", "[config]") {
    auto r = Config::parse(R"(
[detect]
format = "yarn-berry"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().detect_format == LockfileFormat::YarnBerry);
    REQUIRE(r.value().parse_options().format == LockfileFormat::YarnBerry);
}

TEST_CASE("parse config with resolve section", "[config]") {
    auto r = Config::parse(R"(
[resolve]
dev = true
optional = false
)");
    REQUIRE(r.is_ok());
    const auto& cfg = r.value();
    REQUIRE(cfg.resolve_dev);
    REQUIRE(cfg.resolve_dev_set);
    REQUIRE_FALSE(cfg.resolve_optional);
    REQUIRE(cfg.resolve_optional_set);
    REQUIRE_FALSE(cfg.resolve_peer_set);

    auto opts = cfg.resolve_options();
    REQUIRE(opts.dev);
    REQUIRE_FALSE(opts.optional);
    REQUIRE_FALSE(opts.peer);
    REQUIRE(opts.workspace_path.empty());
}

TEST_CASE("parse empty config", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().log_level.has_value());
    REQUIRE_FALSE(r.value().detect_format.has_value());
    REQUIRE(r.value().resolve_optional);
    REQUIRE_FALSE(r.value().parse_options().format.has_value());
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FlatlockError::Config);
}

TEST_CASE("unknown enum values are config errors", "[config]") {
    auto level = Config::parse("[log]\nlevel = \"chatty\"\n");
    REQUIRE(level.is_err());
    REQUIRE(level.error().code == FlatlockError::Config);
    REQUIRE(level.error().message.find("chatty") != std::string::npos);

    auto format = Config::parse("[detect]\nformat = \"bun\"\n");
    REQUIRE(format.is_err());
    REQUIRE(format.error().code == FlatlockError::Config);

    auto type = Config::parse("[resolve]\ndev = \"yes\"\n");
    REQUIRE(type.is_err());
    REQUIRE(type.error().code == FlatlockError::Config);
}

TEST_CASE("load missing config file is an IO error", "[config]") {
    auto r = Config::load("/nonexistent/flatlock/config.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FlatlockError::IO);
}

// ===== Merge =====

TEST_CASE("merge overrides only explicitly set fields", "[config]") {
    auto base = Config::parse(R"(
[log]
level = "info"

[resolve]
dev = true
peer = true
)").value();

    auto overlay = Config::parse(R"(
[resolve]
peer = false
)").value();

    base.merge(overlay);
    REQUIRE(base.log_level == log::Info);   // preserved
    REQUIRE(base.resolve_dev);              // preserved
    REQUIRE_FALSE(base.resolve_peer);       // overridden
}

// ===== Effective config =====

TEST_CASE("effective config layering", "[config]") {
    auto global = Config::parse(R"(
[log]
level = "warn"
color = true

[detect]
format = "npm"

[resolve]
optional = false
)").value();

    auto project = Config::parse(R"(
[log]
level = "trace"

[detect]
format = "pnpm"
)").value();

    auto eff = Config::effective(global, project);
    REQUIRE(eff.log_level == log::Trace);          // project wins
    REQUIRE(eff.log_color == true);                // from global
    REQUIRE(eff.detect_format == LockfileFormat::Pnpm);
    REQUIRE_FALSE(eff.resolve_optional);           // from global
}

TEST_CASE("effective with no layers", "[config]") {
    auto eff = Config::effective({}, {});
    REQUIRE_FALSE(eff.log_level.has_value());
    REQUIRE_FALSE(eff.resolve_dev);
    REQUIRE(eff.resolve_optional);
    REQUIRE_FALSE(eff.resolve_peer);
}

TEST_CASE("apply_logging sets the logger", "[config]") {
    auto cfg = Config::parse("[log]\nlevel = \"error\"\ncolor = false\n").value();
    cfg.apply_logging();
    REQUIRE(log::get_level() == log::Error);
    REQUIRE_FALSE(log::is_color_enabled());
    log::set_level(log::Warn);
}

// ===== Config paths =====

TEST_CASE("global config path contains .flatlock", "[config]") {
    auto path = global_config_path();
    if (!path.empty()) {
        REQUIRE(path.find(".flatlock/config.toml") != std::string::npos);
    }
}

TEST_CASE("project config path", "[config]") {
    REQUIRE(project_config_path("/repo") == "/repo/.flatlock.toml");
    REQUIRE(project_config_path("/repo/") == "/repo/.flatlock.toml");
    REQUIRE(project_config_path("") == ".flatlock.toml");
}
