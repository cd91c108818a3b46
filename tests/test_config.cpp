#include <catch2/catch.hpp>
#include <stencil/config.hpp>
#include "test_support.hpp"

using namespace stencil;
using stencil_test::TempDir;

// ===== Parsing =====

TEST_CASE("parse config with template aliases", "[config]") {
    auto r = Config::parse(R"(
[defaults.templates.official]
web = "user/web-template"
api = "https://github.com/acme/api-template/tree/main/base"
)");
    REQUIRE(r.is_ok());
    const auto& cfg = r.value();
    REQUIRE(cfg.templates.at("official").at("web") == "user/web-template");
    REQUIRE(cfg.templates.at("official").size() == 2);
    REQUIRE(cfg.registries.empty());
}

TEST_CASE("parse config with legacy registries", "[config]") {
    auto r = Config::parse(R"(
[defaults.registries.company]
service = "company/service-template"

[defaults.registries.remote]
type = "http"
url = "https://registry.example.com"
)");
    REQUIRE(r.is_ok());
    const auto& cfg = r.value();
    REQUIRE(cfg.registries.at("company").at("service") == "company/service-template");
    REQUIRE(cfg.registries.count("remote") == 0);
}

TEST_CASE("parse config with cache section", "[config]") {
    auto r = Config::parse(R"(
[cache]
dir = "/var/cache/stencil"
ttl-hours = 6
)");
    REQUIRE(r.is_ok());
    REQUIRE(*r.value().cache_dir == "/var/cache/stencil");
    REQUIRE(*r.value().ttl_hours == Approx(6.0));
}

TEST_CASE("parse empty config", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().templates.empty());
    REQUIRE_FALSE(r.value().cache_dir.has_value());
    REQUIRE_FALSE(r.value().ttl_hours.has_value());
}

TEST_CASE("non-string alias values are skipped", "[config]") {
    auto r = Config::parse(R"(
[defaults.templates.official]
web = "user/web"
count = 3
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().templates.at("official").size() == 1);
}

TEST_CASE("negative ttl-hours is a config error", "[config]") {
    auto r = Config::parse("[cache]\nttl-hours = -1\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StencilError::Config);
}

TEST_CASE("invalid TOML is a parse error", "[config]") {
    auto r = Config::parse("[defaults\nweb = ");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StencilError::Parse);
}

// ===== Loading =====

TEST_CASE("load config from file", "[config]") {
    TempDir tmp;
    tmp.write_file("stencil.toml", "[defaults.templates.team]\nsvc = \"team/svc\"\n");
    auto r = Config::load(tmp.str() + "/stencil.toml");
    REQUIRE(r.is_ok());
    REQUIRE(*r.value().lookup_alias("team", "svc") == "team/svc");
}

TEST_CASE("load missing config file", "[config]") {
    auto r = Config::load("/nonexistent/stencil.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StencilError::IO);
}

// ===== Lookup and merge =====

TEST_CASE("lookup prefers templates over registries", "[config]") {
    Config cfg;
    cfg.templates["official"]["web"] = "  new/web  ";
    cfg.registries["official"]["web"] = "old/web";
    cfg.registries["official"]["api"] = "old/api";

    REQUIRE(*cfg.lookup_alias("official", "web") == "new/web");
    REQUIRE(*cfg.lookup_alias("official", "api") == "old/api");
    REQUIRE_FALSE(cfg.lookup_alias("official", "missing").has_value());
    REQUIRE_FALSE(cfg.lookup_alias("other", "web").has_value());
}

TEST_CASE("blank alias values fall through", "[config]") {
    Config cfg;
    cfg.templates["official"]["web"] = "   ";
    cfg.registries["official"]["web"] = "legacy/web";
    REQUIRE(*cfg.lookup_alias("official", "web") == "legacy/web");

    cfg.registries["official"]["web"] = "";
    REQUIRE_FALSE(cfg.lookup_alias("official", "web").has_value());
}

TEST_CASE("merge overrides aliases and cache settings", "[config]") {
    Config base;
    base.templates["official"]["web"] = "a/web";
    base.templates["official"]["api"] = "a/api";
    base.cache_dir = "/base";

    Config over;
    over.templates["official"]["web"] = "b/web";
    over.ttl_hours = 2;

    base.merge(over);
    REQUIRE(base.templates["official"]["web"] == "b/web");
    REQUIRE(base.templates["official"]["api"] == "a/api");
    REQUIRE(*base.cache_dir == "/base");
    REQUIRE(*base.ttl_hours == Approx(2.0));
}
