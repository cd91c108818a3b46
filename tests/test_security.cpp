#include <catch2/catch.hpp>
#include <stencil/security.hpp>
#include "test_support.hpp"

using namespace stencil;
using stencil_test::TempDir;

// ===== validate_template_url =====

TEST_CASE("Ordinary references pass through unchanged", "[security]") {
    for (const char* in : {"user/repo", "user/repo#develop", "user/repo/sub#v1.2/dir",
                           "registry/nextjs-app", "community/ns/tpl",
                           "https://github.com/user/repo", "~/templates/basic",
                           "/opt/templates/basic"}) {
        auto r = validate_template_url(in);
        REQUIRE(r.is_ok());
        REQUIRE(r.value() == in);
    }
}

TEST_CASE("Empty and whitespace-only input is rejected", "[security]") {
    REQUIRE(validate_template_url("").error().code == StencilError::Validation);
    REQUIRE(validate_template_url("   \t").error().code == StencilError::Validation);
}

TEST_CASE("Null bytes are rejected", "[security]") {
    auto r = validate_template_url(std::string("user/repo\0x", 11));
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("null bytes") != std::string::npos);
}

TEST_CASE("Shell metacharacters are rejected", "[security]") {
    auto r = validate_template_url("template;rm -rf /");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StencilError::Validation);
    REQUIRE(r.error().message.find("shell metacharacters") != std::string::npos);
    REQUIRE(*r.error().find("input") == "template;rm -rf /");

    for (const char* in : {"a/b|c", "a/b&&c", "a/`id`", "a/$(id)", "a/${HOME}"}) {
        REQUIRE(validate_template_url(in).is_err());
    }
}

TEST_CASE("Line breaks are rejected", "[security]") {
    REQUIRE(validate_template_url("user/repo\nother").is_err());
    REQUIRE(validate_template_url("user/repo\r").is_err());
}

TEST_CASE("Relative paths must stay inside the safe root", "[security]") {
    TempDir tmp;
    tmp.write_file("project/tpl/README.md", "x");
    std::string root = tmp.str() + "/project";

    REQUIRE(validate_template_url("./tpl", root).is_ok());
    REQUIRE(validate_template_url("./tpl/../tpl", root).is_ok());

    auto escape = validate_template_url("../../../etc/passwd", root);
    REQUIRE(escape.is_err());
    REQUIRE(escape.error().code == StencilError::Validation);
    REQUIRE(escape.error().message.find("escapes") != std::string::npos);
}

TEST_CASE("Relative traversal is checked against the working directory by default",
          "[security]") {
    auto r = validate_template_url("../../../../../../../../../../etc/passwd");
    REQUIRE(r.is_err());
}

TEST_CASE("Other local paths may not contain '..' segments", "[security]") {
    REQUIRE(validate_template_url("/opt/../etc/passwd").is_err());
    REQUIRE(validate_template_url("~/x/../../etc").is_err());
    REQUIRE(validate_template_url("/opt/tpl..v2").is_ok());
}

TEST_CASE("Traversal in shorthand is rejected", "[security]") {
    REQUIRE(validate_template_url("user/../repo").is_err());
    REQUIRE(validate_template_url("user/repo#main/../../x").is_err());
}

TEST_CASE("Registry prefixes do not bypass traversal checks", "[security]") {
    for (const char* in : {"community/x/../../../etc", "private/../etc",
                           "official/a/..", "private/x#main/../../../../etc",
                           "community/x#bad..branch"}) {
        auto r = validate_template_url(in);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == StencilError::Validation);
    }
    REQUIRE(validate_template_url("private/ns/tpl").is_ok());
    REQUIRE(validate_template_url("community/a/b/c").is_ok());
}

TEST_CASE("Traversal in full URL paths is rejected", "[security]") {
    REQUIRE(validate_template_url("https://github.com/o/r/../../../../etc").is_err());
    REQUIRE(validate_template_url("https://github.com/o/r/tree/main/%2E%2E/x").is_err());
    REQUIRE(validate_template_url("https://example.com/a/..").is_err());
    REQUIRE(validate_template_url("https://github.com/o/r/tree/main/v1..2").is_ok());
}

TEST_CASE("Branch names are checked in shorthand", "[security]") {
    auto r = validate_template_url("user/repo#bad..branch");
    REQUIRE(r.is_err());
    REQUIRE(*r.error().find("input") == "user/repo#bad..branch");

    REQUIRE(validate_template_url("user/repo#topic.lock").is_err());
    REQUIRE(validate_template_url("user/repo#a:b").is_err());
}

TEST_CASE("Full URLs go through the repository URL check", "[security]") {
    REQUIRE(validate_template_url("ftp://example.com/tpl").is_err());
    REQUIRE(validate_template_url("http://localhost/tpl").is_err());
}

// ===== validate_repo_url =====

TEST_CASE("Allowed repository URL schemes", "[security]") {
    for (const char* in : {"https://github.com/a/b", "http://example.com/a",
                           "git://example.com/a.git", "ssh://git@example.com/a.git"}) {
        REQUIRE(validate_repo_url(in).is_ok());
    }
    auto r = validate_repo_url("file:///etc/passwd");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("unsupported protocol") != std::string::npos);
}

TEST_CASE("Loopback and private network hosts are rejected", "[security]") {
    for (const char* in : {"http://localhost/x", "http://127.0.0.1/x", "http://127.5.0.1/x",
                           "http://[::1]/x", "http://0.0.0.0/x", "http://10.1.2.3/x",
                           "http://192.168.0.10/x", "http://172.16.0.1/x",
                           "http://172.31.255.1/x"}) {
        auto r = validate_repo_url(in);
        REQUIRE(r.is_err());
        REQUIRE(r.error().message == "private network URLs are not allowed");
    }
    REQUIRE(validate_repo_url("http://172.32.0.1/x").is_ok());
    REQUIRE(validate_repo_url("http://172.15.0.1/x").is_ok());
}

TEST_CASE("Malformed repository URLs are rejected", "[security]") {
    REQUIRE(validate_repo_url("not a url").is_err());
    REQUIRE(validate_repo_url("https://example.com/a\tb").is_err());
}

// ===== sanitize_branch_name =====

TEST_CASE("Valid branch names are trimmed", "[security]") {
    REQUIRE(sanitize_branch_name("main").value() == "main");
    REQUIRE(sanitize_branch_name("  feature/x-1.2 ").value() == "feature/x-1.2");
    REQUIRE(sanitize_branch_name("release_2024").value() == "release_2024");
}

TEST_CASE("Invalid branch names are rejected", "[security]") {
    for (const char* in : {"", "   ", "has space", "a~b", "a^b", "a:b", "a?b", "a*b",
                           "a[b", "a\\b", "a..b", "/lead", "trail/", "a//b",
                           ".hidden", "trail.", "x.lock", "a$b", "a(b)", "a;b"}) {
        auto r = sanitize_branch_name(in);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == StencilError::Validation);
    }
    REQUIRE(sanitize_branch_name(std::string(256, 'a')).is_err());
    REQUIRE(sanitize_branch_name(std::string(255, 'a')).is_ok());
}

TEST_CASE("Shell metacharacter detection", "[security]") {
    REQUIRE(contains_shell_metacharacters("a;b"));
    REQUIRE(contains_shell_metacharacters("$(x)"));
    REQUIRE(contains_shell_metacharacters("${x}"));
    REQUIRE_FALSE(contains_shell_metacharacters("a$b"));
    REQUIRE_FALSE(contains_shell_metacharacters("owner/repo#main"));
}

TEST_CASE("Accepted registry prefixes", "[security]") {
    REQUIRE(is_accepted_registry_prefix("registry"));
    REQUIRE(is_accepted_registry_prefix("official"));
    REQUIRE(is_accepted_registry_prefix("community"));
    REQUIRE(is_accepted_registry_prefix("private"));
    REQUIRE_FALSE(is_accepted_registry_prefix("user"));
}
