#include <catch2/catch.hpp>
#include <stencil/boundary.hpp>
#include "test_support.hpp"

using namespace stencil;
using stencil_test::TempDir;

TEST_CASE("Root is made absolute and normalized", "[boundary]") {
    TempDir tmp;
    BoundaryValidator v(tmp.str() + "/./sub/..//");
    REQUIRE(v.allowed_root() == tmp.path.lexically_normal().string());
}

TEST_CASE("Relative paths inside the root resolve under it", "[boundary]") {
    TempDir tmp;
    BoundaryValidator v(tmp.str());

    auto r = v.validate_path("templates/basic");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == tmp.str() + "/templates/basic");

    auto dotted = v.validate_path("a/b/../c");
    REQUIRE(dotted.is_ok());
    REQUIRE(dotted.value() == tmp.str() + "/a/c");
}

TEST_CASE("The root itself is accepted", "[boundary]") {
    TempDir tmp;
    BoundaryValidator v(tmp.str());
    REQUIRE(v.validate_path(".").value() == v.allowed_root());
    REQUIRE(v.validate_path("a/..").value() == v.allowed_root());
}

TEST_CASE("Traversal out of the root is a Boundary error", "[boundary]") {
    TempDir tmp;
    BoundaryValidator v(tmp.str());

    auto r = v.validate_path("../outside", "copy");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StencilError::Boundary);
    REQUIRE(*r.error().find("user_path") == "../outside");
    REQUIRE(*r.error().find("allowed_root") == v.allowed_root());
    REQUIRE(*r.error().find("operation") == "copy");
    REQUIRE(*r.error().find("resolved_path") ==
            tmp.path.parent_path().string() + "/outside");
}

TEST_CASE("Absolute paths are checked against the root", "[boundary]") {
    TempDir tmp;
    BoundaryValidator v(tmp.str());

    REQUIRE(v.validate_path(tmp.str() + "/inner/file").is_ok());

    auto outside = v.validate_path("/etc/passwd");
    REQUIRE(outside.is_err());
    REQUIRE(outside.error().code == StencilError::Boundary);
}

TEST_CASE("Sibling directories sharing a name prefix are outside", "[boundary]") {
    TempDir tmp;
    BoundaryValidator v(tmp.str());
    REQUIRE_FALSE(v.is_within_boundaries(tmp.str() + "kit/file"));
    REQUIRE_FALSE(v.is_within_boundaries("../" + tmp.path.filename().string() + "kit"));
}

TEST_CASE("Empty paths and null bytes are rejected", "[boundary]") {
    TempDir tmp;
    BoundaryValidator v(tmp.str());

    auto empty = v.validate_path("");
    REQUIRE(empty.is_err());
    REQUIRE(empty.error().code == StencilError::Boundary);

    std::string with_nul("a\0b", 3);
    auto nul = v.validate_path(with_nul);
    REQUIRE(nul.is_err());
    REQUIRE(nul.error().message.find("null") != std::string::npos);
}

TEST_CASE("validate_paths stops at the first violation", "[boundary]") {
    TempDir tmp;
    BoundaryValidator v(tmp.str());

    auto ok = v.validate_paths({"a", "b/c"});
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value().size() == 2);
    REQUIRE(ok.value()[1] == tmp.str() + "/b/c");

    auto bad = v.validate_paths({"a", "../../x", "b"});
    REQUIRE(bad.is_err());
    REQUIRE(*bad.error().find("user_path") == "../../x");
}

TEST_CASE("get_basename validates before returning the last segment", "[boundary]") {
    TempDir tmp;
    BoundaryValidator v(tmp.str());

    REQUIRE(v.get_basename("dir/sub/template.json").value() == "template.json");
    REQUIRE(v.get_basename("dir/sub/").value() == "sub");
    REQUIRE(v.get_basename("../escape").is_err());
}
