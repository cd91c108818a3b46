#include <catch2/catch.hpp>
#include <stencil/error.hpp>
#include <string>

using namespace stencil;

TEST_CASE("format includes code, message and hint", "[error]") {
    StencilError e{StencilError::Unsupported, "Tarball URLs not yet supported",
                   "use a repository URL"};
    auto s = e.format();
    REQUIRE(s.find("error[Unsupported]: Tarball URLs not yet supported") == 0);
    REQUIRE(s.find("hint: use a repository URL") != std::string::npos);
}

TEST_CASE("context values are kept in order and overwritten by key", "[error]") {
    StencilError e{StencilError::Boundary, "escape"};
    e.with("user_path", "../x").with("allowed_root", "/tmp/root");
    e.with("user_path", "../y");

    REQUIRE(e.context.size() == 2);
    REQUIRE(e.context[0].first == "user_path");
    REQUIRE(*e.find("user_path") == "../y");
    REQUIRE(e.find("missing") == nullptr);

    auto s = e.format();
    REQUIRE(s.find("user_path: ../y") != std::string::npos);
    REQUIRE(s.find("allowed_root: /tmp/root") != std::string::npos);
}

TEST_CASE("code_name covers every code", "[error]") {
    REQUIRE(std::string(StencilError::code_name(StencilError::Validation)) == "Validation");
    REQUIRE(std::string(StencilError::code_name(StencilError::Boundary)) == "Boundary");
    REQUIRE(std::string(StencilError::code_name(StencilError::Registry)) == "Registry");
    REQUIRE(std::string(StencilError::code_name(StencilError::Network)) == "Network");
}
