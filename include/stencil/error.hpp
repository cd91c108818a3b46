#pragma once

#include <string>
#include <utility>
#include <vector>

namespace stencil {

struct StencilError {
    enum Code {
        IO,
        Parse,
        Config,
        Network,
        NotFound,
        InvalidArg,
        Validation,
        Boundary,
        Unsupported,
        Registry
    };

    Code code;
    std::string message;
    std::string hint;
    // Diagnostic key/value pairs, e.g. the offending input or the paths
    // involved in a boundary violation. Kept in insertion order.
    std::vector<std::pair<std::string, std::string>> context;

    StencilError() = default;
    StencilError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    StencilError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    // Attach (or overwrite) a context value; chainable.
    StencilError& with(const std::string& key, std::string value);

    // Returns nullptr when the key is absent
    const std::string* find(const std::string& key) const;

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace stencil
