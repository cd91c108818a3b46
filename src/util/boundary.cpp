#include <stencil/boundary.hpp>
#include <stencil/log.hpp>

#include <filesystem>

namespace fs = std::filesystem;

namespace stencil {

// Lexically normalized, without the trailing separator that
// lexically_normal() leaves on "dir/." or "dir/..".
static fs::path normalize(const fs::path& p) {
    fs::path n = p.lexically_normal();
    std::string s = n.string();
    while (s.size() > 1 && s.back() == '/') {
        s.pop_back();
    }
    return fs::path(s);
}

BoundaryValidator::BoundaryValidator(const std::string& allowed_root) {
    fs::path root(allowed_root.empty() ? "." : allowed_root);
    std::error_code ec;
    fs::path abs = fs::absolute(root, ec);
    if (ec) abs = root;
    allowed_root_ = normalize(abs).string();
}

static StencilError violation(const std::string& message,
                              const std::string& user_path,
                              const std::string& resolved,
                              const std::string& root,
                              const std::string& operation) {
    StencilError err{StencilError::Boundary, message,
        "keep paths inside " + root};
    err.with("user_path", user_path)
       .with("resolved_path", resolved)
       .with("allowed_root", root)
       .with("operation", operation);
    return err;
}

Result<std::string> BoundaryValidator::validate_path(const std::string& user_path,
                                                     const std::string& operation) const {
    if (user_path.empty()) {
        return violation("path must be a non-empty string",
                         user_path, "", allowed_root_, operation);
    }

    if (user_path.find('\0') != std::string::npos) {
        stencil::log::warn("boundary violation (null_byte) during %s",
                           operation.c_str());
        return violation("path contains null bytes",
                         user_path, "", allowed_root_, operation);
    }

    // operator/ discards the root when user_path is absolute
    fs::path resolved = normalize(fs::path(allowed_root_) / fs::path(user_path));
    std::string resolved_str = resolved.string();

    // Compare whole segments so /tmp/root does not admit /tmp/rootkit
    bool inside = resolved_str == allowed_root_;
    if (!inside) {
        std::string prefix = allowed_root_;
        if (prefix.back() != '/') prefix += '/';
        inside = resolved_str.compare(0, prefix.size(), prefix) == 0;
    }

    if (!inside) {
        stencil::log::warn("boundary violation (path_traversal) during %s: '%s' -> '%s'",
                           operation.c_str(), user_path.c_str(), resolved_str.c_str());
        return violation("path escapes allowed directory boundaries",
                         user_path, resolved_str, allowed_root_, operation);
    }

    return Result<std::string>::ok(std::move(resolved_str));
}

Result<std::vector<std::string>> BoundaryValidator::validate_paths(
        const std::vector<std::string>& paths,
        const std::string& operation) const {
    std::vector<std::string> out;
    out.reserve(paths.size());
    for (const auto& p : paths) {
        auto r = validate_path(p, operation);
        if (r.is_err()) return std::move(r).error();
        out.push_back(std::move(r).value());
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

Result<std::string> BoundaryValidator::get_basename(const std::string& user_path) const {
    STENCIL_TRY(validate_path(user_path, "basename"));
    return Result<std::string>::ok(normalize(fs::path(user_path)).filename().string());
}

bool BoundaryValidator::is_within_boundaries(const std::string& user_path) const {
    return validate_path(user_path, "boundary_check").is_ok();
}

} // namespace stencil
