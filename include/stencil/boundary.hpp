#pragma once

#include <stencil/result.hpp>
#include <string>
#include <vector>

namespace stencil {

// Confines user-supplied paths to a single directory tree.
//
// Resolution is purely lexical: relative paths are joined onto the allowed
// root and normalized, nothing is read from disk and symlinks are not
// followed. A path is accepted when it resolves to the root itself or to
// something strictly beneath it.
class BoundaryValidator {
public:
    // allowed_root is made absolute (against the current directory) and
    // normalized immediately
    explicit BoundaryValidator(const std::string& allowed_root);

    // Returns the normalized absolute path, or a Boundary error with
    // user_path / resolved_path / allowed_root / operation context.
    Result<std::string> validate_path(const std::string& user_path,
                                      const std::string& operation = "unknown") const;

    // Validates in order, stops at the first violation
    Result<std::vector<std::string>> validate_paths(const std::vector<std::string>& paths,
                                                    const std::string& operation = "unknown") const;

    // Final path segment of user_path, after validating it
    Result<std::string> get_basename(const std::string& user_path) const;

    bool is_within_boundaries(const std::string& user_path) const;

    const std::string& allowed_root() const { return allowed_root_; }

private:
    std::string allowed_root_;
};

} // namespace stencil
