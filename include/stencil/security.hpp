#pragma once

#include <stencil/result.hpp>
#include <string>

namespace stencil {

// Guard run on every template reference before classification or I/O.
// Returns the input unchanged, or a Validation error whose "input" context
// holds the offending string. Relative local paths must stay inside
// safe_root (the current directory when empty); the check is lexical.
Result<std::string> validate_template_url(const std::string& url,
                                          const std::string& safe_root = "");

// Full repository URLs: http/https/git/ssh only, no loopback or
// private-network hosts, no control characters.
Result<std::string> validate_repo_url(const std::string& url);

// Git ref-name rules plus the shell metacharacter check. Returns the
// trimmed branch name.
Result<std::string> sanitize_branch_name(const std::string& branch);

// True if the string holds ; | & ` $( or ${
bool contains_shell_metacharacters(const std::string& s);

// Prefixes the validator lets through as registry references. Broader than
// the classifier's reserved keywords; see is_registry_keyword().
bool is_accepted_registry_prefix(const std::string& segment);

} // namespace stencil
