#include <stencil/security.hpp>
#include <stencil/boundary.hpp>
#include <stencil/reference.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace stencil {

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

static StencilError rejected(const std::string& input, const std::string& reason,
                             const std::string& hint = "") {
    StencilError err{StencilError::Validation, reason, hint};
    err.with("input", input);
    return err;
}

static bool has_dotdot_segment(const std::string& path) {
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        if (path.compare(start, end - start, "..") == 0 && end - start == 2) return true;
        start = end + 1;
    }
    return false;
}

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// %2e%2e hides ".." from a plain segment check
static std::string percent_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size() &&
            hex_digit(s[i + 1]) >= 0 && hex_digit(s[i + 2]) >= 0) {
            out += static_cast<char>((hex_digit(s[i + 1]) << 4) | hex_digit(s[i + 2]));
            i += 2;
        } else {
            out += s[i];
        }
    }
    return out;
}

bool contains_shell_metacharacters(const std::string& s) {
    return s.find_first_of(";|&`") != std::string::npos ||
           s.find("$(") != std::string::npos ||
           s.find("${") != std::string::npos;
}

bool is_accepted_registry_prefix(const std::string& segment) {
    return segment == "registry" || segment == "official" ||
           segment == "community" || segment == "private";
}

Result<std::string> sanitize_branch_name(const std::string& branch) {
    if (branch.find('\0') != std::string::npos) {
        return rejected(branch, "branch name contains null bytes");
    }

    std::string b = trim(branch);
    if (b.empty()) {
        return rejected(branch, "branch name must be a non-empty string");
    }
    if (b.size() > 255) {
        return rejected(branch, "branch name is too long (maximum 255 characters)");
    }

    for (char c : b) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isspace(uc) || uc < 0x20 || uc == 0x7f ||
            c == '~' || c == '^' || c == ':' || c == '?' || c == '*' ||
            c == '[' || c == ']' || c == '\\') {
            return rejected(branch,
                "branch name contains invalid characters (spaces, control "
                "characters, or git special characters)");
        }
    }

    if (b.find("..") != std::string::npos || starts_with(b, "/") ||
        ends_with(b, "/") || b.find("//") != std::string::npos) {
        return rejected(branch,
            "branch name contains path traversal attempts or invalid slashes");
    }
    if (starts_with(b, ".") || ends_with(b, ".")) {
        return rejected(branch, "branch name cannot start or end with a dot");
    }
    if (ends_with(b, ".lock")) {
        return rejected(branch, "branch name cannot end with .lock");
    }
    if (contains_shell_metacharacters(b) || b.find_first_of("$()") != std::string::npos) {
        return rejected(branch, "branch name contains potential command injection characters");
    }

    return Result<std::string>::ok(std::move(b));
}

static bool is_private_host(const std::string& host) {
    if (host == "localhost" || host == "127.0.0.1" || host == "::1" ||
        host == "0.0.0.0" || starts_with(host, "127.") ||
        starts_with(host, "192.168.") || starts_with(host, "10.")) {
        return true;
    }
    // 172.16.0.0/12
    if (starts_with(host, "172.")) {
        size_t dot = host.find('.', 4);
        if (dot != std::string::npos) {
            std::string second = host.substr(4, dot - 4);
            if (!second.empty() && second.size() <= 2 &&
                std::all_of(second.begin(), second.end(),
                            [](unsigned char c) { return std::isdigit(c); })) {
                int n = std::stoi(second);
                return n >= 16 && n <= 31;
            }
        }
    }
    return false;
}

Result<std::string> validate_repo_url(const std::string& url) {
    for (char c : url) {
        if (c == '\n' || c == '\r' || c == '\t' || c == '\0') {
            return rejected(url, "repository URL contains invalid characters");
        }
    }

    auto parts = split_url(trim(url));
    if (parts.is_err()) {
        return rejected(url, "invalid repository URL format");
    }

    const std::string& scheme = parts.value().scheme;
    if (scheme != "http" && scheme != "https" && scheme != "git" && scheme != "ssh") {
        return rejected(url, "unsupported protocol: " + scheme + ":",
                        "use an https://, http://, git:// or ssh:// URL");
    }

    if (is_private_host(parts.value().hostname)) {
        return rejected(url, "private network URLs are not allowed");
    }

    return Result<std::string>::ok(url);
}

Result<std::string> validate_template_url(const std::string& url,
                                          const std::string& safe_root) {
    if (trim(url).empty()) {
        return rejected(url, "template URL must be a non-empty string",
                        "provide a template name, owner/repo, URL or local path");
    }

    if (url.find('\0') != std::string::npos) {
        return rejected(url, "template contains null bytes",
                        "use only safe characters in template references");
    }

    if (contains_shell_metacharacters(url)) {
        return rejected(url, "template contains shell metacharacters",
                        "use only alphanumeric characters, slashes and safe punctuation");
    }

    if (url.find('\n') != std::string::npos || url.find('\r') != std::string::npos) {
        return rejected(url, "template contains line breaks");
    }

    if (is_local_reference(url)) {
        if (starts_with(url, "./") || starts_with(url, "../")) {
            std::string root = safe_root;
            if (root.empty()) {
                std::error_code ec;
                root = fs::current_path(ec).string();
                if (ec) {
                    return rejected(url, "cannot determine working directory: " + ec.message());
                }
            }
            BoundaryValidator boundary(root);
            auto r = boundary.validate_path(url, "validate_template_url");
            if (r.is_err()) {
                return rejected(url, "invalid template path: path escapes the allowed directory",
                                "use paths within " + boundary.allowed_root() +
                                " or absolute paths");
            }
        } else if (has_dotdot_segment(url)) {
            return rejected(url, "invalid template path: path traversal attempts are not allowed",
                            "avoid '..' in template paths");
        }
        return Result<std::string>::ok(url);
    }

    if (url.find("://") != std::string::npos) {
        auto r = validate_repo_url(url);
        if (r.is_err()) return std::move(r).error();
        auto parts = split_url(url);
        if (parts.is_err()) return rejected(url, "invalid repository URL format");
        const std::string& path = parts.value().pathname;
        if (has_dotdot_segment(path) || has_dotdot_segment(percent_decode(path))) {
            return rejected(url, "repository URL path contains path traversal");
        }
        return Result<std::string>::ok(url);
    }

    std::string repo_part = url.substr(0, url.find('#'));
    if (has_dotdot_segment(repo_part)) {
        return rejected(url, "template reference contains path traversal",
                        "use owner/repo or owner/repo#branch");
    }

    // <prefix>/<template> or <prefix>/<namespace>/<template>
    std::string first = repo_part.substr(0, repo_part.find('/'));
    size_t segments = std::count(repo_part.begin(), repo_part.end(), '/') + 1;
    if (is_accepted_registry_prefix(first) && segments >= 2 && segments <= 3 &&
        url.find('#') == std::string::npos) {
        return Result<std::string>::ok(url);
    }

    auto hash = url.find('#');
    if (hash != std::string::npos) {
        std::string branch_part = url.substr(hash + 1);
        std::string branch = branch_part.substr(0, branch_part.find('/'));
        auto b = sanitize_branch_name(branch);
        if (b.is_err()) {
            StencilError err = std::move(b).error();
            err.with("input", url);
            return err;
        }
        std::string rest = branch_part.find('/') == std::string::npos
            ? "" : branch_part.substr(branch_part.find('/') + 1);
        if (has_dotdot_segment(rest)) {
            return rejected(url, "template subpath contains path traversal");
        }
    }

    return Result<std::string>::ok(url);
}

} // namespace stencil
