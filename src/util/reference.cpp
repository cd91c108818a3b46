#include <stencil/reference.hpp>

#include <algorithm>
#include <cctype>
#include <vector>

namespace stencil {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

// Join parts[from..] with '/', dropping empty segments
static std::string join_from(const std::vector<std::string>& parts, size_t from) {
    std::string out;
    for (size_t i = from; i < parts.size(); ++i) {
        if (parts[i].empty()) continue;
        if (!out.empty()) out += '/';
        out += parts[i];
    }
    return out;
}

static std::string strip_git_suffix(const std::string& name) {
    if (ends_with(name, ".git")) return name.substr(0, name.size() - 4);
    return name;
}

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static std::string form_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < s.size() &&
                   hex_val(s[i + 1]) >= 0 && hex_val(s[i + 2]) >= 0) {
            out += static_cast<char>((hex_val(s[i + 1]) << 4) | hex_val(s[i + 2]));
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

static StencilError unsupported(const std::string& input, const std::string& detail) {
    StencilError err{StencilError::Unsupported,
        "unsupported template URL format: " + input + " (" + detail + ")",
        "use owner/repo, owner/repo#branch, https://github.com/owner/repo, "
        "registry/<template> or ./path/to/template"};
    err.with("input", input);
    return err;
}

static const char* const kArchiveExtensions[] = {
    ".tar.gz", ".tgz", ".tar", ".tar.bz2", ".tar.xz", ".zip"
};

// ---------------------------------------------------------------------------
// ParsedReference
// ---------------------------------------------------------------------------

const char* ParsedReference::type_name() const {
    struct Namer {
        const char* operator()(const LocalRef&) const { return "local"; }
        const char* operator()(const GithubShorthandRef&) const { return "github-shorthand"; }
        const char* operator()(const GithubRepoRef&) const { return "github-repo"; }
        const char* operator()(const GithubBranchRef&) const { return "github-branch"; }
        const char* operator()(const GithubArchiveRef&) const { return "github-archive"; }
        const char* operator()(const RegistryRef&) const { return "registry"; }
        const char* operator()(const TarballRef&) const { return "tarball"; }
        const char* operator()(const GenericUrlRef&) const { return "url"; }
    };
    return std::visit(Namer{}, ref);
}

// ---------------------------------------------------------------------------
// URL splitting
// ---------------------------------------------------------------------------

ParamMap parse_query_string(const std::string& query) {
    ParamMap params;
    if (query.empty()) return params;

    for (const auto& pair : split(query, '&')) {
        if (pair.empty()) continue;
        auto eq = pair.find('=');
        std::string key = form_decode(pair.substr(0, eq));
        std::string value = eq == std::string::npos ? "" : form_decode(pair.substr(eq + 1));
        // First occurrence wins, like URLSearchParams.get()
        params.emplace(std::move(key), std::move(value));
    }
    return params;
}

Result<UrlParts> split_url(const std::string& url) {
    auto sep = url.find("://");
    if (sep == std::string::npos || sep == 0) {
        return unsupported(url, "missing URL scheme");
    }

    UrlParts parts;
    std::string scheme = url.substr(0, sep);
    if (!std::isalpha(static_cast<unsigned char>(scheme[0]))) {
        return unsupported(url, "invalid URL scheme");
    }
    for (char c : scheme) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return unsupported(url, "invalid URL scheme");
        }
    }
    parts.scheme = to_lower(scheme);

    std::string rest = url.substr(sep + 3);

    auto hash = rest.find('#');
    if (hash != std::string::npos) {
        parts.fragment = rest.substr(hash + 1);
        rest = rest.substr(0, hash);
    }

    auto qmark = rest.find('?');
    if (qmark != std::string::npos) {
        parts.query = rest.substr(qmark + 1);
        rest = rest.substr(0, qmark);
    }

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    parts.pathname = slash == std::string::npos ? "/" : rest.substr(slash);

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        parts.userinfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
    }

    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return unsupported(url, "unterminated IPv6 host");
        }
        parts.hostname = authority.substr(1, close - 1);
        std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail[0] != ':') return unsupported(url, "invalid host");
            parts.port = tail.substr(1);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            parts.port = authority.substr(colon + 1);
            authority = authority.substr(0, colon);
        }
        parts.hostname = authority;
    }

    for (char c : parts.port) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return unsupported(url, "invalid port");
        }
    }

    if (parts.hostname.empty() && parts.scheme != "file") {
        return unsupported(url, "missing host");
    }
    parts.hostname = to_lower(parts.hostname);

    return Result<UrlParts>::ok(std::move(parts));
}

// ---------------------------------------------------------------------------
// Classification
// ---------------------------------------------------------------------------

bool is_local_reference(const std::string& input) {
    return starts_with(input, "./") || starts_with(input, "../") ||
           starts_with(input, "~/") || input == "~" ||
           starts_with(input, "/");
}

bool is_registry_keyword(const std::string& segment) {
    return segment == "registry" || segment == "official";
}

Result<ParsedReference> parse_github_url(const UrlParts& url, const std::string& href) {
    std::string path = url.pathname;
    if (starts_with(path, "/")) path = path.substr(1);
    auto parts = split(path, '/');

    if (parts.size() < 2 || parts[0].empty() || strip_git_suffix(parts[1]).empty()) {
        StencilError err{StencilError::Unsupported,
            "invalid GitHub URL format: " + href,
            "expected https://github.com/owner/repo[/tree/branch[/path]]"};
        err.with("input", href);
        return err;
    }

    std::string owner = parts[0];
    std::string repo = strip_git_suffix(parts[1]);
    ParamMap params = parse_query_string(url.query);

    ParsedReference parsed;
    parsed.parameters = params;

    if (path.find("/archive/") != std::string::npos ||
        path.find("/releases/download/") != std::string::npos) {
        parsed.ref = GithubArchiveRef{owner, repo, href};
        return Result<ParsedReference>::ok(std::move(parsed));
    }

    if (parts.size() >= 4 && parts[2] == "tree" && !parts[3].empty()) {
        parsed.ref = GithubBranchRef{owner, repo, parts[3], join_from(parts, 4)};
        return Result<ParsedReference>::ok(std::move(parsed));
    }

    parsed.ref = GithubRepoRef{owner, repo, join_from(parts, 2)};
    return Result<ParsedReference>::ok(std::move(parsed));
}

Result<ParsedReference> parse_full_url(const std::string& url) {
    auto split_r = split_url(url);
    if (split_r.is_err()) return std::move(split_r).error();
    const UrlParts& parts = split_r.value();

    if (parts.hostname == "github.com") {
        return parse_github_url(parts, url);
    }

    ParsedReference parsed;
    parsed.parameters = parse_query_string(parts.query);

    std::string lower_path = to_lower(parts.pathname);
    for (const char* ext : kArchiveExtensions) {
        if (ends_with(lower_path, ext)) {
            parsed.ref = TarballRef{url};
            return Result<ParsedReference>::ok(std::move(parsed));
        }
    }

    parsed.ref = GenericUrlRef{parts.scheme, parts.hostname, parts.pathname,
                               parsed.parameters};
    return Result<ParsedReference>::ok(std::move(parsed));
}

static Result<ParsedReference> parse_shorthand(const std::string& input) {
    std::string repo_part = input;
    std::optional<std::string> branch;
    std::string branch_subpath;

    auto hash = input.find('#');
    if (hash != std::string::npos) {
        repo_part = input.substr(0, hash);
        std::string branch_part = input.substr(hash + 1);
        auto slash = branch_part.find('/');
        branch = branch_part.substr(0, slash);
        if (slash != std::string::npos) {
            branch_subpath = join_from(split(branch_part.substr(slash + 1), '/'), 0);
        }
        if (branch->empty()) {
            return unsupported(input, "empty branch after '#'");
        }
    }

    auto parts = split(repo_part, '/');
    if (parts.size() < 2) {
        return unsupported(input, "checked local, full URL, registry and GitHub shorthand");
    }

    std::string owner = parts[0];
    std::string repo = strip_git_suffix(parts[1]);
    if (owner.empty() || repo.empty()) {
        return unsupported(input, "shorthand needs both owner and repository");
    }

    std::string subpath = join_from(parts, 2);
    if (!branch_subpath.empty()) {
        subpath = subpath.empty() ? branch_subpath : subpath + "/" + branch_subpath;
    }

    ParsedReference parsed;
    parsed.ref = GithubShorthandRef{owner, repo, subpath, branch};
    return Result<ParsedReference>::ok(std::move(parsed));
}

Result<ParsedReference> parse_template_url(const std::string& input) {
    if (input.empty()) {
        return unsupported(input, "empty reference");
    }

    if (is_local_reference(input)) {
        ParsedReference parsed;
        parsed.ref = LocalRef{input};
        return Result<ParsedReference>::ok(std::move(parsed));
    }

    if (input.find("://") != std::string::npos) {
        return parse_full_url(input);
    }

    auto segments = split(input.substr(0, input.find('#')), '/');
    if (is_registry_keyword(segments[0])) {
        if (input.find('#') == std::string::npos) {
            ParsedReference parsed;
            if (segments.size() == 2 && !segments[1].empty()) {
                parsed.ref = RegistryRef{"official", segments[1]};
                return Result<ParsedReference>::ok(std::move(parsed));
            }
            if (segments.size() == 3 && !segments[1].empty() && !segments[2].empty()) {
                parsed.ref = RegistryRef{segments[1], segments[2]};
                return Result<ParsedReference>::ok(std::move(parsed));
            }
        }
        return unsupported(input,
            "registry references take the form registry/<template> or "
            "registry/<namespace>/<template>");
    }

    return parse_shorthand(input);
}

ParamMap extract_parameters(const ParsedReference& parsed) {
    if (auto url = parsed.get_if<GenericUrlRef>()) {
        return url->search_params;
    }
    return parsed.parameters;
}

} // namespace stencil
