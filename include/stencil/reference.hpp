#pragma once

#include <stencil/result.hpp>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace stencil {

using ParamMap = std::map<std::string, std::string>;

// ./dir, ../dir, ~/dir, /abs/dir. Left unresolved.
struct LocalRef {
    std::string path;
};

// owner/repo[/subpath][#branch[/subpath]]
struct GithubShorthandRef {
    std::string owner;
    std::string repo;
    std::string subpath;
    std::optional<std::string> branch;
};

// https://github.com/owner/repo[/subpath]
struct GithubRepoRef {
    std::string owner;
    std::string repo;
    std::string subpath;
};

// https://github.com/owner/repo/tree/<branch>[/subpath]
struct GithubBranchRef {
    std::string owner;
    std::string repo;
    std::string branch;
    std::string subpath;
};

// https://github.com/owner/repo/archive/... or /releases/download/...
struct GithubArchiveRef {
    std::string owner;
    std::string repo;
    std::string archive_url;
};

// registry/<template> or <keyword>/<namespace>/<template>
struct RegistryRef {
    std::string ns;
    std::string template_name;
};

struct TarballRef {
    std::string url;
};

struct GenericUrlRef {
    std::string protocol;   // scheme without the trailing ':'
    std::string hostname;
    std::string pathname;
    ParamMap search_params;
};

struct ParsedReference {
    using Variant = std::variant<LocalRef,
                                 GithubShorthandRef,
                                 GithubRepoRef,
                                 GithubBranchRef,
                                 GithubArchiveRef,
                                 RegistryRef,
                                 TarballRef,
                                 GenericUrlRef>;

    Variant ref;
    ParamMap parameters;

    // "local", "github-shorthand", "github-repo", "github-branch",
    // "github-archive", "registry", "tarball", "url"
    const char* type_name() const;

    template<typename T>
    const T* get_if() const { return std::get_if<T>(&ref); }

    template<typename T>
    bool is() const { return std::holds_alternative<T>(ref); }
};

// Components of a scheme://authority/path?query#fragment string
struct UrlParts {
    std::string scheme;     // lowercased, no ':'
    std::string userinfo;
    std::string hostname;   // lowercased, IPv6 brackets removed
    std::string port;
    std::string pathname;   // always starts with '/'
    std::string query;      // raw, without '?'
    std::string fragment;   // raw, without '#'
};

Result<UrlParts> split_url(const std::string& url);

// application/x-www-form-urlencoded decoding of a query string
ParamMap parse_query_string(const std::string& query);

// True for ./, ../, ~/ (or bare ~) and absolute filesystem paths
bool is_local_reference(const std::string& input);

// Reserved first segments that make a reference a registry lookup
bool is_registry_keyword(const std::string& segment);

// Classify a template reference. Pure: never touches disk or network.
// Fails with Unsupported when the input matches no known form.
Result<ParsedReference> parse_template_url(const std::string& input);

// Classify a reference that contains "scheme://"
Result<ParsedReference> parse_full_url(const std::string& url);

// Classify a github.com URL
Result<ParsedReference> parse_github_url(const UrlParts& url, const std::string& href);

ParamMap extract_parameters(const ParsedReference& parsed);

} // namespace stencil
