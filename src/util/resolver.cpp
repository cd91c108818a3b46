#include <stencil/resolver.hpp>
#include <stencil/boundary.hpp>
#include <stencil/log.hpp>
#include <stencil/security.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace stencil {

const AliasTable& official_registry() {
    static const AliasTable table = {
        {"official", {
            {"express-api", "million-views/packages/express-api"},
            {"nextjs-app", "million-views/packages/nextjs-app"},
        }},
    };
    return table;
}

static std::string join_keys(const std::map<std::string, std::string>& m) {
    std::string out;
    for (const auto& kv : m) {
        if (!out.empty()) out += ", ";
        out += kv.first;
    }
    return out;
}

TemplateResolver::TemplateResolver(CacheManager& cache, Config config,
                                   std::string safe_root)
    : cache_(cache), config_(std::move(config)), safe_root_(std::move(safe_root)) {}

std::string TemplateResolver::effective_safe_root() const {
    if (!safe_root_.empty()) return safe_root_;
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    return ec ? std::string(".") : cwd.string();
}

// ---------------------------------------------------------------------------
// Alias expansion
// ---------------------------------------------------------------------------

std::string TemplateResolver::resolve_registry_alias(const std::string& url) const {
    auto slash = url.find('/');
    if (slash == std::string::npos) return url;

    std::string ns = url.substr(0, slash);
    std::string name = url.substr(slash + 1);
    if (ns.empty() || name.empty()) return url;

    if (auto mapped = config_.lookup_alias(ns, name)) {
        stencil::log::debug("alias %s -> %s", url.c_str(), mapped->c_str());
        return *mapped;
    }
    return url;
}

// ---------------------------------------------------------------------------
// Path resolution
// ---------------------------------------------------------------------------

Result<std::string> TemplateResolver::resolve_local(const LocalRef& ref) const {
    std::string path = ref.path;
    if (path == "~" || path.rfind("~/", 0) == 0) {
        const char* home = std::getenv("HOME");
        if (!home) {
            return StencilError{StencilError::Config,
                "cannot expand '~': HOME is not set"};
        }
        path = std::string(home) + path.substr(1);
    }

    fs::path p(path);
    if (p.is_relative()) p = fs::path(effective_safe_root()) / p;

    std::string s = p.lexically_normal().string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return Result<std::string>::ok(std::move(s));
}

Result<std::string> TemplateResolver::resolve_github(const std::string& owner,
                                                     const std::string& repo,
                                                     const std::string& subpath,
                                                     const std::optional<std::string>& branch,
                                                     const ResolveOptions& options) {
    std::string url = "https://github.com/" + owner + "/" + repo + ".git";
    std::optional<std::string> effective = branch ? branch : options.branch;

    // Checked against the entry's future location so a bad subpath never clones
    BoundaryValidator boundary(cache_.resolve_repo_directory(url, effective).repo_dir);
    std::string template_dir = boundary.allowed_root();
    if (!subpath.empty()) {
        auto checked = boundary.validate_path(subpath, "template_subpath");
        if (checked.is_err()) return std::move(checked).error();
        template_dir = std::move(checked).value();
    }

    auto dir = cache_.ensure_repository_cached(url, effective, options.cache, options.logger);
    if (dir.is_err()) return std::move(dir).error();
    return Result<std::string>::ok(std::move(template_dir));
}

Result<std::string> TemplateResolver::resolve_registry(const RegistryRef& ref,
                                                       const ResolveOptions& options) {
    const AliasTable& table = official_registry();

    auto ns = table.find(ref.ns);
    if (ns == table.end()) {
        std::string namespaces;
        for (const auto& kv : table) {
            if (!namespaces.empty()) namespaces += ", ";
            namespaces += kv.first;
        }
        StencilError err{StencilError::Registry,
            "unknown registry namespace: " + ref.ns,
            "available namespaces: " + namespaces};
        err.with("namespace", ref.ns);
        return err;
    }

    auto entry = ns->second.find(ref.template_name);
    if (entry == ns->second.end()) {
        StencilError err{StencilError::Registry,
            "unknown template in " + ref.ns + " namespace: " + ref.template_name,
            "available templates in " + ref.ns + ": " + join_keys(ns->second)};
        err.with("namespace", ref.ns).with("template", ref.template_name);
        return err;
    }

    auto parsed = parse_template_url(entry->second);
    if (parsed.is_err()) return std::move(parsed).error();
    if (parsed.value().is<RegistryRef>()) {
        return StencilError{StencilError::Registry,
            "registry entry " + ref.ns + "/" + ref.template_name +
            " points at another registry entry"};
    }
    return resolve_to_path(parsed.value(), options);
}

Result<std::string> TemplateResolver::resolve_to_path(const ParsedReference& parsed,
                                                      const ResolveOptions& options) {
    if (auto local = parsed.get_if<LocalRef>()) {
        return resolve_local(*local);
    }
    if (auto gh = parsed.get_if<GithubShorthandRef>()) {
        return resolve_github(gh->owner, gh->repo, gh->subpath, gh->branch, options);
    }
    if (auto gh = parsed.get_if<GithubRepoRef>()) {
        return resolve_github(gh->owner, gh->repo, gh->subpath, std::nullopt, options);
    }
    if (auto gh = parsed.get_if<GithubBranchRef>()) {
        return resolve_github(gh->owner, gh->repo, gh->subpath, gh->branch, options);
    }
    if (auto reg = parsed.get_if<RegistryRef>()) {
        return resolve_registry(*reg, options);
    }
    if (auto archive = parsed.get_if<GithubArchiveRef>()) {
        StencilError err{StencilError::Unsupported,
            "GitHub archive URLs not yet supported",
            "use https://github.com/owner/repo or https://github.com/owner/repo/tree/branch"};
        err.with("input", archive->archive_url);
        return err;
    }
    if (auto tarball = parsed.get_if<TarballRef>()) {
        StencilError err{StencilError::Unsupported,
            "Tarball URLs not yet supported",
            "use a repository URL or extract the archive and pass a local path"};
        err.with("input", tarball->url);
        return err;
    }
    if (auto url = parsed.get_if<GenericUrlRef>()) {
        StencilError err{StencilError::Unsupported,
            "Generic repository URLs not yet supported",
            "use a GitHub reference or a local path"};
        err.with("input", url->protocol + "://" + url->hostname + url->pathname);
        return err;
    }

    return StencilError{StencilError::Unsupported,
        std::string("Unsupported URL type: ") + parsed.type_name()};
}

// ---------------------------------------------------------------------------
// Metadata
// ---------------------------------------------------------------------------

nlohmann::json TemplateResolver::load_template_metadata(const std::string& dir) {
    std::string trimmed = dir;
    while (trimmed.size() > 1 && trimmed.back() == '/') trimmed.pop_back();
    std::string base = fs::path(trimmed).filename().string();

    nlohmann::json fallback = {
        {"id", base},
        {"name", base},
        {"version", "1.0.0"},
    };

    std::ifstream in(fs::path(trimmed) / "template.json");
    if (!in.is_open()) return fallback;

    nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        stencil::log::debug("ignoring unreadable template.json in %s", trimmed.c_str());
        return fallback;
    }
    return j;
}

// ---------------------------------------------------------------------------
// Pipeline
// ---------------------------------------------------------------------------

Result<ResolvedTemplate> TemplateResolver::resolve_template(const std::string& url,
                                                            const ResolveOptions& options) {
    std::string safe_root = effective_safe_root();

    STENCIL_TRY(validate_template_url(url, safe_root));

    std::string expanded = resolve_registry_alias(url);
    if (expanded != url) {
        STENCIL_TRY(validate_template_url(expanded, safe_root));
    }

    auto parsed = parse_template_url(expanded);
    if (parsed.is_err()) return std::move(parsed).error();
    stencil::log::debug("classified '%s' as %s", expanded.c_str(), parsed.value().type_name());

    auto path = resolve_to_path(parsed.value(), options);
    if (path.is_err()) return std::move(path).error();

    ResolvedTemplate out;
    out.template_path = std::move(path).value();
    out.parameters = extract_parameters(parsed.value());
    out.metadata = load_template_metadata(out.template_path);
    return Result<ResolvedTemplate>::ok(std::move(out));
}

} // namespace stencil
