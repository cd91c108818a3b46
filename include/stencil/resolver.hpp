#pragma once

#include <stencil/result.hpp>
#include <stencil/cache.hpp>
#include <stencil/config.hpp>
#include <stencil/reference.hpp>
#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace stencil {

class OperationLogger;

struct ResolveOptions {
    std::optional<std::string> branch;   // used when the reference names none
    CacheOptions cache;
    OperationLogger* logger = nullptr;
};

struct ResolvedTemplate {
    std::string template_path;
    ParamMap parameters;
    nlohmann::json metadata;
};

// Built-in official sources: namespace -> template -> shorthand reference
const AliasTable& official_registry();

// Turns a template reference into a directory on disk:
//   alias expansion -> security validation -> classification
//   -> path resolution (through the cache for remote sources)
//   -> template.json load
class TemplateResolver {
public:
    // safe_root bounds relative local references; empty means the current
    // directory at the time of each call
    explicit TemplateResolver(CacheManager& cache, Config config = {},
                              std::string safe_root = "");

    // "<ns>/<name>" -> configured source, or url unchanged
    std::string resolve_registry_alias(const std::string& url) const;

    Result<std::string> resolve_to_path(const ParsedReference& parsed,
                                        const ResolveOptions& options = {});

    // template.json from dir, or {id, name: basename(dir), version: "1.0.0"}
    static nlohmann::json load_template_metadata(const std::string& dir);

    Result<ResolvedTemplate> resolve_template(const std::string& url,
                                              const ResolveOptions& options = {});

    const Config& config() const { return config_; }

private:
    Result<std::string> resolve_local(const LocalRef& ref) const;
    Result<std::string> resolve_github(const std::string& owner,
                                       const std::string& repo,
                                       const std::string& subpath,
                                       const std::optional<std::string>& branch,
                                       const ResolveOptions& options);
    Result<std::string> resolve_registry(const RegistryRef& ref,
                                         const ResolveOptions& options);
    std::string effective_safe_root() const;

    CacheManager& cache_;
    Config config_;
    std::string safe_root_;
};

} // namespace stencil
