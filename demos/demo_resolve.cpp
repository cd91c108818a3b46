// demo_resolve.cpp
//
// Resolves one template reference end to end: validation, classification,
// a real `git clone` through the cache, and template.json loading.
//
//     ./demo_resolve user/repo                      # GitHub shorthand
//     ./demo_resolve registry/nextjs-app            # official registry
//     ./demo_resolve ./templates/basic              # local directory
//     ./demo_resolve 'template;rm -rf /'            # rejected before any I/O
//
// Optional second argument: a stencil.toml with aliases and cache settings.
// STENCIL_LOG=debug shows the cache_hit / cache_miss events.

#include <stencil/cache.hpp>
#include <stencil/config.hpp>
#include <stencil/git.hpp>
#include <stencil/log.hpp>
#include <stencil/op_log.hpp>
#include <stencil/resolver.hpp>

#include <iostream>
#include <string>

using namespace stencil;

static Result<Config> load_config(int argc, char** argv) {
    if (argc < 3) return Result<Config>::ok(Config{});
    return Config::load(argv[2]);
}

static Result<ResolvedTemplate> run(int argc, char** argv) {
    if (argc < 2) {
        return StencilError{
            StencilError::InvalidArg,
            "no template reference specified",
            "usage: demo_resolve <reference> [stencil.toml]"
        };
    }

    auto config = load_config(argc, argv);
    STENCIL_TRY(config);

    GitCli git;
    auto version = git.check_version();
    STENCIL_TRY(version);
    log::debug("using git %s", version.value().c_str());

    std::string cache_dir = config.value().cache_dir
        ? *config.value().cache_dir
        : CacheManager::default_cache_root();
    CacheManager cache(cache_dir, git);

    auto swept = cache.clear_expired_entries();
    STENCIL_TRY(swept);
    if (swept.value().removed > 0) {
        log::info("evicted %zu expired cache entries", swept.value().removed);
    }

    ResolveOptions options;
    options.cache.ttl_hours = config.value().ttl_hours;
    DiagnosticLogger events;
    options.logger = &events;

    TemplateResolver resolver(cache, config.value());
    return resolver.resolve_template(argv[1], options);
}

int main(int argc, char** argv) {
    log::init_from_env();

    auto result = run(argc, argv);
    if (result.is_err()) {
        log::error("resolution failed");
        std::cerr << "\n" << result.error().format() << "\n";
        return 1;
    }

    const auto& resolved = result.value();
    std::cout << "path:     " << resolved.template_path << "\n";
    std::cout << "metadata: " << resolved.metadata.dump() << "\n";
    for (const auto& [key, value] : resolved.parameters) {
        std::cout << "param:    " << key << " = " << value << "\n";
    }
    return 0;
}
