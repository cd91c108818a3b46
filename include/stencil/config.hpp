#pragma once

#include <stencil/result.hpp>
#include <map>
#include <optional>
#include <string>

namespace stencil {

// namespace -> template name -> source reference
using AliasTable = std::map<std::string, std::map<std::string, std::string>>;

// Resolver configuration. In TOML:
//
//   [defaults.templates.<ns>]
//   <name> = "<source>"
//
//   [defaults.registries.<ns>]       # legacy alias mapping
//   <name> = "<source>"
//
//   [cache]
//   dir = "/path/to/cache"
//   ttl-hours = 24
//
// A registries table with a string `type` key describes a registry backend
// handled elsewhere and contributes no aliases. Non-string leaves are skipped.
struct Config {
    AliasTable templates;
    AliasTable registries;
    std::optional<std::string> cache_dir;
    std::optional<double> ttl_hours;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // templates first, then legacy registries. Values are trimmed; blank
    // values do not count.
    std::optional<std::string> lookup_alias(const std::string& ns,
                                            const std::string& name) const;
};

} // namespace stencil
