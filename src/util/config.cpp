#include <stencil/config.hpp>
#include <toml++/toml.hpp>
#include <cctype>
#include <fstream>
#include <sstream>

namespace stencil {

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

static void read_alias_tables(const toml::table& section, AliasTable& out,
                              bool skip_descriptors) {
    for (const auto& [ns_key, ns_val] : section) {
        auto ns_tbl = ns_val.as_table();
        if (!ns_tbl) continue;

        if (skip_descriptors && (*ns_tbl)["type"].value<std::string>()) {
            continue;
        }

        auto& names = out[std::string(ns_key)];
        for (const auto& [name_key, name_val] : *ns_tbl) {
            if (auto s = name_val.value<std::string>()) {
                names[std::string(name_key)] = std::string(*s);
            }
        }
    }
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return StencilError{StencilError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    if (auto defaults = doc["defaults"].as_table()) {
        if (auto templates = (*defaults)["templates"].as_table()) {
            read_alias_tables(*templates, cfg.templates, false);
        }
        if (auto registries = (*defaults)["registries"].as_table()) {
            read_alias_tables(*registries, cfg.registries, true);
        }
    }

    if (auto cache = doc["cache"].as_table()) {
        if (auto v = (*cache)["dir"].value<std::string>()) {
            cfg.cache_dir = std::string(*v);
        }
        if (auto v = (*cache)["ttl-hours"].value<double>()) {
            if (*v < 0) {
                return StencilError{StencilError::Config,
                    "cache.ttl-hours must not be negative"};
            }
            cfg.ttl_hours = *v;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return StencilError{StencilError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str());
}

void Config::merge(const Config& other) {
    for (const auto& [ns, names] : other.templates) {
        for (const auto& [name, url] : names) {
            templates[ns][name] = url;
        }
    }
    for (const auto& [ns, names] : other.registries) {
        for (const auto& [name, url] : names) {
            registries[ns][name] = url;
        }
    }
    if (other.cache_dir) cache_dir = other.cache_dir;
    if (other.ttl_hours) ttl_hours = other.ttl_hours;
}

static std::optional<std::string> find_in(const AliasTable& table,
                                          const std::string& ns,
                                          const std::string& name) {
    auto ns_it = table.find(ns);
    if (ns_it == table.end()) return std::nullopt;
    auto name_it = ns_it->second.find(name);
    if (name_it == ns_it->second.end()) return std::nullopt;
    std::string value = trim(name_it->second);
    if (value.empty()) return std::nullopt;
    return value;
}

std::optional<std::string> Config::lookup_alias(const std::string& ns,
                                                const std::string& name) const {
    if (auto v = find_in(templates, ns, name)) return v;
    return find_in(registries, ns, name);
}

} // namespace stencil
