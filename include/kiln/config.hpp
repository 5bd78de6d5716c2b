#pragma once

#include <kiln/result.hpp>
#include <kiln/descriptor.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace kiln {

struct Settings {
    std::string cache_root;               // empty: ~/.kiln/cache
    std::string build_root = ".kiln";     // relative paths resolve against the project root
    int install_timeout = 600;            // seconds
    int compile_timeout = 900;            // seconds
    std::string web_server_base = "nginx:alpine";
    std::vector<std::string> static_entrypoint{"nginx", "-g", "daemon off;"};
    std::string static_root = "/usr/share/nginx/html";
    bool keep_workdirs = false;
    std::string log_level;                // empty: leave the CLI's level alone
};

// Layered configuration: built-in < global < project.
// Later layers override earlier ones.
struct Config {
    Settings settings;
    // Settings keys explicitly set by this layer (for merge)
    std::set<std::string> settings_set;

    std::map<std::string, Ecosystem> ecosystems;
    std::map<std::string, ServiceDescriptor> services;
    std::map<std::string, EnvironmentProfile> environments;

    // The worker/adminportal services, dev/production profiles and the
    // python/node ecosystems
    static Config builtin();

    // Parse a TOML layer. When `base` already defines a service,
    // environment or ecosystem of the same name, the table overrides its
    // fields instead of starting from scratch.
    static Result<Config> parse(const std::string& toml_str,
                                const Config* base = nullptr);
    static Result<Config> load(const std::string& path,
                               const Config* base = nullptr);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // builtin() -> global -> project
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);

    // Cross-reference checks: every service names a known ecosystem,
    // build steps have a command, entrypoints are non-empty
    Status validate() const;

    // Name lookups; malformed or unknown names are InvalidArg
    Result<const ServiceDescriptor*> find_service(const std::string& name) const;
    Result<const EnvironmentProfile*> find_environment(const std::string& name) const;
    Result<const Ecosystem*> find_ecosystem(const std::string& name) const;
};

// ~/.kiln/config.toml, or "" when HOME is unset
std::string global_config_path();

// ~/.kiln/cache, or a directory under the system temp dir when HOME is unset
std::string default_cache_root();

} // namespace kiln
