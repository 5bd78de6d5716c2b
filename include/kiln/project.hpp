#pragma once

#include <kiln/result.hpp>
#include <kiln/config.hpp>
#include <string>
#include <filesystem>

namespace kiln {

struct Project {
    std::filesystem::path root_dir;       // dir containing Kiln.toml
    std::filesystem::path manifest_path;  // full path to Kiln.toml
    std::string checksum;                 // SHA-256 of Kiln.toml contents
    Config config;                        // effective: built-in < global < Kiln.toml

    // Walk up from start_dir to find Kiln.toml, then load.
    // An empty global_path skips the global layer.
    static Result<Project> discover(const std::filesystem::path& start_dir,
                                    const std::string& global_path = global_config_path());

    // Load from a specific directory (must contain Kiln.toml)
    static Result<Project> load(const std::filesystem::path& project_dir,
                                const std::string& global_path = global_config_path());

    // Settings paths, resolved against the project root
    std::filesystem::path build_root() const;
    std::filesystem::path cache_root() const;
};

// Walk up from start_dir to find the nearest Kiln.toml, return its path
Result<std::filesystem::path> find_manifest(const std::filesystem::path& start_dir);

// Check if dir contains a Kiln.toml
bool has_manifest(const std::filesystem::path& dir);

} // namespace kiln
