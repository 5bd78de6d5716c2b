#pragma once

#include <kiln/result.hpp>
#include <kiln/descriptor.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kiln {

struct DeclaredPackage {
    std::string name;          // normalized (pip names: lowercase, -_. folded to -)
    std::string requirement;   // version range as written, "" for any version

    bool operator==(const DeclaredPackage& o) const {
        return name == o.name && requirement == o.requirement;
    }
};

// Dependency declaration of one service plus its lock file, if any.
// The lock fingerprint is the dependency cache key.
struct DependencyManifest {
    std::string ecosystem;
    ManifestFormat format = ManifestFormat::Requirements;
    std::string manifest_file;
    std::string lock_file;
    std::vector<DeclaredPackage> declared_packages;   // sorted by name
    std::vector<std::string> options;                 // pip option lines (--index-url, ...)
    bool has_lock = false;
    std::map<std::string, std::string> locked;        // top-level name -> pinned version
    std::string lock_canonical;                       // whitespace/order-normalized lock content
    std::string lock_fingerprint;

    // Read <dir>/<manifest> and, when present, <dir>/<lock>
    static Result<DependencyManifest> from_source(const Ecosystem& ecosystem,
                                                  const std::filesystem::path& dir);

    static Result<DependencyManifest> parse(const Ecosystem& ecosystem,
                                            const std::string& manifest_text,
                                            const std::optional<std::string>& lock_text);

    // LockMismatch when the lock file is missing, a declared package is
    // not locked, or its locked version is outside the declared range
    Status check_lock() const;
};

// PEP 503 name normalization
std::string normalize_python_name(const std::string& name);

// Does `version` satisfy `requirement`? Ranges that name a source instead
// of a version (git URLs, file: paths, ...) are satisfied by any pin.
Result<bool> requirement_satisfied(const std::string& requirement,
                                   const std::string& version);

} // namespace kiln
