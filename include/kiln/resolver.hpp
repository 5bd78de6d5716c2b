#pragma once

#include <kiln/result.hpp>
#include <kiln/dep_cache.hpp>
#include <kiln/dep_manifest.hpp>
#include <kiln/descriptor.hpp>
#include <kiln/staging.hpp>
#include <filesystem>
#include <string>

namespace kiln {

struct ResolvedDependencies {
    DependencyManifest manifest;
    std::filesystem::path entry_dir;   // cache entry holding the installer output
    std::filesystem::path deps_dir;    // entry_dir / ecosystem.deps_dir
    std::string fingerprint;
    std::string content_hash;
    bool cache_hit = false;
};

// Installs a service's dependencies through the shared cache. An
// unchanged lock fingerprint is always a cache hit; a changed one always
// runs the ecosystem's installer from scratch.
class DependencyResolver {
public:
    explicit DependencyResolver(DependencyCache& cache) : cache_(cache) {}

    // ci-clean profiles check the lock file first (LockMismatch).
    // Installer failure is DependencyInstall, expiry is Timeout; neither
    // leaves a cache entry behind.
    Result<ResolvedDependencies> resolve(const ServiceDescriptor& descriptor,
                                         const EnvironmentProfile& profile,
                                         const Ecosystem& ecosystem,
                                         const StagedSource& staged,
                                         int timeout_seconds);

private:
    DependencyCache& cache_;
};

} // namespace kiln
