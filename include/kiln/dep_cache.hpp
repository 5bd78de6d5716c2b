#pragma once

#include <kiln/result.hpp>
#include <kiln/descriptor.hpp>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace kiln {

class ArtifactStore;

struct DepCacheKey {
    std::string ecosystem;
    std::string fingerprint;   // DependencyManifest::lock_fingerprint
    InstallMode mode = InstallMode::Full;

    // "<fingerprint prefix>-<mode>", the entry's directory name
    std::string dir_name() const;
    // Short form for log lines
    std::string to_string() const;
    // Whole key; installs in flight are matched on this
    std::string id() const;
};

struct DepCacheEntry {
    std::filesystem::path root;   // complete installer output
    std::string content_hash;
};

struct CacheLookup {
    DepCacheEntry entry;
    bool hit = false;        // no install ran for this call
    bool coalesced = false;  // waited on another caller's install
};

struct DepCacheStats {
    int64_t entries = 0;
    int64_t total_bytes = 0;
};

// Fills an empty private directory. The cache publishes the directory
// only when this returns ok.
using Installer = std::function<Status(const std::filesystem::path& dir)>;

// Shared store of installed dependency trees under <root>/deps.
// Entries are immutable once visible. Concurrent misses on one key run
// one installer: in-process callers share its result, other processes
// serialize on a lock file next to the entry.
class DependencyCache {
public:
    explicit DependencyCache(std::filesystem::path root, ArtifactStore* store = nullptr);

    std::optional<DepCacheEntry> lookup(const DepCacheKey& key) const;
    Result<CacheLookup> get_or_install(const DepCacheKey& key, const Installer& install);

    Result<DepCacheStats> stats() const;
    // Remove every entry. Not safe while builds are running.
    Status clean();
    // Remove temp directories left behind by killed installs; returns how many
    Result<int> prune();

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path entry_path(const DepCacheKey& key) const;

private:
    Result<CacheLookup> install_exclusive(const DepCacheKey& key, const Installer& install);

    std::filesystem::path root_;
    ArtifactStore* store_;

    std::mutex mutex_;
    std::map<std::string, std::shared_future<Result<DepCacheEntry>>> inflight_;
};

} // namespace kiln
