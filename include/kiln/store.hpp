#pragma once

#include <kiln/result.hpp>
#include <kiln/descriptor.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace kiln {

struct StoreStats {
    int64_t dep_entry_count = 0;
    int64_t artifact_count = 0;
    int64_t image_tag_count = 0;
    int64_t total_bytes = 0;
};

// One installed dependency tree in the cache
struct DepEntryRecord {
    std::string ecosystem;
    std::string fingerprint;
    InstallMode install_mode = InstallMode::Full;
    std::string path;
    std::string content_hash;
    int64_t created_at = 0;
};

// BuildArtifact: never mutated, superseded by a newer record with the
// same (service, environment, output_kind)
struct ArtifactRecord {
    std::string service;
    std::string environment;
    int64_t produced_at = 0;
    OutputKind output_kind = OutputKind::StaticDir;
    std::string content_hash;
    std::string path;
};

struct ImageTagRecord {
    std::string tag;
    std::string service;
    std::string environment;
    std::string content_hash;
    int64_t created_at = 0;
};

// SQLite index of dependency cache entries, build artifacts and image
// tags. Calls are serialized internally so one store can be shared by
// concurrent pipeline runs.
class ArtifactStore {
public:
    ArtifactStore();
    ~ArtifactStore();
    ArtifactStore(ArtifactStore&&) noexcept;
    ArtifactStore& operator=(ArtifactStore&&) noexcept;

    // Database lifecycle
    Status open(const std::string& db_path);
    void close();
    bool is_open() const;

    // Dependency cache index
    Status record_dep(const DepEntryRecord& entry);
    Result<DepEntryRecord> lookup_dep(const std::string& ecosystem,
                                      const std::string& fingerprint,
                                      InstallMode mode);
    Status remove_dep(const std::string& ecosystem,
                      const std::string& fingerprint,
                      InstallMode mode);
    Result<std::vector<DepEntryRecord>> list_deps();

    // Build artifacts
    Status record_artifact(const ArtifactRecord& artifact);
    Result<ArtifactRecord> latest_artifact(const std::string& service,
                                           const std::string& environment,
                                           OutputKind kind);
    Result<std::vector<ArtifactRecord>> list_artifacts();

    // Image tags
    Status record_tag(const ImageTagRecord& tag);
    Result<std::vector<ImageTagRecord>> list_tags();

    // Maintenance
    Result<StoreStats> stats();
    Status clear();
    // Drop rows whose directory no longer exists; returns how many
    Result<int> prune();

    static int64_t now();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace kiln
