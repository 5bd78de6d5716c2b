#pragma once

#include <kiln/result.hpp>
#include <kiln/descriptor.hpp>
#include <kiln/resolver.hpp>
#include <kiln/staging.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kiln {

class ArtifactStore;

// Output of the build step, handed to the assembler by path and hash
struct BuildArtifact {
    std::string service;
    std::string environment;
    int64_t produced_at = 0;
    OutputKind output_kind = OutputKind::StaticDir;
    std::string content_hash;
    std::filesystem::path path;
    std::vector<std::string> files;
};

class ArtifactCompiler {
public:
    explicit ArtifactCompiler(ArtifactStore* store = nullptr) : store_(store) {}

    // Runs the descriptor's build command over a writable copy of the
    // staged source plus the dependency tree (inside work_dir), then
    // publishes build_output to artifact_path(). Returns nullopt without
    // running anything when the service has no build step or the profile
    // disables builds: the assembler then serves from source.
    Result<std::optional<BuildArtifact>> compile(const ServiceDescriptor& descriptor,
                                                 const EnvironmentProfile& profile,
                                                 const Ecosystem& ecosystem,
                                                 const StagedSource& staged,
                                                 const ResolvedDependencies& deps,
                                                 const std::filesystem::path& out_root,
                                                 const std::filesystem::path& work_dir,
                                                 int timeout_seconds);

    // <out_root>/artifacts/<service>/<environment>/static_dir
    static std::filesystem::path artifact_path(const std::filesystem::path& out_root,
                                               const std::string& service,
                                               const std::string& environment);

private:
    ArtifactStore* store_;
};

// Copy a dependency tree, keeping symlinks as links so relative links
// inside it (node_modules/.bin) still resolve
Status copy_dependency_tree(const std::filesystem::path& from,
                           const std::filesystem::path& to);

} // namespace kiln
