#pragma once

#include <kiln/result.hpp>
#include <kiln/compiler.hpp>
#include <kiln/config.hpp>
#include <kiln/image.hpp>
#include <kiln/resolver.hpp>
#include <kiln/staging.hpp>
#include <filesystem>
#include <optional>

namespace kiln {

class ArtifactStore;

// Chooses the runtime for a service and lays out its image:
//  - static server when a compiled static_dir exists and the service is
//    served statically: web server base, the artifact as the only layer
//  - process runner otherwise: ecosystem runtime base, dependency tree,
//    staged source, and the artifact when a process serves a built app
class RuntimeAssembler {
public:
    explicit RuntimeAssembler(const Settings& settings, ArtifactStore* store = nullptr)
        : settings_(settings), store_(store) {}

    // Assembly errors: no base image, port outside 1..65535, a profile
    // PORT that disagrees with the exposed port, or a layer whose source
    // lies outside this run's context, dependency entry or artifact.
    // Writes layers/, image.json and Dockerfile to image_path().
    Result<Image> assemble(const ServiceDescriptor& descriptor,
                           const EnvironmentProfile& profile,
                           const Ecosystem& ecosystem,
                           const StagedSource& staged,
                           const ResolvedDependencies& deps,
                           const std::optional<BuildArtifact>& artifact,
                           const std::filesystem::path& out_root);

    // <out_root>/images/<service>/<environment>
    static std::filesystem::path image_path(const std::filesystem::path& out_root,
                                            const std::string& service,
                                            const std::string& environment);

private:
    Result<Image> plan(const ServiceDescriptor& descriptor,
                       const EnvironmentProfile& profile,
                       const Ecosystem& ecosystem,
                       const StagedSource& staged,
                       const ResolvedDependencies& deps,
                       const std::optional<BuildArtifact>& artifact) const;
    Status materialize(Image& image, const std::filesystem::path& out_root) const;

    Settings settings_;
    ArtifactStore* store_;
};

} // namespace kiln
