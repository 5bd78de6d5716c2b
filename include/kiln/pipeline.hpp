#pragma once

#include <kiln/result.hpp>
#include <kiln/assembler.hpp>
#include <kiln/compiler.hpp>
#include <kiln/config.hpp>
#include <kiln/dep_cache.hpp>
#include <kiln/image.hpp>
#include <kiln/resolver.hpp>
#include <kiln/store.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kiln {

enum class PipelineState {
    Pending,
    Staged,
    DependenciesResolved,
    Compiled,
    Assembled,
    Tagged,
    Failed
};

const char* to_string(PipelineState state);

struct PipelineOptions {
    int install_timeout = 0;               // seconds; 0 takes settings.install_timeout
    int compile_timeout = 0;               // seconds; 0 takes settings.compile_timeout
    std::string cache_root;                // empty takes settings.cache_root
    std::optional<bool> keep_workdirs;     // unset takes settings.keep_workdirs
};

// What one run went through. `states` lists every state entered, in order.
struct RunReport {
    std::string service;
    std::string environment;
    std::string run_id;
    std::string profile_fingerprint;   // EnvironmentProfile::fingerprint() of the run
    std::vector<PipelineState> states;
    PipelineState state = PipelineState::Pending;
    std::optional<KilnError> failure;
    std::optional<Image> image;
    bool dependency_cache_hit = false;
    bool compiled = false;

    bool ok() const { return state == PipelineState::Tagged; }
};

// Runs Staged -> DependenciesResolved -> [Compiled] -> Assembled -> Tagged
// for one (service, environment) pair. Any failure moves the run to
// Failed and stops it; nothing is retried.
//
// build() may be called from several threads at once. Runs for the same
// pair serialize around compile and assemble, which share output paths.
class Pipeline {
public:
    Pipeline(Config config, std::filesystem::path project_root,
             PipelineOptions options = {});

    // Creates the build and cache roots and opens <build_root>/kiln.db
    Status open();
    bool is_open() const { return store_.is_open(); }

    Result<Image> build(const std::string& service, const std::string& environment);
    RunReport build_with_report(const std::string& service, const std::string& environment);

    const Config& config() const { return config_; }
    const std::filesystem::path& build_root() const { return build_root_; }
    const std::filesystem::path& cache_root() const { return cache_root_; }
    ArtifactStore& store() { return store_; }
    DependencyCache& dependency_cache() { return cache_; }

    // <service>:<environment>-<content hash prefix>
    static std::string make_tag(const Image& image);

private:
    Status run(RunReport& report, const std::filesystem::path& run_dir);
    void enter(RunReport& report, PipelineState state) const;

    Config config_;
    std::filesystem::path project_root_;
    std::filesystem::path build_root_;
    std::filesystem::path cache_root_;
    int install_timeout_;
    int compile_timeout_;
    bool keep_workdirs_;

    ArtifactStore store_;
    DependencyCache cache_;
    DependencyResolver resolver_;
    ArtifactCompiler compiler_;
    RuntimeAssembler assembler_;
};

} // namespace kiln
