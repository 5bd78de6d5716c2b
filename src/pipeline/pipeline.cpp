#include <kiln/pipeline.hpp>
#include <kiln/file_lock.hpp>
#include <kiln/fs_tree.hpp>
#include <kiln/log.hpp>
#include <kiln/staging.hpp>
#include <kiln/uuid.hpp>

namespace fs = std::filesystem;

namespace kiln {

const char* to_string(PipelineState state) {
    switch (state) {
        case PipelineState::Pending: return "Pending";
        case PipelineState::Staged: return "Staged";
        case PipelineState::DependenciesResolved: return "DependenciesResolved";
        case PipelineState::Compiled: return "Compiled";
        case PipelineState::Assembled: return "Assembled";
        case PipelineState::Tagged: return "Tagged";
        case PipelineState::Failed: return "Failed";
    }
    return "Unknown";
}

static fs::path resolve_root(const fs::path& project_root, const std::string& setting,
                             const std::string& fallback) {
    fs::path p(setting.empty() ? fallback : setting);
    return p.is_absolute() ? p : project_root / p;
}

Pipeline::Pipeline(Config config, fs::path project_root, PipelineOptions options)
    : config_(std::move(config)),
      project_root_(std::move(project_root)),
      build_root_(resolve_root(project_root_, config_.settings.build_root, ".kiln")),
      cache_root_(resolve_root(project_root_,
                               options.cache_root.empty() ? config_.settings.cache_root
                                                          : options.cache_root,
                               default_cache_root())),
      install_timeout_(options.install_timeout > 0 ? options.install_timeout
                                                   : config_.settings.install_timeout),
      compile_timeout_(options.compile_timeout > 0 ? options.compile_timeout
                                                   : config_.settings.compile_timeout),
      keep_workdirs_(options.keep_workdirs.value_or(config_.settings.keep_workdirs)),
      cache_(cache_root_, &store_),
      resolver_(cache_),
      compiler_(&store_),
      assembler_(config_.settings, &store_) {}

Status Pipeline::open() {
    std::error_code ec;
    for (const auto& dir : {build_root_, build_root_ / "runs", build_root_ / "locks", cache_root_}) {
        fs::create_directories(dir, ec);
        if (ec) {
            return KilnError{KilnError::IO,
                "cannot create " + dir.string() + ": " + ec.message()};
        }
    }
    KILN_TRY(store_.open((build_root_ / "kiln.db").string()));
    log::debug("build root %s, cache root %s",
               build_root_.string().c_str(), cache_root_.string().c_str());
    return ok_status();
}

std::string Pipeline::make_tag(const Image& image) {
    return image.service + ":" + image.environment + "-" + image.content_hash.substr(0, 12);
}

void Pipeline::enter(RunReport& report, PipelineState state) const {
    report.states.push_back(state);
    report.state = state;
    if (state != PipelineState::Failed) {
        log::info("[%s/%s] %s", report.service.c_str(), report.environment.c_str(),
                  to_string(state));
    }
}

Result<Image> Pipeline::build(const std::string& service, const std::string& environment) {
    RunReport report = build_with_report(service, environment);
    if (!report.ok()) return std::move(*report.failure);
    return Result<Image>::ok(std::move(*report.image));
}

RunReport Pipeline::build_with_report(const std::string& service,
                                      const std::string& environment) {
    RunReport report;
    report.service = service;
    report.environment = environment;
    report.run_id = Uuid::v4().short_id();
    enter(report, PipelineState::Pending);

    fs::path run_dir = build_root_ / "runs" / (service + "-" + environment + "-" + report.run_id);
    auto status = run(report, run_dir);

    std::error_code ec;
    if (fs::exists(run_dir, ec)) {
        if (keep_workdirs_) {
            log::info("kept run directory %s", run_dir.string().c_str());
        } else {
            auto removed = remove_tree(run_dir);
            if (removed.is_err()) {
                log::warn("cannot remove run directory: %s", removed.error().message.c_str());
            }
        }
    }

    if (status.is_err()) {
        report.failure = std::move(status).error();
        report.image.reset();
        enter(report, PipelineState::Failed);
        log::error("[%s/%s] failed in %s: %s", service.c_str(), environment.c_str(),
                   report.failure->stage.empty() ? "pipeline" : report.failure->stage.c_str(),
                   report.failure->message.c_str());
    }
    return report;
}

Status Pipeline::run(RunReport& report, const fs::path& run_dir) {
    if (!is_open()) {
        return KilnError{KilnError::IO, "pipeline is not open", "call Pipeline::open() first"};
    }

    auto descriptor = config_.find_service(report.service);
    if (descriptor.is_err()) return std::move(descriptor).error();
    auto profile = config_.find_environment(report.environment);
    if (profile.is_err()) return std::move(profile).error();
    auto ecosystem = config_.find_ecosystem(descriptor.value()->ecosystem);
    if (ecosystem.is_err()) return std::move(ecosystem).error();

    const ServiceDescriptor& svc = *descriptor.value();
    const EnvironmentProfile& env = *profile.value();
    const Ecosystem& eco = *ecosystem.value();
    report.profile_fingerprint = env.fingerprint();
    log::debug("[%s/%s] profile %s", report.service.c_str(), report.environment.c_str(),
               report.profile_fingerprint.substr(0, 12).c_str());

    std::error_code ec;
    fs::create_directories(run_dir, ec);
    if (ec) {
        return KilnError{KilnError::IO,
            "cannot create run directory " + run_dir.string() + ": " + ec.message()};
    }

    auto staged = SourceStager::stage(project_root_, svc, eco, run_dir);
    if (staged.is_err()) return std::move(staged).error();
    enter(report, PipelineState::Staged);

    auto deps = resolver_.resolve(svc, env, eco, staged.value(), install_timeout_);
    if (deps.is_err()) return std::move(deps).error();
    report.dependency_cache_hit = deps.value().cache_hit;
    enter(report, PipelineState::DependenciesResolved);

    // Compile and assemble publish to paths shared by every run of this pair
    auto pair_lock = FileLock::acquire(
        build_root_ / "locks" / (svc.name + "-" + env.name + ".lock"));
    if (pair_lock.is_err()) return std::move(pair_lock).error();

    auto artifact = compiler_.compile(svc, env, eco, staged.value(), deps.value(),
                                      build_root_, run_dir, compile_timeout_);
    if (artifact.is_err()) return std::move(artifact).error();
    if (artifact.value()) {
        report.compiled = true;
        enter(report, PipelineState::Compiled);
    }

    auto image = assembler_.assemble(svc, env, eco, staged.value(), deps.value(),
                                     artifact.value(), build_root_);
    if (image.is_err()) return std::move(image).error();
    enter(report, PipelineState::Assembled);

    Image& img = image.value();
    img.tag = make_tag(img);
    ImageTagRecord rec;
    rec.tag = img.tag;
    rec.service = img.service;
    rec.environment = img.environment;
    rec.content_hash = img.content_hash;
    rec.created_at = ArtifactStore::now();
    KILN_TRY_AT(store_.record_tag(rec), "tag");

    report.image = std::move(img);
    enter(report, PipelineState::Tagged);
    return ok_status();
}

} // namespace kiln
