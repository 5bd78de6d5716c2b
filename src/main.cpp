#include <kiln/log.hpp>
#include <kiln/pipeline.hpp>
#include <kiln/project.hpp>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace kiln;

namespace fs = std::filesystem;

static const char* USAGE =
    "Usage: kiln <command> [options]\n"
    "\n"
    "Commands:\n"
    "  build <service> <environment>       build and tag an image\n"
    "  dockerfile <service> <environment>  build, then print the Dockerfile\n"
    "  list                                list services and environments\n"
    "  artifacts                           latest artifact per service/environment\n"
    "  cache stats|clean|prune             inspect or clean the dependency cache\n"
    "\n"
    "Options:\n"
    "  --project DIR   project directory (default: nearest Kiln.toml)\n"
    "  --cache DIR     dependency cache root\n"
    "  --timeout S     install and compile timeout in seconds\n"
    "  --keep          keep run directories\n"
    "  -v, --verbose   debug logging\n"
    "  -q, --quiet     errors only\n";

struct CliArgs {
    std::vector<std::string> positional;
    std::string project_dir;
    PipelineOptions options;
    int verbosity = 0;
};

static int fail(const KilnError& err) {
    std::cerr << err.format() << "\n";
    return exit_code_for(err);
}

static Result<CliArgs> parse_args(int argc, char* argv[]) {
    CliArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](const std::string& flag) -> Result<std::string> {
            if (i + 1 >= argc) {
                return KilnError{KilnError::InvalidArg, flag + " needs a value"};
            }
            return Result<std::string>::ok(argv[++i]);
        };

        if (arg == "--project") {
            auto v = next(arg);
            if (v.is_err()) return std::move(v).error();
            args.project_dir = v.value();
        } else if (arg == "--cache") {
            auto v = next(arg);
            if (v.is_err()) return std::move(v).error();
            std::error_code ec;
            fs::path abs = fs::absolute(v.value(), ec);
            args.options.cache_root = ec ? v.value() : abs.string();
        } else if (arg == "--timeout") {
            auto v = next(arg);
            if (v.is_err()) return std::move(v).error();
            char* end = nullptr;
            errno = 0;
            long secs = std::strtol(v.value().c_str(), &end, 10);
            if (errno != 0 || end == v.value().c_str() || *end != '\0' || secs < 1 || secs > 86400) {
                return KilnError{KilnError::InvalidArg,
                    "invalid --timeout '" + v.value() + "'", "seconds between 1 and 86400"};
            }
            args.options.install_timeout = static_cast<int>(secs);
            args.options.compile_timeout = static_cast<int>(secs);
        } else if (arg == "--keep") {
            args.options.keep_workdirs = true;
        } else if (arg == "-v" || arg == "--verbose") {
            args.verbosity = 1;
        } else if (arg == "-q" || arg == "--quiet") {
            args.verbosity = -1;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return KilnError{KilnError::InvalidArg, "unknown option '" + arg + "'",
                             "run kiln --help"};
        } else {
            args.positional.push_back(arg);
        }
    }
    return Result<CliArgs>::ok(std::move(args));
}

static Result<Project> load_project(const CliArgs& args) {
    if (!args.project_dir.empty()) {
        if (!has_manifest(args.project_dir)) {
            return KilnError{KilnError::NotFound,
                "no Kiln.toml in " + args.project_dir};
        }
        return Project::load(args.project_dir);
    }
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        return KilnError{KilnError::IO, "cannot read working directory: " + ec.message()};
    }
    return Project::discover(cwd);
}

// Config [log] level first, then -v/-q on top
static Status apply_log_level(const Settings& settings, int verbosity) {
    if (!settings.log_level.empty()) {
        auto lvl = log::parse_level(settings.log_level);
        if (lvl.is_err()) return std::move(lvl).error();
        log::set_level(lvl.value());
    }
    if (verbosity > 0) log::set_level(log::Debug);
    if (verbosity < 0) log::set_level(log::Error);
    return ok_status();
}

static int cmd_list(const Config& config) {
    std::cout << "services:\n";
    for (const auto& [name, svc] : config.services) {
        std::cout << "  " << name << "  (" << svc.ecosystem << ", " << svc.source_path;
        if (svc.has_build_step) std::cout << ", build -> " << svc.build_output << "/";
        if (svc.exposed_port) std::cout << ", port " << *svc.exposed_port;
        std::cout << ")\n";
    }
    std::cout << "environments:\n";
    for (const auto& [name, env] : config.environments) {
        std::cout << "  " << name << "  (" << to_string(env.install_mode)
                  << (env.build_enabled ? ", build enabled" : ", build disabled") << ")\n";
    }
    return 0;
}

static int cmd_build(Pipeline& pipeline, const CliArgs& args, bool dockerfile) {
    if (args.positional.size() != 3) {
        std::cerr << USAGE;
        return 2;
    }
    RunReport report = pipeline.build_with_report(args.positional[1], args.positional[2]);
    if (!report.ok()) return fail(*report.failure);
    const Image& image = *report.image;

    if (dockerfile) {
        std::cout << image.render_dockerfile();
    } else {
        std::cout << image.tag << "\n"
                  << "content_hash " << image.content_hash << "\n"
                  << "profile " << report.profile_fingerprint.substr(0, 12) << "\n"
                  << "context " << image.context_dir.string() << "\n";
    }
    return 0;
}

static int cmd_artifacts(Pipeline& pipeline) {
    auto rows = pipeline.store().list_artifacts();
    if (rows.is_err()) return fail(rows.error());
    for (const auto& a : rows.value()) {
        std::cout << a.service << "  " << a.environment << "  " << to_string(a.output_kind)
                  << "  " << a.content_hash.substr(0, 12) << "  " << a.path << "\n";
    }
    auto tags = pipeline.store().list_tags();
    if (tags.is_err()) return fail(tags.error());
    for (const auto& t : tags.value()) {
        std::cout << "tag " << t.tag << "\n";
    }
    return 0;
}

static int cmd_cache(Pipeline& pipeline, const CliArgs& args) {
    std::string sub = args.positional.size() > 1 ? args.positional[1] : "stats";
    DependencyCache& cache = pipeline.dependency_cache();

    if (sub == "stats") {
        auto stats = cache.stats();
        if (stats.is_err()) return fail(stats.error());
        std::cout << "cache root " << cache.root().string() << "\n"
                  << "entries " << stats.value().entries << "\n"
                  << "bytes " << stats.value().total_bytes << "\n";
        return 0;
    }
    if (sub == "clean") {
        auto cleaned = cache.clean();
        if (cleaned.is_err()) return fail(cleaned.error());
        std::cout << "removed " << cache.root().string() << "/deps\n";
        return 0;
    }
    if (sub == "prune") {
        auto dirs = cache.prune();
        if (dirs.is_err()) return fail(dirs.error());
        auto rows = pipeline.store().prune();
        if (rows.is_err()) return fail(rows.error());
        std::cout << "removed " << dirs.value() << " stale install dir(s), "
                  << rows.value() << " stale record(s)\n";
        return 0;
    }
    std::cerr << "error: unknown cache command '" << sub << "'\n" << USAGE;
    return 2;
}

int main(int argc, char* argv[]) {
    if (argc < 2 || std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help") {
        std::cerr << USAGE;
        return argc < 2 ? 2 : 0;
    }

    auto parsed = parse_args(argc, argv);
    if (parsed.is_err()) return fail(parsed.error());
    CliArgs args = std::move(parsed).value();
    if (args.positional.empty()) {
        std::cerr << USAGE;
        return 2;
    }
    if (args.verbosity > 0) log::set_level(log::Debug);

    auto project = load_project(args);
    if (project.is_err()) return fail(project.error());
    const Project& proj = project.value();

    auto level = apply_log_level(proj.config.settings, args.verbosity);
    if (level.is_err()) return fail(level.error());

    const std::string& cmd = args.positional[0];
    if (cmd == "list") return cmd_list(proj.config);

    if (cmd != "build" && cmd != "dockerfile" && cmd != "artifacts" && cmd != "cache") {
        std::cerr << "error: unknown command '" << cmd << "'\n" << USAGE;
        return 2;
    }

    Pipeline pipeline(proj.config, proj.root_dir, args.options);
    auto opened = pipeline.open();
    if (opened.is_err()) return fail(opened.error());

    if (cmd == "build") return cmd_build(pipeline, args, false);
    if (cmd == "dockerfile") return cmd_build(pipeline, args, true);
    if (cmd == "artifacts") return cmd_artifacts(pipeline);
    return cmd_cache(pipeline, args);
}
