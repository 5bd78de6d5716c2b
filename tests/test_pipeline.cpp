#include <catch2/catch.hpp>
#include <kiln/pipeline.hpp>
#include "test_helpers.hpp"

#include <memory>
#include <set>
#include <thread>

using namespace kiln;
using kiln_test::FakeProject;
namespace fs = std::filesystem;

namespace {

std::unique_ptr<Pipeline> open_pipeline(const FakeProject& project,
                                        PipelineOptions options = {}) {
    auto p = project.load();
    REQUIRE(p.is_ok());
    auto pipeline = std::make_unique<Pipeline>(p.value().config, project.root(), options);
    REQUIRE(pipeline->open().is_ok());
    return pipeline;
}

// Every file name reachable inside a materialized image
std::set<std::string> image_files(const Image& img) {
    std::set<std::string> names;
    for (const auto& e : fs::recursive_directory_iterator(img.context_dir / "layers")) {
        if (e.is_regular_file()) names.insert(e.path().filename().string());
    }
    return names;
}

} // namespace

TEST_CASE("worker production scenario", "[pipeline]") {
    FakeProject project;
    auto pipeline = open_pipeline(project);

    auto r = pipeline->build("worker", "production");
    REQUIRE(r.is_ok());
    const Image& img = r.value();
    CHECK(img.entrypoint_string() == "python3 app2.py");
    CHECK_FALSE(img.exposed_port);
    CHECK(img.env.count("DEBUG") == 0);
    CHECK(img.env.at("APP_ENV") == "production");
    CHECK(img.tag == "worker:production-" + img.content_hash.substr(0, 12));
    CHECK(img.context_dir == project.root() / "out" / "images" / "worker" / "production");
}

TEST_CASE("adminportal production scenario serves only the static build", "[pipeline]") {
    FakeProject project;
    auto pipeline = open_pipeline(project);

    RunReport report = pipeline->build_with_report("adminportal", "production");
    REQUIRE(report.ok());
    CHECK(report.compiled);
    const Image& img = *report.image;
    CHECK(img.static_server);
    CHECK(img.base_runtime == "fake/nginx:1");
    CHECK(img.exposed_port == 3000);
    REQUIRE(img.layers.size() == 1);
    CHECK(img.layers[0].action == "static");

    std::set<std::string> files = image_files(img);
    CHECK(files == std::set<std::string>{"index.html", "env.txt"});
    CHECK(kiln_test::read_text(img.context_dir / "layers" / img.layers[0].dir_name(0) /
                               "env.txt") == "production");
}

TEST_CASE("adminportal dev scenario runs from staged source", "[pipeline]") {
    FakeProject project;
    auto pipeline = open_pipeline(project);

    RunReport report = pipeline->build_with_report("adminportal", "dev");
    REQUIRE(report.ok());
    CHECK_FALSE(report.compiled);
    const Image& img = *report.image;
    CHECK_FALSE(img.static_server);
    CHECK(img.entrypoint_string() == "npm start");
    CHECK(img.base_runtime == "fake/python:3");

    std::set<std::string> files = image_files(img);
    CHECK(files.count("App.js") == 1);
    CHECK(files.count("env.txt") == 0);
}

TEST_CASE("state sequence of a run", "[pipeline]") {
    FakeProject project;
    auto pipeline = open_pipeline(project);

    RunReport prod = pipeline->build_with_report("adminportal", "production");
    CHECK(prod.states == std::vector<PipelineState>{
        PipelineState::Pending, PipelineState::Staged, PipelineState::DependenciesResolved,
        PipelineState::Compiled, PipelineState::Assembled, PipelineState::Tagged});

    RunReport dev = pipeline->build_with_report("worker", "dev");
    CHECK(dev.states == std::vector<PipelineState>{
        PipelineState::Pending, PipelineState::Staged, PipelineState::DependenciesResolved,
        PipelineState::Assembled, PipelineState::Tagged});
    CHECK(dev.run_id.size() == 8);
    CHECK(std::string(to_string(PipelineState::DependenciesResolved)) == "DependenciesResolved");
}

TEST_CASE("two builds of unchanged inputs are identical", "[pipeline]") {
    FakeProject project;
    auto pipeline = open_pipeline(project);

    for (const char* svc : {"worker", "adminportal"}) {
        auto a = pipeline->build(svc, "production");
        auto b = pipeline->build(svc, "production");
        REQUIRE(a.is_ok());
        REQUIRE(b.is_ok());
        CHECK(a.value().content_hash == b.value().content_hash);
        CHECK(a.value().tag == b.value().tag);
    }
}

TEST_CASE("images of one service never contain the other's files", "[pipeline]") {
    FakeProject project;
    auto pipeline = open_pipeline(project);

    auto worker = pipeline->build("worker", "dev");
    auto portal = pipeline->build("adminportal", "dev");
    REQUIRE(worker.is_ok());
    REQUIRE(portal.is_ok());

    std::set<std::string> wf = image_files(worker.value());
    std::set<std::string> pf = image_files(portal.value());
    CHECK(wf.count("app2.py") == 1);
    CHECK(wf.count("queue.py") == 1);
    CHECK(wf.count("App.js") == 0);
    CHECK(wf.count("index.html") == 0);
    CHECK(pf.count("App.js") == 1);
    CHECK(pf.count("app2.py") == 0);
    CHECK(pf.count("queue.py") == 0);
    CHECK(wf.count("app2.cpython-311.pyc") == 0);
}

TEST_CASE("unchanged declarations never reinstall", "[pipeline]") {
    FakeProject project;
    auto pipeline = open_pipeline(project);

    RunReport first = pipeline->build_with_report("worker", "dev");
    REQUIRE(first.ok());
    CHECK_FALSE(first.dependency_cache_hit);
    CHECK(project.install_count() == 1);

    // Source edits outside the declaration keep the cache entry
    project.dir.write_file("app2/app2.py", "print('v2')\n");
    RunReport second = pipeline->build_with_report("worker", "dev");
    REQUIRE(second.ok());
    CHECK(second.dependency_cache_hit);
    CHECK(project.install_count() == 1);
    CHECK(second.image->content_hash != first.image->content_hash);

    project.dir.write_file("app2/requirements.txt", "flask==2.3.3\nrequests>=2.28\n");
    RunReport third = pipeline->build_with_report("worker", "dev");
    REQUIRE(third.ok());
    CHECK_FALSE(third.dependency_cache_hit);
    CHECK(project.install_count() == 2);
}

TEST_CASE("dev and production images differ", "[pipeline]") {
    FakeProject project;
    auto pipeline = open_pipeline(project);

    auto dev = pipeline->build("worker", "dev");
    auto prod = pipeline->build("worker", "production");
    REQUIRE(dev.is_ok());
    REQUIRE(prod.is_ok());
    CHECK(dev.value().env != prod.value().env);
    CHECK(dev.value().content_hash != prod.value().content_hash);
    CHECK(dev.value().context_dir != prod.value().context_dir);
}

TEST_CASE("identically defined profiles build identical images", "[pipeline]") {
    FakeProject project;
    project.extra_toml =
        "[environments.staging]\n"
        "install_mode = \"ci-clean\"\n"
        "build_enabled = true\n"
        "env = { APP_ENV = \"production\" }\n";
    auto pipeline = open_pipeline(project);

    auto prod = pipeline->build("worker", "production");
    auto staging = pipeline->build("worker", "staging");
    REQUIRE(prod.is_ok());
    REQUIRE(staging.is_ok());
    CHECK(staging.value().content_hash == prod.value().content_hash);
    CHECK(staging.value().tag != prod.value().tag);
}

TEST_CASE("run reports carry the profile fingerprint", "[pipeline]") {
    FakeProject project;
    project.extra_toml =
        "[environments.staging]\n"
        "install_mode = \"ci-clean\"\n"
        "build_enabled = true\n"
        "env = { APP_ENV = \"production\" }\n";
    auto loaded = project.load();
    REQUIRE(loaded.is_ok());
    const Config& cfg = loaded.value().config;
    auto pipeline = open_pipeline(project);

    RunReport prod = pipeline->build_with_report("worker", "production");
    RunReport staging = pipeline->build_with_report("worker", "staging");
    REQUIRE(prod.ok());
    REQUIRE(staging.ok());
    CHECK(prod.profile_fingerprint == cfg.environments.at("production").fingerprint());
    CHECK(staging.profile_fingerprint == cfg.environments.at("staging").fingerprint());
    CHECK(prod.profile_fingerprint != staging.profile_fingerprint);
}

TEST_CASE("unavailable package fails the run without an image or cache entry", "[pipeline]") {
    FakeProject project;
    project.dir.write_file("app2/requirements.txt", "unavailable==9.9\n");
    auto pipeline = open_pipeline(project);

    RunReport report = pipeline->build_with_report("worker", "dev");
    CHECK(report.state == PipelineState::Failed);
    CHECK(report.states.back() == PipelineState::Failed);
    CHECK_FALSE(report.image);
    REQUIRE(report.failure);
    CHECK(report.failure->code == KilnError::DependencyInstall);
    CHECK(report.failure->stage == "dependencies");
    CHECK(exit_code_for(*report.failure) == 1);
    CHECK(pipeline->dependency_cache().stats().value().entries == 0);
    CHECK_FALSE(fs::exists(project.root() / "out" / "images" / "worker"));
}

TEST_CASE("install timeout fails the run with exit code 3", "[pipeline]") {
    FakeProject project;
    project.install_prefix = "sleep 5; ";
    PipelineOptions options;
    options.install_timeout = 1;
    auto pipeline = open_pipeline(project, options);

    auto r = pipeline->build("worker", "dev");
    REQUIRE(r.is_err());
    CHECK(r.error().code == KilnError::Timeout);
    CHECK(exit_code_for(r.error()) == 3);
    CHECK(pipeline->dependency_cache().stats().value().entries == 0);
}

TEST_CASE("lock mismatch fails a production run", "[pipeline]") {
    FakeProject project;
    project.dir.write_file("app2/requirements.lock", "flask==2.3.2\n");
    auto pipeline = open_pipeline(project);

    auto r = pipeline->build("worker", "production");
    REQUIRE(r.is_err());
    CHECK(r.error().code == KilnError::LockMismatch);
    CHECK(r.error().format().find("error[LockMismatchError]") == 0);
}

TEST_CASE("compile failure keeps the previous artifact", "[pipeline]") {
    FakeProject project;
    auto good = open_pipeline(project);
    auto first = good->build("adminportal", "production");
    REQUIRE(first.is_ok());

    project.build_script = "echo broken >&2; exit 1";
    auto broken = open_pipeline(project);
    RunReport report = broken->build_with_report("adminportal", "production");
    REQUIRE(report.failure);
    CHECK(report.failure->code == KilnError::Compile);
    CHECK(report.failure->stage == "compile");
    CHECK_FALSE(report.image);
    CHECK(report.states == std::vector<PipelineState>{
        PipelineState::Pending, PipelineState::Staged, PipelineState::DependenciesResolved,
        PipelineState::Failed});

    // The published image is still the last good one
    CHECK(kiln_test::read_text(first.value().context_dir / "image.json").find(
              first.value().content_hash) != std::string::npos);
}

TEST_CASE("unknown names are invalid arguments", "[pipeline]") {
    FakeProject project;
    auto pipeline = open_pipeline(project);

    auto svc = pipeline->build("billing", "dev");
    REQUIRE(svc.is_err());
    CHECK(svc.error().code == KilnError::InvalidArg);
    CHECK(exit_code_for(svc.error()) == 2);
    CHECK(svc.error().hint.find("adminportal") != std::string::npos);

    auto env = pipeline->build("worker", "qa");
    REQUIRE(env.is_err());
    CHECK(env.error().code == KilnError::InvalidArg);
}

TEST_CASE("missing source fails staging", "[pipeline]") {
    FakeProject project;
    fs::remove_all(project.root() / "app2");
    auto pipeline = open_pipeline(project);
    RunReport report = pipeline->build_with_report("worker", "dev");
    REQUIRE(report.failure);
    CHECK(report.failure->code == KilnError::Staging);
    CHECK(report.states == std::vector<PipelineState>{PipelineState::Pending,
                                                      PipelineState::Failed});
}

TEST_CASE("run directories are removed unless kept", "[pipeline]") {
    FakeProject project;
    {
        auto pipeline = open_pipeline(project);
        REQUIRE(pipeline->build("worker", "dev").is_ok());
        CHECK(fs::is_empty(pipeline->build_root() / "runs"));
    }
    PipelineOptions keep;
    keep.keep_workdirs = true;
    auto pipeline = open_pipeline(project, keep);
    RunReport report = pipeline->build_with_report("worker", "dev");
    REQUIRE(report.ok());
    CHECK(fs::exists(pipeline->build_root() / "runs" /
                     ("worker-dev-" + report.run_id) / "context" / "app2.py"));
}

TEST_CASE("build before open is an error", "[pipeline]") {
    FakeProject project;
    auto p = project.load();
    REQUIRE(p.is_ok());
    Pipeline pipeline(p.value().config, project.root());
    CHECK_FALSE(pipeline.is_open());
    auto r = pipeline.build("worker", "dev");
    REQUIRE(r.is_err());
    CHECK(r.error().message == "pipeline is not open");
}

TEST_CASE("concurrent builds share one install and stay consistent", "[pipeline]") {
    FakeProject project;
    project.install_prefix = "sleep 1; ";
    auto pipeline = open_pipeline(project);

    struct Job { const char* svc; const char* env; };
    const std::vector<Job> jobs{{"worker", "dev"}, {"worker", "dev"}, {"worker", "production"},
                                {"adminportal", "production"}, {"adminportal", "dev"},
                                {"worker", "dev"}};
    std::vector<RunReport> reports(jobs.size());
    std::vector<std::thread> threads;
    for (size_t i = 0; i < jobs.size(); ++i) {
        threads.emplace_back([&, i] {
            reports[i] = pipeline->build_with_report(jobs[i].svc, jobs[i].env);
        });
    }
    for (auto& t : threads) t.join();

    for (const auto& r : reports) {
        INFO(r.service << "/" << r.environment << ": "
             << (r.failure ? r.failure->format() : std::string("ok")));
        CHECK(r.ok());
    }
    // worker dev, worker production, adminportal dev, adminportal production
    CHECK(project.install_count() == 4);
    CHECK(reports[0].image->content_hash == reports[1].image->content_hash);
    CHECK(reports[0].image->content_hash == reports[5].image->content_hash);
    CHECK(reports[0].image->context_dir != reports[2].image->context_dir);
}

TEST_CASE("tags and artifacts are recorded in the store", "[pipeline]") {
    FakeProject project;
    auto pipeline = open_pipeline(project);
    auto img = pipeline->build("adminportal", "production");
    REQUIRE(img.is_ok());

    auto tags = pipeline->store().list_tags();
    REQUIRE(tags.is_ok());
    REQUIRE(tags.value().size() == 1);
    CHECK(tags.value()[0].tag == img.value().tag);
    CHECK(Pipeline::make_tag(img.value()) == img.value().tag);

    auto artifacts = pipeline->store().list_artifacts();
    REQUIRE(artifacts.is_ok());
    CHECK(artifacts.value().size() == 2);
    CHECK(fs::exists(pipeline->build_root() / "kiln.db"));
}

TEST_CASE("dependency trees with directory symlinks still build", "[pipeline]") {
    FakeProject project;
    project.install_prefix = "mkdir -p \"$1/lib/python3.11\"; ln -s lib \"$1/lib64\"; ";
    auto pipeline = open_pipeline(project);

    auto r = pipeline->build("worker", "production");
    REQUIRE(r.is_ok());
    const Image& img = r.value();
    REQUIRE(img.layers[0].action == "dependencies");
    fs::path layer = img.context_dir / "layers" / img.layers[0].dir_name(0);
    CHECK(fs::is_symlink(layer / "lib64"));
    CHECK(fs::read_symlink(layer / "lib64") == fs::path("lib"));
}

namespace {

const char* PORTAL_PACKAGE_JSON = R"({
  "name": "adminportal",
  "dependencies": {"react": "^18.2.0"},
  "devDependencies": {"react-scripts": "5.0.1"}
})";

} // namespace

TEST_CASE("package-json portal passes the lock check in production", "[pipeline]") {
    FakeProject project;
    project.portal_ecosystem = "fakenode";
    project.dir.write_file("adminportal/package.json", PORTAL_PACKAGE_JSON);
    project.dir.write_file("adminportal/package-lock.json", R"({
  "name": "adminportal",
  "lockfileVersion": 3,
  "packages": {
    "": {"name": "adminportal"},
    "node_modules/react": {"version": "18.3.1"},
    "node_modules/react-scripts": {"version": "5.0.1", "dev": true},
    "node_modules/react-scripts/node_modules/semver": {"version": "7.5.4"}
  }
})");
    auto pipeline = open_pipeline(project);

    RunReport report = pipeline->build_with_report("adminportal", "production");
    REQUIRE(report.ok());
    CHECK(report.compiled);
    CHECK(report.image->static_server);
    CHECK(project.install_count() == 1);
    CHECK(kiln_test::read_text(project.install_log()).find("package-lock.json") !=
          std::string::npos);
    CHECK(pipeline->dependency_cache().stats().value().entries == 1);
}

TEST_CASE("package-json portal with a stale lock fails the production run", "[pipeline]") {
    FakeProject project;
    project.portal_ecosystem = "fakenode";
    project.dir.write_file("adminportal/package.json", PORTAL_PACKAGE_JSON);
    project.dir.write_file("adminportal/package-lock.json", R"({
  "lockfileVersion": 3,
  "packages": {
    "": {"name": "adminportal"},
    "node_modules/react": {"version": "17.0.2"}
  }
})");
    auto pipeline = open_pipeline(project);

    RunReport report = pipeline->build_with_report("adminportal", "production");
    CHECK(report.state == PipelineState::Failed);
    REQUIRE(report.failure);
    CHECK(report.failure->code == KilnError::LockMismatch);
    CHECK(report.failure->stage == "dependencies");
    CHECK(exit_code_for(*report.failure) == 1);
    CHECK(report.failure->cause.find("'react' is locked at 17.0.2") != std::string::npos);
    CHECK(report.failure->cause.find("'react-scripts' is declared in package.json") !=
          std::string::npos);
    CHECK(project.install_count() == 0);
}
