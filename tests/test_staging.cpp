#include <catch2/catch.hpp>
#include <kiln/staging.hpp>
#include <kiln/config.hpp>
#include <kiln/fs_tree.hpp>
#include "test_helpers.hpp"

using namespace kiln;
using kiln_test::TempDir;
namespace fs = std::filesystem;

namespace {

struct StagingFixture {
    TempDir project;
    TempDir runs;
    Config cfg = Config::builtin();

    StagingFixture() {
        project.write_file("app2/app2.py", "print('hi')\n");
        project.write_file("app2/requirements.txt", "flask==2.3.2\n");
        project.write_file("app2/__pycache__/app2.cpython-311.pyc", "x");
        project.write_file("app2/.venv/bin/python", "x");
        project.write_file("adminportal/src/App.js", "app");
        project.write_file("adminportal/node_modules/react/index.js", "react");
        project.write_file("adminportal/package.json", "{}");
    }

    Result<StagedSource> stage(const ServiceDescriptor& svc, const std::string& run = "run1") {
        return SourceStager::stage(project.path, svc, cfg.ecosystems.at(svc.ecosystem),
                                   runs.path / run);
    }
};

} // namespace

TEST_CASE("stage copies exactly the service's own files", "[staging]") {
    StagingFixture f;
    auto r = f.stage(f.cfg.services.at("worker"));
    REQUIRE(r.is_ok());
    const StagedSource& s = r.value();
    CHECK(s.context_dir == f.runs.path / "run1" / "context");
    CHECK(s.files == std::vector<std::string>{"app2.py", "requirements.txt"});
    CHECK(fs::exists(s.context_dir / "app2.py"));
    CHECK_FALSE(fs::exists(s.context_dir / "src"));
    CHECK_FALSE(fs::exists(s.context_dir / "adminportal"));
}

TEST_CASE("stage applies ecosystem and service excludes", "[staging]") {
    StagingFixture f;
    ServiceDescriptor portal = f.cfg.services.at("adminportal");
    portal.exclude = {"*.json"};
    auto r = f.stage(portal);
    REQUIRE(r.is_ok());
    CHECK(r.value().files == std::vector<std::string>{"src/App.js"});
}

TEST_CASE("staged context is read-only and hashed", "[staging]") {
    StagingFixture f;
    auto r = f.stage(f.cfg.services.at("worker"));
    REQUIRE(r.is_ok());
    auto perms = fs::status(r.value().context_dir / "app2.py").permissions();
    CHECK((perms & fs::perms::owner_write) == fs::perms::none);
    CHECK(r.value().content_hash == tree_checksum(r.value().context_dir).value());
}

TEST_CASE("identical sources stage to the same hash", "[staging]") {
    StagingFixture f;
    auto a = f.stage(f.cfg.services.at("worker"), "a");
    auto b = f.stage(f.cfg.services.at("worker"), "b");
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    CHECK(a.value().content_hash == b.value().content_hash);

    f.project.write_file("app2/app2.py", "print('changed')\n");
    auto c = f.stage(f.cfg.services.at("worker"), "c");
    CHECK(c.value().content_hash != a.value().content_hash);
}

TEST_CASE("missing source path is a StagingError", "[staging]") {
    StagingFixture f;
    ServiceDescriptor svc = f.cfg.services.at("worker");
    svc.source_path = "billing";
    auto r = f.stage(svc);
    REQUIRE(r.is_err());
    CHECK(r.error().code == KilnError::Staging);
    CHECK(r.error().stage == "staging");
    CHECK(r.error().hint == "check services.worker.source");
}

TEST_CASE("empty source tree is a StagingError", "[staging]") {
    StagingFixture f;
    fs::create_directories(f.project.path / "empty");
    f.project.write_file("cached/__pycache__/x.pyc", "x");

    ServiceDescriptor svc = f.cfg.services.at("worker");
    svc.source_path = "empty";
    auto r = f.stage(svc);
    REQUIRE(r.is_err());
    CHECK(r.error().code == KilnError::Staging);

    svc.source_path = "cached";
    auto excluded = f.stage(svc, "run2");
    REQUIRE(excluded.is_err());
    CHECK(excluded.error().hint == "every file matched an exclude pattern");
}

TEST_CASE("source file instead of directory is a StagingError", "[staging]") {
    StagingFixture f;
    ServiceDescriptor svc = f.cfg.services.at("worker");
    svc.source_path = "app2/app2.py";
    auto r = f.stage(svc);
    REQUIRE(r.is_err());
    CHECK(r.error().message.find("not a directory") != std::string::npos);
}

TEST_CASE("source path escaping the project is a StagingError", "[staging]") {
    StagingFixture f;
    ServiceDescriptor svc = f.cfg.services.at("worker");
    svc.source_path = "../";
    auto r = f.stage(svc);
    REQUIRE(r.is_err());
    CHECK(r.error().code == KilnError::Staging);
}

TEST_CASE("symlink leaving the source tree fails staging", "[staging]") {
    StagingFixture f;
    TempDir outside;
    outside.write_file("secret.env", "TOKEN=1");
    fs::create_symlink(outside.path / "secret.env", f.project.path / "app2" / "secret.env");

    auto r = f.stage(f.cfg.services.at("worker"));
    REQUIRE(r.is_err());
    CHECK(r.error().code == KilnError::Staging);
    CHECK(r.error().cause.find("symlink") != std::string::npos);
}
