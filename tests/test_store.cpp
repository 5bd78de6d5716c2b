#include <catch2/catch.hpp>
#include <kiln/store.hpp>
#include "test_helpers.hpp"

using namespace kiln;
using kiln_test::TempDir;
namespace fs = std::filesystem;

namespace {

struct OpenStore {
    TempDir dir;
    ArtifactStore store;

    OpenStore() {
        auto st = store.open((dir.path / "kiln.db").string());
        REQUIRE(st.is_ok());
    }
};

DepEntryRecord dep(const std::string& fingerprint, InstallMode mode, const std::string& path) {
    DepEntryRecord r;
    r.ecosystem = "python";
    r.fingerprint = fingerprint;
    r.install_mode = mode;
    r.path = path;
    r.content_hash = std::string(64, 'a');
    r.created_at = ArtifactStore::now();
    return r;
}

} // namespace

TEST_CASE("store refuses calls before open", "[store]") {
    ArtifactStore store;
    CHECK_FALSE(store.is_open());
    CHECK(store.list_tags().is_err());
    CHECK(store.record_dep(dep("f", InstallMode::Full, "/x")).is_err());
}

TEST_CASE("open creates the database and reopens it", "[store]") {
    TempDir dir;
    std::string db = (dir.path / "kiln.db").string();
    {
        ArtifactStore store;
        REQUIRE(store.open(db).is_ok());
        CHECK(store.is_open());
        REQUIRE(store.record_dep(dep("f1", InstallMode::Full, "/deps/f1")).is_ok());
        store.close();
        CHECK_FALSE(store.is_open());
    }
    ArtifactStore again;
    REQUIRE(again.open(db).is_ok());
    CHECK(again.list_deps().value().size() == 1);
}

TEST_CASE("open fails when the parent is not a directory", "[store]") {
    TempDir dir;
    dir.write_file("blocker", "not a directory");
    ArtifactStore store;
    auto st = store.open((dir.path / "blocker" / "kiln.db").string());
    REQUIRE(st.is_err());
    CHECK(st.error().code == KilnError::IO);
}

TEST_CASE("dependency entries are keyed by fingerprint and mode", "[store]") {
    OpenStore s;
    REQUIRE(s.store.record_dep(dep("f1", InstallMode::Full, "/deps/f1-full")).is_ok());
    REQUIRE(s.store.record_dep(dep("f1", InstallMode::CiClean, "/deps/f1-ci")).is_ok());

    auto full = s.store.lookup_dep("python", "f1", InstallMode::Full);
    REQUIRE(full.is_ok());
    CHECK(full.value().path == "/deps/f1-full");
    CHECK(s.store.lookup_dep("python", "f1", InstallMode::CiClean).value().path == "/deps/f1-ci");

    auto missing = s.store.lookup_dep("node", "f1", InstallMode::Full);
    REQUIRE(missing.is_err());
    CHECK(missing.error().code == KilnError::NotFound);

    REQUIRE(s.store.remove_dep("python", "f1", InstallMode::Full).is_ok());
    CHECK(s.store.lookup_dep("python", "f1", InstallMode::Full).is_err());
    CHECK(s.store.list_deps().value().size() == 1);
}

TEST_CASE("a newer artifact supersedes the previous one", "[store]") {
    OpenStore s;
    ArtifactRecord a;
    a.service = "adminportal";
    a.environment = "production";
    a.output_kind = OutputKind::StaticDir;
    a.produced_at = 100;
    a.content_hash = "h1";
    a.path = "/out/artifacts/1";
    REQUIRE(s.store.record_artifact(a).is_ok());

    a.produced_at = 200;
    a.content_hash = "h2";
    a.path = "/out/artifacts/2";
    REQUIRE(s.store.record_artifact(a).is_ok());

    ArtifactRecord image = a;
    image.output_kind = OutputKind::RunnableImage;
    image.content_hash = "img";
    REQUIRE(s.store.record_artifact(image).is_ok());

    auto latest = s.store.latest_artifact("adminportal", "production", OutputKind::StaticDir);
    REQUIRE(latest.is_ok());
    CHECK(latest.value().content_hash == "h2");
    CHECK(latest.value().produced_at == 200);

    CHECK(s.store.list_artifacts().value().size() == 2);
    CHECK(s.store.latest_artifact("adminportal", "dev", OutputKind::StaticDir).error().code ==
          KilnError::NotFound);
}

TEST_CASE("image tags are listed in creation order", "[store]") {
    OpenStore s;
    REQUIRE(s.store.record_tag({"worker:dev-bbbbbbbbbbbb", "worker", "dev", "b", 20}).is_ok());
    REQUIRE(s.store.record_tag({"worker:dev-aaaaaaaaaaaa", "worker", "dev", "a", 10}).is_ok());

    auto tags = s.store.list_tags();
    REQUIRE(tags.is_ok());
    REQUIRE(tags.value().size() == 2);
    CHECK(tags.value()[0].tag == "worker:dev-aaaaaaaaaaaa");
    CHECK(tags.value()[1].content_hash == "b");
}

TEST_CASE("stats, prune and clear", "[store]") {
    OpenStore s;
    fs::path live = s.dir.path / "live";
    fs::create_directories(live);
    REQUIRE(s.store.record_dep(dep("live", InstallMode::Full, live.string())).is_ok());
    REQUIRE(s.store.record_dep(dep("gone", InstallMode::Full, (s.dir.path / "gone").string())).is_ok());
    REQUIRE(s.store.record_tag({"worker:dev-1", "worker", "dev", "h", 1}).is_ok());

    auto stats = s.store.stats();
    REQUIRE(stats.is_ok());
    CHECK(stats.value().dep_entry_count == 2);
    CHECK(stats.value().image_tag_count == 1);
    CHECK(stats.value().total_bytes > 0);

    auto pruned = s.store.prune();
    REQUIRE(pruned.is_ok());
    CHECK(pruned.value() == 1);
    CHECK(s.store.list_deps().value().size() == 1);

    REQUIRE(s.store.clear().is_ok());
    CHECK(s.store.stats().value().dep_entry_count == 0);
    CHECK(s.store.stats().value().image_tag_count == 0);
}
