#include <catch2/catch.hpp>
#include <kiln/dep_manifest.hpp>
#include <kiln/config.hpp>
#include "test_helpers.hpp"

using namespace kiln;
using kiln_test::TempDir;

namespace {

const Ecosystem& python() {
    static const Config cfg = Config::builtin();
    return cfg.ecosystems.at("python");
}

const Ecosystem& node() {
    static const Config cfg = Config::builtin();
    return cfg.ecosystems.at("node");
}

DependencyManifest parse_ok(const Ecosystem& eco, const std::string& manifest,
                            const std::optional<std::string>& lock) {
    auto r = DependencyManifest::parse(eco, manifest, lock);
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

} // namespace

TEST_CASE("normalize_python_name folds case and separators", "[dep_manifest]") {
    CHECK(normalize_python_name("Flask") == "flask");
    CHECK(normalize_python_name("zope.interface") == "zope-interface");
    CHECK(normalize_python_name("typing__extensions") == "typing-extensions");
    CHECK(normalize_python_name("Jinja2") == "jinja2");
}

TEST_CASE("requirements.txt parsing", "[dep_manifest]") {
    auto m = parse_ok(python(),
        "# web stack\n"
        "Flask==2.3.2\n"
        "requests[socks] >= 2.28, <3  ; python_version > '3.8'\n"
        "--index-url https://pypi.example/simple\n"
        "\n"
        "celery  # queue\n",
        std::nullopt);

    REQUIRE(m.declared_packages.size() == 3);
    CHECK(m.declared_packages[0] == DeclaredPackage{"celery", ""});
    CHECK(m.declared_packages[1] == DeclaredPackage{"flask", "==2.3.2"});
    CHECK(m.declared_packages[2] == DeclaredPackage{"requests", ">= 2.28, <3"});
    CHECK(m.options == std::vector<std::string>{"--index-url https://pypi.example/simple"});
    CHECK_FALSE(m.has_lock);
    CHECK(m.lock_fingerprint.size() == 64);
}

TEST_CASE("requirements.txt rejects malformed lines", "[dep_manifest]") {
    auto r = DependencyManifest::parse(python(), "flask==2.3\n[extras]\n", std::nullopt);
    REQUIRE(r.is_err());
    CHECK(r.error().code == KilnError::Parse);
    CHECK(r.error().line == 2);
}

TEST_CASE("requirements lock must pin exact versions", "[dep_manifest]") {
    auto m = parse_ok(python(), "flask\n", std::string("Flask==2.3.2\nwerkzeug===2.3.7\n"));
    CHECK(m.has_lock);
    CHECK(m.locked.at("flask") == "2.3.2");
    CHECK(m.locked.at("werkzeug") == "2.3.7");

    auto r = DependencyManifest::parse(python(), "flask\n", std::string("flask>=2\n"));
    REQUIRE(r.is_err());
    CHECK(r.error().message.find("not pinned") != std::string::npos);
}

TEST_CASE("package.json merges dependencies and devDependencies", "[dep_manifest]") {
    auto m = parse_ok(node(),
        R"({"name":"adminportal","dependencies":{"react":"^18.2.0"},
            "devDependencies":{"react-scripts":"5.0.1"}})",
        std::nullopt);
    REQUIRE(m.declared_packages.size() == 2);
    CHECK(m.declared_packages[0] == DeclaredPackage{"react", "^18.2.0"});
    CHECK(m.declared_packages[1] == DeclaredPackage{"react-scripts", "5.0.1"});
}

TEST_CASE("package.json errors", "[dep_manifest]") {
    CHECK(DependencyManifest::parse(node(), "{not json", std::nullopt).error().code ==
          KilnError::Parse);
    CHECK(DependencyManifest::parse(node(), "[1,2]", std::nullopt).is_err());
    CHECK(DependencyManifest::parse(node(), R"({"dependencies":{"react":18}})",
                                    std::nullopt).is_err());
}

TEST_CASE("package-lock v1 and v2 layouts", "[dep_manifest]") {
    const std::string manifest = R"({"dependencies":{"react":"^18.2.0"}})";

    auto v1 = parse_ok(node(), manifest,
        std::string(R"({"lockfileVersion":1,"dependencies":{"react":{"version":"18.2.0"}}})"));
    CHECK(v1.locked.at("react") == "18.2.0");

    auto v2 = parse_ok(node(), manifest, std::string(R"({
        "lockfileVersion": 2,
        "packages": {
            "": {"name": "adminportal"},
            "node_modules/react": {"version": "18.2.0"},
            "node_modules/react/node_modules/loose-envify": {"version": "1.4.0"}
        }})"));
    CHECK(v2.locked.size() == 1);
    CHECK(v2.locked.at("react") == "18.2.0");

    auto bad = DependencyManifest::parse(node(), manifest, std::string(R"({"lockfileVersion":3})"));
    REQUIRE(bad.is_err());
    CHECK(bad.error().hint == "regenerate it with npm install");
}

TEST_CASE("lock fingerprint ignores formatting but not content", "[dep_manifest]") {
    auto a = parse_ok(python(), "flask==2.3.2\nrequests\n",
                      std::string("flask==2.3.2\nrequests==2.31.0\n"));
    auto b = parse_ok(python(), "# reordered\nrequests\n\nFlask==2.3.2\n",
                      std::string("requests==2.31.0\n# pins\nflask==2.3.2\n"));
    CHECK(a.lock_fingerprint == b.lock_fingerprint);

    auto bumped = parse_ok(python(), "flask==2.3.2\nrequests\n",
                           std::string("flask==2.3.2\nrequests==2.32.0\n"));
    CHECK(bumped.lock_fingerprint != a.lock_fingerprint);

    auto unlocked = parse_ok(python(), "flask==2.3.2\nrequests\n", std::nullopt);
    CHECK(unlocked.lock_fingerprint != a.lock_fingerprint);

    auto j1 = parse_ok(node(), R"({"dependencies":{"react":"^18.2.0"}})",
        std::string(R"({"lockfileVersion":1,"dependencies":{"react":{"version":"18.2.0"}}})"));
    auto j2 = parse_ok(node(), "{\n  \"dependencies\": { \"react\": \"^18.2.0\" }\n}",
        std::string("{\"dependencies\":{\"react\":{\"version\":\"18.2.0\"}},\n\"lockfileVersion\":1}"));
    CHECK(j1.lock_fingerprint == j2.lock_fingerprint);
}

TEST_CASE("requirement_satisfied", "[dep_manifest]") {
    CHECK(requirement_satisfied("", "1.0.0").value());
    CHECK(requirement_satisfied("*", "1.0.0").value());
    CHECK(requirement_satisfied("==2.3.2", "2.3.2").value());
    CHECK_FALSE(requirement_satisfied("==2.3.2", "2.3.3").value());
    CHECK(requirement_satisfied(">=2.28,<3", "2.31.0").value());
    CHECK_FALSE(requirement_satisfied(">=2.28,<3", "3.0.0").value());
    CHECK(requirement_satisfied("^18.2.0", "18.3.1").value());
    CHECK_FALSE(requirement_satisfied("^18.2.0", "19.0.0").value());
    CHECK(requirement_satisfied("^16.0.0 || ^18.0.0", "18.2.0").value());
    CHECK(requirement_satisfied("1.2.x", "1.2.9").value());
    CHECK_FALSE(requirement_satisfied("1.2.x", "1.3.0").value());
    CHECK(requirement_satisfied(">=1.0.0 <2.0.0", "1.5.0").value());
    CHECK(requirement_satisfied("1.0.0 - 2.0.0", "2.0.0").value());
    CHECK_FALSE(requirement_satisfied(">=1.0,!=1.5.0", "1.5.0").value());
    CHECK(requirement_satisfied("==2.0.0.post1", "2.0.0.post1").value());
    CHECK(requirement_satisfied("git+https://example.com/lib.git", "0.1.0").value());
    CHECK(requirement_satisfied("file:../shared", "1.0.0").value());
}

TEST_CASE("requirement_satisfied follows pip's compatible release and arbitrary equality", "[dep_manifest]") {
    CHECK(requirement_satisfied("~=2.28", "2.31.0").value());
    CHECK_FALSE(requirement_satisfied("~=2.28", "3.0.0").value());
    CHECK(requirement_satisfied("~=1.4.2", "1.4.9").value());
    CHECK_FALSE(requirement_satisfied("~=1.4.2", "1.5.0").value());
    CHECK(requirement_satisfied("~=2.28, !=2.30.0", "2.31.0").value());
    CHECK(requirement_satisfied("~=2", "2.0.0").is_err());

    CHECK(requirement_satisfied("===1.0", "1.0").value());
    CHECK_FALSE(requirement_satisfied("===1.0", "1.0.0").value());
}

TEST_CASE("check_lock accepts a consistent lock", "[dep_manifest]") {
    auto m = parse_ok(python(), "flask==2.3.2\nrequests>=2.28\n",
                      std::string("flask==2.3.2\nrequests==2.31.0\nidna==3.4\n"));
    CHECK(m.check_lock().is_ok());
}

TEST_CASE("check_lock accepts a compatible release locked at a newer minor", "[dep_manifest]") {
    auto m = parse_ok(python(), "requests~=2.28\nurllib3===2.0.7\n",
                      std::string("requests==2.31.0\nurllib3==2.0.7\n"));
    CHECK(m.check_lock().is_ok());
}

TEST_CASE("check_lock reports a missing lock file", "[dep_manifest]") {
    auto m = parse_ok(python(), "flask==2.3.2\n", std::nullopt);
    auto st = m.check_lock();
    REQUIRE(st.is_err());
    CHECK(st.error().code == KilnError::LockMismatch);
    CHECK(st.error().message.find("requirements.lock is missing") != std::string::npos);
}

TEST_CASE("check_lock reports unlocked and out-of-range packages", "[dep_manifest]") {
    auto m = parse_ok(python(), "flask==2.3.2\nrequests>=2.28\ncelery\n",
                      std::string("flask==2.2.0\nrequests==2.31.0\n"));
    auto st = m.check_lock();
    REQUIRE(st.is_err());
    CHECK(st.error().code == KilnError::LockMismatch);
    CHECK(st.error().cause.find("'celery' is declared") != std::string::npos);
    CHECK(st.error().cause.find("'flask' is locked at 2.2.0") != std::string::npos);
}

TEST_CASE("from_source reads manifest and optional lock", "[dep_manifest]") {
    TempDir dir;
    auto missing = DependencyManifest::from_source(python(), dir.path);
    REQUIRE(missing.is_err());
    CHECK(missing.error().code == KilnError::NotFound);

    dir.write_file("requirements.txt", "flask==2.3.2\n");
    auto no_lock = DependencyManifest::from_source(python(), dir.path);
    REQUIRE(no_lock.is_ok());
    CHECK_FALSE(no_lock.value().has_lock);

    dir.write_file("requirements.lock", "flask==2.3.2\n");
    auto locked = DependencyManifest::from_source(python(), dir.path);
    REQUIRE(locked.is_ok());
    CHECK(locked.value().has_lock);

    dir.write_file("requirements.txt", "!!!\n");
    auto bad = DependencyManifest::from_source(python(), dir.path);
    REQUIRE(bad.is_err());
    CHECK(bad.error().file.find("requirements.txt") != std::string::npos);
}
