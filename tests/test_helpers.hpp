#pragma once

#include <kiln/project.hpp>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace kiln_test {

namespace fs = std::filesystem;

// RAII temp directory
struct TempDir {
    fs::path path;

    TempDir() {
        static std::atomic<int> counter{0};
        const char* src = std::getenv("KILN_SOURCE_DIR");
        fs::path base = src ? fs::path(src) / "build" : fs::temp_directory_path();
        path = base / ("kiln_test_" + std::to_string(getpid()) + "_" +
                       std::to_string(counter++) + "_" +
                       std::to_string(std::chrono::steady_clock::now()
                                          .time_since_epoch().count() % 1000000));
        fs::create_directories(path);
    }

    ~TempDir() {
        // Staged trees are read-only; give write access back before removal
        std::error_code ec;
        for (auto it = fs::recursive_directory_iterator(path, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code pec;
            if (!it->is_symlink(pec)) {
                fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, pec);
            }
        }
        fs::remove_all(path, ec);
    }

    // Write a file relative to this dir
    void write_file(const std::string& rel, const std::string& content) const {
        fs::path full = path / rel;
        fs::create_directories(full.parent_path());
        std::ofstream f(full, std::ios::trunc);
        f << content;
    }

    std::string read_file(const std::string& rel) const {
        std::ifstream f(path / rel);
        std::ostringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }
};

inline std::string read_text(const fs::path& p) {
    std::ifstream f(p);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

// A project with the worker and adminportal layout whose ecosystem
// installs and builds with sh scripts. Every install appends one line to
// installs.log, so tests can count installer runs.
struct FakeProject {
    TempDir dir;
    std::string install_prefix;   // shell run before every install, e.g. "sleep 5; "
    std::string build_script =
        "mkdir -p build && cp index.html build/index.html && printf %s \"$APP_ENV\" > build/env.txt";
    std::string extra_toml;
    // "fakenode" switches the portal to package.json + package-lock.json
    std::string portal_ecosystem = "fakepy";

    FakeProject() {
        dir.write_file("app2/app2.py", "print('worker running')\n");
        dir.write_file("app2/jobs/queue.py", "JOBS = []\n");
        dir.write_file("app2/requirements.txt", "flask==2.3.2\nrequests>=2.28\n");
        dir.write_file("app2/requirements.lock", "flask==2.3.2\nrequests==2.31.0\n");
        dir.write_file("app2/__pycache__/app2.cpython-311.pyc", "bytecode");

        dir.write_file("adminportal/index.html", "<html>admin</html>\n");
        dir.write_file("adminportal/src/App.js", "export default function App() {}\n");
        dir.write_file("adminportal/requirements.txt", "react==18.2.0\n");
        dir.write_file("adminportal/requirements.lock", "react==18.2.0\n");
    }

    fs::path root() const { return dir.path; }
    fs::path install_log() const { return dir.path / "installs.log"; }

    int install_count() const {
        std::ifstream f(install_log());
        int n = 0;
        std::string line;
        while (std::getline(f, line)) ++n;
        return n;
    }

    std::string manifest() const {
        std::string install =
            install_prefix +
            "if grep -q unavailable \"$2\"; then "
            "echo \"ERROR: No matching distribution found for unavailable\" >&2; exit 1; fi; "
            "mkdir -p \"$1\" && cp \"$2\" \"$1/installed.txt\" && echo \"$2\" >> \"$3\"";
        std::string log = install_log().string();

        std::string toml;
        toml += "[settings]\n";
        toml += "cache_root = \"cache\"\n";
        toml += "build_root = \"out\"\n";
        toml += "web_server_base = \"fake/nginx:1\"\n\n";
        toml += "[ecosystems.fakepy]\n";
        toml += "format = \"requirements\"\n";
        toml += "manifest = \"requirements.txt\"\n";
        toml += "lock = \"requirements.lock\"\n";
        toml += "deps_dir = \"site-packages\"\n";
        toml += "deps_target = \"/opt/site-packages\"\n";
        toml += "runtime_base = \"fake/python:3\"\n";
        toml += "install_full = [\"sh\", \"-c\", '" + install + "', \"install\", "
                "\"{{ deps_dir }}\", \"{{ manifest }}\", '" + log + "']\n";
        toml += "install_clean = [\"sh\", \"-c\", '" + install + "', \"install\", "
                "\"{{ deps_dir }}\", \"{{ lock }}\", '" + log + "']\n";
        toml += "default_exclude = [\"__pycache__\", \"*.pyc\"]\n\n";
        toml += "[ecosystems.fakenode]\n";
        toml += "format = \"package-json\"\n";
        toml += "manifest = \"package.json\"\n";
        toml += "lock = \"package-lock.json\"\n";
        toml += "deps_dir = \"node_modules\"\n";
        toml += "deps_target = \"/app/node_modules\"\n";
        toml += "runtime_base = \"fake/node:20\"\n";
        toml += "install_full = [\"sh\", \"-c\", '" + install + "', \"install\", "
                "\"{{ deps_dir }}\", \"{{ manifest }}\", '" + log + "']\n";
        toml += "install_clean = [\"sh\", \"-c\", '" + install + "', \"install\", "
                "\"{{ deps_dir }}\", \"{{ lock }}\", '" + log + "']\n";
        toml += "default_exclude = [\"node_modules\", \"build\"]\n\n";
        toml += "[services.worker]\n";
        toml += "ecosystem = \"fakepy\"\n\n";
        toml += "[services.adminportal]\n";
        toml += "ecosystem = \"" + portal_ecosystem + "\"\n";
        toml += "build_command = [\"sh\", \"-c\", '" + build_script + "']\n\n";
        toml += extra_toml;
        return toml;
    }

    // Write Kiln.toml and load it without a global layer
    kiln::Result<kiln::Project> load() const {
        dir.write_file("Kiln.toml", manifest());
        return kiln::Project::load(dir.path, "");
    }
};

} // namespace kiln_test
