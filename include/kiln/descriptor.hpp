#pragma once

#include <kiln/result.hpp>
#include <kiln/process.hpp>
#include <optional>
#include <string>
#include <vector>

namespace kiln {

// How the resolver installs dependencies for a run
enum class InstallMode {
    Full,     // permissive, may rewrite the lock file (dev)
    CiClean   // strict install from the existing lock file (production)
};

// How a service with compiled output is served
enum class ServeMode {
    Static,   // compiled static_dir behind a web server
    Process   // the language runtime runs entrypoint
};

enum class OutputKind {
    StaticDir,
    RunnableImage
};

// Declaration file syntax understood by DependencyManifest
enum class ManifestFormat {
    Requirements,   // pip: name==1.2.3 per line
    PackageJson     // npm: package.json + package-lock.json
};

const char* to_string(InstallMode m);
const char* to_string(ServeMode m);
const char* to_string(OutputKind k);
const char* to_string(ManifestFormat f);

Result<InstallMode> parse_install_mode(const std::string& s);
Result<ServeMode> parse_serve_mode(const std::string& s);
Result<ManifestFormat> parse_manifest_format(const std::string& s);

// A language ecosystem: where its dependency declaration lives, how to
// install it and which runtime base image runs it.
struct Ecosystem {
    std::string name;
    ManifestFormat format = ManifestFormat::Requirements;
    std::string manifest_file;              // e.g. "requirements.txt"
    std::string lock_file;                  // e.g. "requirements.lock"
    std::string deps_dir;                   // installer output, relative to the install dir
    std::string deps_target;                // where the tree lands in the image
    std::string runtime_base;               // process-runner base image
    std::vector<std::string> install_full;  // argv, {{ placeholders }} allowed
    std::vector<std::string> install_clean;
    std::vector<std::string> default_exclude;

    const std::vector<std::string>& install_command(InstallMode mode) const;
};

// What is being packaged. Declared once per service, never mutated.
struct ServiceDescriptor {
    std::string name;
    std::string source_path;                // relative to the project root
    std::string ecosystem;
    bool has_build_step = false;
    std::vector<std::string> build_command;
    std::string build_output = "build";     // relative to the source root
    std::vector<std::string> entrypoint;
    std::optional<int> exposed_port;
    ServeMode serve = ServeMode::Process;
    std::vector<std::string> exclude;
    std::string workdir = "/app";

    std::string entrypoint_string() const;
};

// Selected once per pipeline run and passed by value into it
struct EnvironmentProfile {
    std::string name;
    EnvMap env_vars;
    InstallMode install_mode = InstallMode::Full;
    bool build_enabled = false;

    // Stable hash of everything that affects a build
    std::string fingerprint() const;
};

// Environment for install and build commands: the profile's variables
// over PATH, HOME, TMPDIR and LANG taken from the host. Nothing else is
// inherited.
EnvMap command_environment(const EnvironmentProfile& profile);

} // namespace kiln
