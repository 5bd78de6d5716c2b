#include <kiln/descriptor.hpp>
#include <kiln/sha256.hpp>
#include <cstdlib>

namespace kiln {

const char* to_string(InstallMode m) {
    switch (m) {
        case InstallMode::Full:    return "full";
        case InstallMode::CiClean: return "ci-clean";
    }
    return "unknown";
}

const char* to_string(ServeMode m) {
    switch (m) {
        case ServeMode::Static:  return "static";
        case ServeMode::Process: return "process";
    }
    return "unknown";
}

const char* to_string(OutputKind k) {
    switch (k) {
        case OutputKind::StaticDir:     return "static_dir";
        case OutputKind::RunnableImage: return "runnable_image";
    }
    return "unknown";
}

const char* to_string(ManifestFormat f) {
    switch (f) {
        case ManifestFormat::Requirements: return "requirements";
        case ManifestFormat::PackageJson:  return "package-json";
    }
    return "unknown";
}

Result<InstallMode> parse_install_mode(const std::string& s) {
    if (s == "full") return Result<InstallMode>::ok(InstallMode::Full);
    if (s == "ci-clean") return Result<InstallMode>::ok(InstallMode::CiClean);
    return KilnError{KilnError::Config,
        "unknown install mode '" + s + "'",
        "expected 'full' or 'ci-clean'"};
}

Result<ServeMode> parse_serve_mode(const std::string& s) {
    if (s == "static") return Result<ServeMode>::ok(ServeMode::Static);
    if (s == "process") return Result<ServeMode>::ok(ServeMode::Process);
    return KilnError{KilnError::Config,
        "unknown serve mode '" + s + "'",
        "expected 'static' or 'process'"};
}

Result<ManifestFormat> parse_manifest_format(const std::string& s) {
    if (s == "requirements") return Result<ManifestFormat>::ok(ManifestFormat::Requirements);
    if (s == "package-json") return Result<ManifestFormat>::ok(ManifestFormat::PackageJson);
    return KilnError{KilnError::Config,
        "unknown manifest format '" + s + "'",
        "expected 'requirements' or 'package-json'"};
}

const std::vector<std::string>& Ecosystem::install_command(InstallMode mode) const {
    return mode == InstallMode::CiClean ? install_clean : install_full;
}

std::string ServiceDescriptor::entrypoint_string() const {
    std::string out;
    for (size_t i = 0; i < entrypoint.size(); ++i) {
        if (i > 0) out += ' ';
        out += entrypoint[i];
    }
    return out;
}

std::string EnvironmentProfile::fingerprint() const {
    std::vector<std::string> fields;
    fields.push_back(name);
    fields.push_back(to_string(install_mode));
    fields.push_back(build_enabled ? "build" : "no-build");
    for (const auto& [k, v] : env_vars) {
        fields.push_back(k + "=" + v);
    }
    return SHA256::hash_fields(fields);
}

EnvMap command_environment(const EnvironmentProfile& profile) {
    EnvMap env;
    for (const char* name : {"PATH", "HOME", "TMPDIR", "LANG"}) {
        if (const char* v = std::getenv(name)) env[name] = v;
    }
    if (env.find("PATH") == env.end()) env["PATH"] = "/usr/local/bin:/usr/bin:/bin";
    for (const auto& [k, v] : profile.env_vars) env[k] = v;
    return env;
}

} // namespace kiln
