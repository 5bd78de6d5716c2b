#include <kiln/project.hpp>
#include <kiln/log.hpp>
#include <kiln/sha256.hpp>
#include <fstream>
#include <sstream>

namespace kiln {

namespace fs = std::filesystem;

Result<fs::path> find_manifest(const fs::path& start_dir) {
    std::error_code ec;
    fs::path dir = fs::canonical(start_dir, ec);
    if (ec) {
        dir = fs::absolute(start_dir, ec);
        if (ec) {
            return KilnError{KilnError::IO,
                "cannot resolve path: " + start_dir.string()};
        }
    }

    while (true) {
        fs::path candidate = dir / "Kiln.toml";
        if (fs::exists(candidate, ec)) {
            return Result<fs::path>::ok(candidate);
        }

        fs::path parent = dir.parent_path();
        if (parent == dir) {
            // Reached filesystem root
            return KilnError{KilnError::NotFound,
                "no Kiln.toml found in " + start_dir.string() + " or any parent directory",
                "run kiln from inside a project, or pass --project DIR"};
        }
        dir = parent;
    }
}

bool has_manifest(const fs::path& dir) {
    std::error_code ec;
    return fs::exists(dir / "Kiln.toml", ec);
}

Result<Project> Project::load(const fs::path& project_dir, const std::string& global_path) {
    fs::path manifest_path = project_dir / "Kiln.toml";

    std::ifstream file(manifest_path);
    if (!file.is_open()) {
        return KilnError{KilnError::IO,
            "cannot open manifest: " + manifest_path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    std::string contents = ss.str();
    file.close();

    // Each layer overrides fields of the entries the layers below define
    Config base = Config::builtin();

    std::optional<Config> global;
    std::error_code ec;
    if (!global_path.empty() && fs::exists(global_path, ec)) {
        auto g = Config::load(global_path, &base);
        if (g.is_err()) return std::move(g).error();
        global = std::move(g).value();
        base.merge(*global);
        log::debug("loaded global config %s", global_path.c_str());
    }

    auto local = Config::parse(contents, &base);
    if (local.is_err()) {
        KilnError e = std::move(local).error();
        if (e.file.empty()) e.file = manifest_path.string();
        return e;
    }

    Config effective = Config::effective(global, local.value());
    auto valid = effective.validate();
    if (valid.is_err()) {
        KilnError e = std::move(valid).error();
        e.file = manifest_path.string();
        return e;
    }

    fs::path abs_root = fs::canonical(project_dir, ec);
    if (ec) abs_root = fs::absolute(project_dir);

    Project proj;
    proj.root_dir = abs_root;
    proj.manifest_path = abs_root / "Kiln.toml";
    proj.checksum = SHA256::hash_hex(contents);
    proj.config = std::move(effective);

    return Result<Project>::ok(std::move(proj));
}

Result<Project> Project::discover(const fs::path& start_dir, const std::string& global_path) {
    auto manifest_path = find_manifest(start_dir);
    if (manifest_path.is_err()) return std::move(manifest_path).error();

    return Project::load(manifest_path.value().parent_path(), global_path);
}

fs::path Project::build_root() const {
    fs::path p(config.settings.build_root);
    return p.is_absolute() ? p : root_dir / p;
}

fs::path Project::cache_root() const {
    if (config.settings.cache_root.empty()) return fs::path(default_cache_root());
    fs::path p(config.settings.cache_root);
    return p.is_absolute() ? p : root_dir / p;
}

} // namespace kiln
