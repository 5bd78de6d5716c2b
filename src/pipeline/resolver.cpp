#include <kiln/resolver.hpp>
#include <kiln/log.hpp>
#include <kiln/placeholder.hpp>
#include <kiln/process.hpp>

namespace fs = std::filesystem;

namespace kiln {

static const char* STAGE = "dependencies";

// Copies the declaration (and lock) into the install dir writable, since
// a full install may rewrite the lock file
static Status copy_declaration(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (!ec) {
        fs::permissions(to, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::add, ec);
    }
    if (ec) {
        return KilnError{KilnError::IO,
            "cannot copy " + from.string() + " to " + to.string() + ": " + ec.message()};
    }
    return ok_status();
}

Result<ResolvedDependencies> DependencyResolver::resolve(const ServiceDescriptor& descriptor,
                                                         const EnvironmentProfile& profile,
                                                         const Ecosystem& ecosystem,
                                                         const StagedSource& staged,
                                                         int timeout_seconds) {
    auto manifest = DependencyManifest::from_source(ecosystem, staged.context_dir);
    if (manifest.is_err()) return std::move(manifest).error().at_stage(STAGE);

    const DependencyManifest& m = manifest.value();
    if (profile.install_mode == InstallMode::CiClean) {
        KILN_TRY_AT(m.check_lock(), STAGE);
    }

    DepCacheKey key{ecosystem.name, m.lock_fingerprint, profile.install_mode};
    log::debug("%s: %zu declared package(s), fingerprint %s", descriptor.name.c_str(),
               m.declared_packages.size(), m.lock_fingerprint.substr(0, 12).c_str());

    auto installer = [&](const fs::path& dir) -> Status {
        KILN_TRY(copy_declaration(staged.context_dir / ecosystem.manifest_file,
                                  dir / ecosystem.manifest_file));
        if (m.has_lock) {
            KILN_TRY(copy_declaration(staged.context_dir / ecosystem.lock_file,
                                      dir / ecosystem.lock_file));
        }

        PlaceholderMap vars{
            {"install_dir", dir.string()},
            {"deps_dir", (dir / ecosystem.deps_dir).string()},
            {"manifest", (dir / ecosystem.manifest_file).string()},
            {"lock", (dir / ecosystem.lock_file).string()},
        };
        auto cmd = expand_command(ecosystem.install_command(profile.install_mode), vars);
        if (cmd.is_err()) return std::move(cmd).error();

        log::info("%s: %s", descriptor.name.c_str(), format_command(cmd.value()).c_str());
        auto run = run_command(cmd.value(), dir.string(), timeout_seconds,
                               command_environment(profile));
        if (run.is_err()) {
            if (run.error().code == KilnError::Timeout) return std::move(run).error();
            KilnError err{KilnError::DependencyInstall,
                "cannot run the " + ecosystem.name + " installer for '" + descriptor.name + "'",
                run.error().hint};
            err.with_cause(run.error().message);
            return err;
        }

        const CommandResult& r = run.value();
        if (r.exit_code != 0) {
            KilnError err{KilnError::DependencyInstall,
                "dependency install for '" + descriptor.name + "' failed (exit " +
                std::to_string(r.exit_code) + "): " + format_command(cmd.value())};
            err.with_cause(output_tail(r.stderr_str.empty() ? r.stdout_str : r.stderr_str));
            return err;
        }

        // A manifest with no packages still yields an (empty) tree
        std::error_code ec;
        fs::create_directories(dir / ecosystem.deps_dir, ec);
        if (ec) {
            return KilnError{KilnError::IO,
                "cannot create " + (dir / ecosystem.deps_dir).string() + ": " + ec.message()};
        }
        return ok_status();
    };

    auto looked_up = cache_.get_or_install(key, installer);
    if (looked_up.is_err()) return std::move(looked_up).error().at_stage(STAGE);

    const CacheLookup& hit = looked_up.value();
    ResolvedDependencies resolved;
    resolved.manifest = std::move(manifest).value();
    resolved.entry_dir = hit.entry.root;
    resolved.deps_dir = hit.entry.root / ecosystem.deps_dir;
    resolved.fingerprint = key.fingerprint;
    resolved.content_hash = hit.entry.content_hash;
    resolved.cache_hit = hit.hit;
    return Result<ResolvedDependencies>::ok(std::move(resolved));
}

} // namespace kiln
