#include <kiln/compiler.hpp>
#include <kiln/fs_tree.hpp>
#include <kiln/log.hpp>
#include <kiln/placeholder.hpp>
#include <kiln/process.hpp>
#include <kiln/store.hpp>
#include <kiln/uuid.hpp>

namespace fs = std::filesystem;

namespace kiln {

static const char* STAGE = "compile";

static KilnError compile_error(const std::string& msg, const std::string& hint = "") {
    KilnError e{KilnError::Compile, msg, hint};
    e.at_stage(STAGE);
    return e;
}

// The staged snapshot is read-only; the build works on a writable copy
static Status make_writable(const fs::path& root) {
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(root, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_symlink(ec)) continue;
        fs::permissions(it->path(), fs::perms::owner_write, fs::perm_options::add, ec);
        if (ec) break;
    }
    if (ec) {
        return KilnError{KilnError::IO,
            "cannot make " + root.string() + " writable: " + ec.message()};
    }
    return ok_status();
}

Status copy_dependency_tree(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::create_directories(to.parent_path(), ec);
    if (!ec) {
        fs::copy(from, to, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    }
    if (ec) {
        return KilnError{KilnError::IO,
            "cannot copy dependencies " + from.string() + " to " + to.string() +
            ": " + ec.message()};
    }
    return ok_status();
}

fs::path ArtifactCompiler::artifact_path(const fs::path& out_root,
                                         const std::string& service,
                                         const std::string& environment) {
    return out_root / "artifacts" / service / environment / "static_dir";
}

Result<std::optional<BuildArtifact>> ArtifactCompiler::compile(
        const ServiceDescriptor& descriptor,
        const EnvironmentProfile& profile,
        const Ecosystem& ecosystem,
        const StagedSource& staged,
        const ResolvedDependencies& deps,
        const fs::path& out_root,
        const fs::path& work_dir,
        int timeout_seconds) {
    using Out = Result<std::optional<BuildArtifact>>;

    if (!descriptor.has_build_step) {
        log::debug("%s: no build step", descriptor.name.c_str());
        return Out::ok(std::nullopt);
    }
    if (!profile.build_enabled) {
        log::info("%s: build disabled in '%s', serving from source",
                  descriptor.name.c_str(), profile.name.c_str());
        return Out::ok(std::nullopt);
    }

    // Writable workspace: source + dependency tree
    fs::path ws = work_dir / "compile";
    std::error_code ec;
    if (fs::exists(ws, ec)) {
        return compile_error("compile workspace already exists: " + ws.string());
    }
    auto copied = copy_tree(staged.context_dir, ws);
    if (copied.is_err()) {
        return compile_error("cannot prepare compile workspace")
            .with_cause(copied.error().message);
    }
    KILN_TRY_AT(make_writable(ws), STAGE);
    KILN_TRY_AT(copy_dependency_tree(deps.deps_dir, ws / ecosystem.deps_dir), STAGE);

    fs::path output = ws / descriptor.build_output;
    PlaceholderMap vars{
        {"source_dir", ws.string()},
        {"output_dir", output.string()},
    };
    auto cmd = expand_command(descriptor.build_command, vars);
    if (cmd.is_err()) return std::move(cmd).error().at_stage(STAGE);

    log::info("%s: %s", descriptor.name.c_str(), format_command(cmd.value()).c_str());
    auto run = run_command(cmd.value(), ws.string(), timeout_seconds,
                           command_environment(profile));
    if (run.is_err()) {
        if (run.error().code == KilnError::Timeout) return std::move(run).error().at_stage(STAGE);
        return compile_error("cannot run the build of '" + descriptor.name + "'", run.error().hint)
            .with_cause(run.error().message);
    }

    const CommandResult& r = run.value();
    if (r.exit_code != 0) {
        return compile_error(
            "build of '" + descriptor.name + "' failed (exit " +
            std::to_string(r.exit_code) + "): " + format_command(cmd.value()))
            .with_cause(output_tail(r.stderr_str.empty() ? r.stdout_str : r.stderr_str));
    }

    if (!fs::is_directory(output, ec)) {
        return compile_error(
            "build of '" + descriptor.name + "' produced no " + descriptor.build_output + "/",
            "services." + descriptor.name + ".build_output names the directory the build writes");
    }

    // Publish: copy into a sibling temp dir, seal, then swap into place
    fs::path target = artifact_path(out_root, descriptor.name, profile.name);
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return compile_error("cannot create " + target.parent_path().string())
            .with_cause(ec.message());
    }
    fs::path tmp = target.parent_path() / (".static_dir.tmp-" + Uuid::v4().short_id());

    auto discard = [&tmp]() {
        auto removed = remove_tree(tmp);
        if (removed.is_err()) log::warn("%s", removed.error().message.c_str());
    };

    auto files = copy_tree(output, tmp);
    if (files.is_err()) {
        discard();
        return compile_error("cannot collect build output").with_cause(files.error().message);
    }
    if (files.value().empty()) {
        discard();
        return compile_error("build of '" + descriptor.name + "' left " +
                             descriptor.build_output + "/ empty");
    }

    auto hash = tree_checksum(tmp);
    if (hash.is_err()) {
        discard();
        return std::move(hash).error().at_stage(STAGE);
    }
    auto sealed = make_read_only(tmp);
    if (sealed.is_err()) {
        discard();
        return std::move(sealed).error().at_stage(STAGE);
    }
    auto published = publish_dir(tmp, target);
    if (published.is_err()) {
        discard();
        return std::move(published).error().at_stage(STAGE);
    }

    BuildArtifact artifact;
    artifact.service = descriptor.name;
    artifact.environment = profile.name;
    artifact.produced_at = ArtifactStore::now();
    artifact.output_kind = OutputKind::StaticDir;
    artifact.content_hash = std::move(hash).value();
    artifact.path = target;
    artifact.files = std::move(files).value();

    if (store_) {
        ArtifactRecord rec;
        rec.service = artifact.service;
        rec.environment = artifact.environment;
        rec.produced_at = artifact.produced_at;
        rec.output_kind = artifact.output_kind;
        rec.content_hash = artifact.content_hash;
        rec.path = artifact.path.string();
        KILN_TRY_AT(store_->record_artifact(rec), STAGE);
    }

    log::info("%s: built %zu file(s) -> %s", descriptor.name.c_str(),
              artifact.files.size(), target.string().c_str());
    return Out::ok(std::move(artifact));
}

} // namespace kiln
