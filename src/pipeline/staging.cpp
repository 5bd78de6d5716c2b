#include <kiln/staging.hpp>
#include <kiln/fs_tree.hpp>
#include <kiln/log.hpp>

namespace fs = std::filesystem;

namespace kiln {

static KilnError staging_error(const std::string& msg, const std::string& hint = "") {
    KilnError e{KilnError::Staging, msg, hint};
    e.at_stage("staging");
    return e;
}

Result<StagedSource> SourceStager::stage(const fs::path& project_root,
                                         const ServiceDescriptor& descriptor,
                                         const Ecosystem& ecosystem,
                                         const fs::path& run_dir) {
    fs::path src = project_root / descriptor.source_path;

    if (!path_within(project_root, src)) {
        return staging_error(
            "source path '" + descriptor.source_path + "' of service '" +
            descriptor.name + "' is outside the project root",
            "source paths are relative to " + project_root.string());
    }

    std::error_code ec;
    auto st = fs::status(src, ec);
    if (ec || !fs::exists(st)) {
        return staging_error(
            "source path does not exist: " + src.string(),
            "check services." + descriptor.name + ".source");
    }
    if (!fs::is_directory(st)) {
        return staging_error("source path is not a directory: " + src.string());
    }

    std::vector<std::string> ignore = ecosystem.default_exclude;
    ignore.insert(ignore.end(), descriptor.exclude.begin(), descriptor.exclude.end());

    fs::path context = run_dir / "context";
    if (fs::exists(context, ec)) {
        return staging_error("build context already exists: " + context.string());
    }
    fs::create_directories(context, ec);
    if (ec) {
        return staging_error("cannot create build context " + context.string() +
                             ": " + ec.message());
    }

    auto copied = copy_tree(src, context, ignore);
    if (copied.is_err()) {
        return staging_error("cannot stage " + src.string())
            .with_cause(copied.error().message);
    }
    if (copied.value().empty()) {
        return staging_error(
            "source tree of service '" + descriptor.name + "' is empty: " + src.string(),
            ignore.empty() ? "" : "every file matched an exclude pattern");
    }

    auto checksum = tree_checksum(context);
    if (checksum.is_err()) {
        return staging_error("cannot hash build context").with_cause(checksum.error().message);
    }

    auto ro = make_read_only(context);
    if (ro.is_err()) {
        return staging_error("cannot seal build context").with_cause(ro.error().message);
    }

    StagedSource staged;
    staged.context_dir = context;
    staged.files = std::move(copied).value();
    staged.content_hash = std::move(checksum).value();

    log::debug("staged %zu file(s) of %s (%s)", staged.files.size(),
               descriptor.name.c_str(), staged.content_hash.substr(0, 12).c_str());
    return Result<StagedSource>::ok(std::move(staged));
}

} // namespace kiln
