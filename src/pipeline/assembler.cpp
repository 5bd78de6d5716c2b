#include <kiln/assembler.hpp>
#include <kiln/fs_tree.hpp>
#include <kiln/log.hpp>
#include <kiln/store.hpp>
#include <kiln/uuid.hpp>
#include <fstream>

namespace fs = std::filesystem;

namespace kiln {

static const char* STAGE = "assemble";

static KilnError assembly_error(const std::string& msg, const std::string& hint = "") {
    KilnError e{KilnError::Assembly, msg, hint};
    e.at_stage(STAGE);
    return e;
}

static Status write_file(const fs::path& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
    if (!out) {
        return KilnError{KilnError::IO, "cannot write " + path.string()};
    }
    return ok_status();
}

fs::path RuntimeAssembler::image_path(const fs::path& out_root,
                                      const std::string& service,
                                      const std::string& environment) {
    return out_root / "images" / service / environment;
}

Result<Image> RuntimeAssembler::plan(const ServiceDescriptor& descriptor,
                                     const EnvironmentProfile& profile,
                                     const Ecosystem& ecosystem,
                                     const StagedSource& staged,
                                     const ResolvedDependencies& deps,
                                     const std::optional<BuildArtifact>& artifact) const {
    Image image;
    image.service = descriptor.name;
    image.environment = profile.name;
    image.output_kind = OutputKind::RunnableImage;
    image.static_server = artifact.has_value() && descriptor.serve == ServeMode::Static;
    image.env = profile.env_vars;

    if (descriptor.exposed_port) {
        int port = *descriptor.exposed_port;
        if (port < 1 || port > 65535) {
            return assembly_error(
                "port " + std::to_string(port) + " of service '" + descriptor.name +
                "' is outside 1..65535");
        }
        auto env_port = image.env.find("PORT");
        if (env_port != image.env.end() && env_port->second != std::to_string(port)) {
            return assembly_error(
                "port conflict: '" + profile.name + "' sets PORT=" + env_port->second +
                " but service '" + descriptor.name + "' exposes " + std::to_string(port),
                "drop PORT from the profile or change services." + descriptor.name + ".port");
        }
        image.exposed_port = port;
    }

    if (image.static_server) {
        image.base_runtime = settings_.web_server_base;
        image.workdir = settings_.static_root;
        image.entrypoint = settings_.static_entrypoint;

        Layer layer;
        layer.action = "static";
        layer.source = artifact->path;
        layer.destination = settings_.static_root;
        layer.content_hash = artifact->content_hash;
        image.layers.push_back(std::move(layer));
    } else {
        image.base_runtime = ecosystem.runtime_base;
        image.workdir = descriptor.workdir;
        image.entrypoint = descriptor.entrypoint;

        auto deps_hash = tree_checksum(deps.deps_dir);
        if (deps_hash.is_err()) return std::move(deps_hash).error().at_stage(STAGE);

        Layer dep_layer;
        dep_layer.action = "dependencies";
        dep_layer.source = deps.deps_dir;
        dep_layer.destination = ecosystem.deps_target;
        dep_layer.content_hash = std::move(deps_hash).value();
        image.layers.push_back(std::move(dep_layer));

        Layer src_layer;
        src_layer.action = "source";
        src_layer.source = staged.context_dir;
        src_layer.destination = descriptor.workdir;
        src_layer.content_hash = staged.content_hash;
        image.layers.push_back(std::move(src_layer));

        if (artifact) {
            Layer out_layer;
            out_layer.action = "artifact";
            out_layer.source = artifact->path;
            out_layer.destination = (fs::path(descriptor.workdir) / descriptor.build_output)
                .generic_string();
            out_layer.content_hash = artifact->content_hash;
            image.layers.push_back(std::move(out_layer));
        }
    }

    if (image.base_runtime.empty()) {
        return assembly_error(
            "no base image for service '" + descriptor.name + "'",
            image.static_server ? "set settings.web_server_base"
                                : "set ecosystems." + ecosystem.name + ".runtime_base");
    }
    if (image.entrypoint.empty()) {
        return assembly_error("no entrypoint for service '" + descriptor.name + "'");
    }

    // Every layer comes from this run's own inputs
    for (const auto& layer : image.layers) {
        bool allowed = path_within(staged.context_dir, layer.source) ||
                       path_within(deps.entry_dir, layer.source) ||
                       (artifact && path_within(artifact->path, layer.source));
        if (!allowed) {
            return assembly_error(
                "layer '" + layer.action + "' of service '" + descriptor.name +
                "' reads from " + layer.source.string() + ", outside this run's inputs");
        }
    }

    image.content_hash = image.compute_content_hash();
    return Result<Image>::ok(std::move(image));
}

Status RuntimeAssembler::materialize(Image& image, const fs::path& out_root) const {
    fs::path target = image_path(out_root, image.service, image.environment);
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return KilnError{KilnError::IO,
            "cannot create " + target.parent_path().string() + ": " + ec.message()};
    }

    fs::path tmp = target.parent_path() /
        ("." + image.environment + ".tmp-" + Uuid::v4().short_id());
    auto fill = [&]() -> Status {
        for (size_t i = 0; i < image.layers.size(); ++i) {
            const Layer& layer = image.layers[i];
            fs::path dest = tmp / "layers" / layer.dir_name(i);
            if (layer.action == "dependencies") {
                KILN_TRY(copy_dependency_tree(layer.source, dest));
            } else {
                auto copied = copy_tree(layer.source, dest);
                if (copied.is_err()) return std::move(copied).error();
            }
        }
        KILN_TRY(write_file(tmp / "image.json", image.to_json()));
        KILN_TRY(write_file(tmp / "Dockerfile", image.render_dockerfile()));
        return ok_status();
    };

    fs::create_directories(tmp, ec);
    auto filled = ec ? Status(KilnError{KilnError::IO, "cannot create " + tmp.string()}) : fill();
    if (filled.is_ok()) filled = publish_dir(tmp, target);
    if (filled.is_err()) {
        auto removed = remove_tree(tmp);
        if (removed.is_err()) log::warn("%s", removed.error().message.c_str());
        return filled;
    }

    image.context_dir = target;
    return ok_status();
}

Result<Image> RuntimeAssembler::assemble(const ServiceDescriptor& descriptor,
                                         const EnvironmentProfile& profile,
                                         const Ecosystem& ecosystem,
                                         const StagedSource& staged,
                                         const ResolvedDependencies& deps,
                                         const std::optional<BuildArtifact>& artifact,
                                         const fs::path& out_root) {
    auto planned = plan(descriptor, profile, ecosystem, staged, deps, artifact);
    if (planned.is_err()) return planned;

    Image image = std::move(planned).value();
    KILN_TRY_AT(materialize(image, out_root), STAGE);

    if (store_) {
        ArtifactRecord rec;
        rec.service = image.service;
        rec.environment = image.environment;
        rec.produced_at = ArtifactStore::now();
        rec.output_kind = OutputKind::RunnableImage;
        rec.content_hash = image.content_hash;
        rec.path = image.context_dir.string();
        KILN_TRY_AT(store_->record_artifact(rec), STAGE);
    }

    log::info("%s: assembled %s image on %s (%s)", descriptor.name.c_str(),
              image.static_server ? "static-server" : "process-runner",
              image.base_runtime.c_str(), image.content_hash.substr(0, 12).c_str());
    return Result<Image>::ok(std::move(image));
}

} // namespace kiln
