#pragma once

#include <kiln/descriptor.hpp>
#include <kiln/process.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kiln {

struct Layer {
    std::string action;                 // "dependencies", "source", "artifact", "static"
    std::filesystem::path source;       // where the assembler copies from (not hashed)
    std::string destination;            // absolute in-image path
    std::string content_hash;           // tree_checksum of the copied tree

    // "<index>-<hash prefix>", the layer's directory under layers/
    std::string dir_name(size_t index) const;
};

// Final deployable image. Built and owned by the RuntimeAssembler.
struct Image {
    std::string service;
    std::string environment;
    std::string base_runtime;
    std::vector<Layer> layers;
    std::vector<std::string> entrypoint;
    std::optional<int> exposed_port;
    EnvMap env;
    std::string workdir;
    OutputKind output_kind = OutputKind::RunnableImage;
    bool static_server = false;
    std::string content_hash;
    std::string tag;                    // set when the pipeline reaches Tagged
    std::filesystem::path context_dir;  // materialized image directory

    // Hash of base, layers (action, destination, hash), entrypoint,
    // port, workdir and env. No names, paths or timestamps.
    std::string compute_content_hash() const;

    std::string entrypoint_string() const;

    // image.json contents (pretty-printed, keys sorted, no tag)
    std::string to_json() const;

    // The generated Dockerfile, COPYing from layers/<dir_name>/
    std::string render_dockerfile() const;
};

} // namespace kiln
