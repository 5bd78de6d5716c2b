#pragma once

#include <kiln/result.hpp>
#include <kiln/descriptor.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace kiln {

// Read-only snapshot of one service's source tree inside a run directory
struct StagedSource {
    std::filesystem::path context_dir;
    std::vector<std::string> files;   // sorted, relative to context_dir
    std::string content_hash;         // tree_checksum of context_dir
};

struct SourceStager {
    // Copy exactly the files under descriptor.source_path (minus the
    // ecosystem's default excludes and the descriptor's own) into
    // <run_dir>/context and mark the copy read-only.
    // Staging errors: path missing, not a directory, outside the project
    // root, unreadable, or nothing left to stage.
    static Result<StagedSource> stage(const std::filesystem::path& project_root,
                                      const ServiceDescriptor& descriptor,
                                      const Ecosystem& ecosystem,
                                      const std::filesystem::path& run_dir);
};

} // namespace kiln
