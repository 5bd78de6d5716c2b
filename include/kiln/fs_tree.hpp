#pragma once

#include <kiln/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace kiln {

// Sorted, forward-slash relative paths of the regular files under root.
// Paths matching `ignore` (glob_ignored semantics) are skipped. Symlinks
// are followed only when they resolve inside root; one that escapes is
// an IO error.
Result<std::vector<std::string>> list_tree(const std::filesystem::path& root,
                                           const std::vector<std::string>& ignore = {});

// Copy the files list_tree() reports from src into dst (created if missing)
Result<std::vector<std::string>> copy_tree(const std::filesystem::path& src,
                                           const std::filesystem::path& dst,
                                           const std::vector<std::string>& ignore = {});

// SHA-256 over sorted relative paths and file contents. Independent of
// mtimes, inode numbers and the directory's own location. Symlinks are
// not followed; they contribute their path and link text.
Result<std::string> tree_checksum(const std::filesystem::path& root);

// Strip write permission from every file and directory under root
Status make_read_only(const std::filesystem::path& root);

// Remove a tree, restoring write permission on directories first
Status remove_tree(const std::filesystem::path& root);

// Move a fully-populated `staging` directory to `target`. Readers see
// either the previous complete tree or the new one, never a mix.
Status publish_dir(const std::filesystem::path& staging,
                   const std::filesystem::path& target);

// True if `path` is `root` or lies under it, after normalization
bool path_within(const std::filesystem::path& root, const std::filesystem::path& path);

} // namespace kiln
