#include <kiln/fs_tree.hpp>
#include <kiln/glob.hpp>
#include <kiln/sha256.hpp>
#include <kiln/uuid.hpp>
#include <kiln/log.hpp>

#include <algorithm>

namespace fs = std::filesystem;

namespace kiln {

bool path_within(const fs::path& root, const fs::path& path) {
    std::error_code ec;
    fs::path r = fs::weakly_canonical(root, ec);
    if (ec) r = root.lexically_normal();
    fs::path p = fs::weakly_canonical(path, ec);
    if (ec) p = path.lexically_normal();

    auto rit = r.begin();
    auto pit = p.begin();
    for (; rit != r.end(); ++rit, ++pit) {
        // A trailing empty element comes from a trailing separator
        if (rit->empty()) continue;
        if (pit == p.end() || *rit != *pit) return false;
    }
    return true;
}

Result<std::vector<std::string>> list_tree(const fs::path& root,
                                           const std::vector<std::string>& ignore) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return KilnError{KilnError::NotFound,
            "directory does not exist: " + root.string()};
    }

    fs::path canonical_root = fs::canonical(root, ec);
    if (ec) {
        return KilnError{KilnError::IO,
            "cannot resolve " + root.string() + ": " + ec.message()};
    }

    std::vector<std::string> files;
    fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
    if (ec) {
        return KilnError{KilnError::IO,
            "cannot read directory " + root.string() + ": " + ec.message()};
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return KilnError{KilnError::IO,
                "error walking " + root.string() + ": " + ec.message()};
        }
        const auto& entry = *it;
        std::string rel = entry.path().lexically_relative(root).generic_string();

        if (!ignore.empty() && glob_ignored(ignore, rel)) {
            if (entry.is_directory(ec) && !entry.is_symlink(ec)) it.disable_recursion_pending();
            continue;
        }

        if (entry.is_symlink(ec)) {
            fs::path target = fs::canonical(entry.path(), ec);
            if (ec || !path_within(canonical_root, target)) {
                return KilnError{KilnError::IO,
                    "symlink escapes the source tree: " + rel,
                    "replace the link with a copy of the file"};
            }
            if (fs::is_directory(target, ec)) {
                // Linked directories would be walked twice; copy them instead
                return KilnError{KilnError::IO,
                    "symlinked directory in source tree: " + rel};
            }
            files.push_back(rel);
            continue;
        }

        if (entry.is_regular_file(ec)) {
            files.push_back(rel);
        }
    }

    std::sort(files.begin(), files.end());
    return Result<std::vector<std::string>>::ok(std::move(files));
}

Result<std::vector<std::string>> copy_tree(const fs::path& src,
                                           const fs::path& dst,
                                           const std::vector<std::string>& ignore) {
    auto files = list_tree(src, ignore);
    if (files.is_err()) return std::move(files).error();

    std::error_code ec;
    fs::create_directories(dst, ec);
    if (ec) {
        return KilnError{KilnError::IO,
            "cannot create " + dst.string() + ": " + ec.message()};
    }

    for (const auto& rel : files.value()) {
        fs::path to = dst / rel;
        fs::create_directories(to.parent_path(), ec);
        if (ec) {
            return KilnError{KilnError::IO,
                "cannot create " + to.parent_path().string() + ": " + ec.message()};
        }
        fs::copy_file(src / rel, to, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            return KilnError{KilnError::IO,
                "cannot copy " + (src / rel).string() + ": " + ec.message()};
        }
    }

    return files;
}

Result<std::string> tree_checksum(const fs::path& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return KilnError{KilnError::NotFound,
            "directory does not exist: " + root.string()};
    }

    // Links are hashed by their target text and never followed, so
    // installer layouts like lib64 -> lib hash the same wherever they live
    std::vector<std::pair<std::string, fs::path>> files;
    std::vector<std::pair<std::string, std::string>> links;
    fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::string rel = it->path().lexically_relative(root).generic_string();
        if (it->is_symlink(ec)) {
            fs::path target = fs::read_symlink(it->path(), ec);
            if (ec) break;
            links.emplace_back(rel, target.generic_string());
        } else if (it->is_regular_file(ec)) {
            files.emplace_back(rel, it->path());
        }
    }
    if (ec) {
        return KilnError{KilnError::IO,
            "error walking " + root.string() + ": " + ec.message()};
    }
    std::sort(files.begin(), files.end());
    std::sort(links.begin(), links.end());

    SHA256 hasher;
    for (const auto& [rel, path] : files) {
        hasher.update_field(rel);
        KILN_TRY(hasher.update_file(path));
    }
    for (const auto& [rel, target] : links) {
        hasher.update_field("->" + rel);
        hasher.update_field(target);
    }
    return Result<std::string>::ok(hasher.finalize_hex());
}

Status make_read_only(const fs::path& root) {
    std::error_code ec;
    const auto no_write = fs::perms::owner_write | fs::perms::group_write |
                          fs::perms::others_write;

    // Files first, then directories, deepest last in the walk order
    std::vector<fs::path> dirs;
    for (auto it = fs::recursive_directory_iterator(root, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;
        if (it->is_symlink(ec)) continue;
        if (it->is_directory(ec)) {
            dirs.push_back(it->path());
            continue;
        }
        fs::permissions(it->path(), no_write, fs::perm_options::remove, ec);
        if (ec) break;
    }
    if (ec) {
        return KilnError{KilnError::IO,
            "cannot make " + root.string() + " read-only: " + ec.message()};
    }

    dirs.push_back(root);
    for (auto d = dirs.rbegin(); d != dirs.rend(); ++d) {
        fs::permissions(*d, no_write, fs::perm_options::remove, ec);
        if (ec) {
            return KilnError{KilnError::IO,
                "cannot make " + d->string() + " read-only: " + ec.message()};
        }
    }
    return ok_status();
}

Status remove_tree(const fs::path& root) {
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(root, ec))) return ok_status();

    if (fs::is_directory(fs::symlink_status(root, ec))) {
        fs::permissions(root, fs::perms::owner_all, fs::perm_options::add, ec);
        for (auto it = fs::recursive_directory_iterator(root, ec);
             it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) break;
            if (!it->is_symlink(ec) && it->is_directory(ec)) {
                fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ec);
            }
        }
    }

    fs::remove_all(root, ec);
    if (ec) {
        return KilnError{KilnError::IO,
            "failed to remove " + root.string() + ": " + ec.message()};
    }
    return ok_status();
}

Status publish_dir(const fs::path& staging, const fs::path& target) {
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return KilnError{KilnError::IO,
            "cannot create " + target.parent_path().string() + ": " + ec.message()};
    }

    fs::path retired;
    if (fs::exists(target, ec)) {
        retired = target.parent_path() /
            ("." + target.filename().string() + ".old-" + Uuid::v4().short_id());
        fs::rename(target, retired, ec);
        if (ec) {
            return KilnError{KilnError::IO,
                "cannot retire " + target.string() + ": " + ec.message()};
        }
    }

    fs::rename(staging, target, ec);
    if (ec) {
        std::string msg = ec.message();
        // Put the previous tree back so readers keep a complete copy
        if (!retired.empty()) {
            std::error_code restore_ec;
            fs::rename(retired, target, restore_ec);
        }
        return KilnError{KilnError::IO,
            "cannot publish " + target.string() + ": " + msg};
    }

    if (!retired.empty()) {
        auto removed = remove_tree(retired);
        if (removed.is_err()) {
            log::warn("%s", removed.error().message.c_str());
        }
    }
    return ok_status();
}

} // namespace kiln
