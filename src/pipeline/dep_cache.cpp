#include <kiln/dep_cache.hpp>
#include <kiln/file_lock.hpp>
#include <kiln/fs_tree.hpp>
#include <kiln/log.hpp>
#include <kiln/store.hpp>
#include <kiln/uuid.hpp>

#include <cstring>
#include <fstream>

namespace fs = std::filesystem;

namespace kiln {

namespace {

// Written into an entry before it is published
const char* const ENTRY_HASH_FILE = ".kiln-content-hash";
const char* const TMP_PREFIX = ".tmp-";

std::optional<DepCacheEntry> read_entry(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return std::nullopt;
    std::ifstream in(dir / ENTRY_HASH_FILE);
    std::string hash;
    if (!in.is_open() || !(in >> hash) || hash.size() != 64) return std::nullopt;
    return DepCacheEntry{dir, hash};
}

void discard(const fs::path& tmp) {
    auto removed = remove_tree(tmp);
    if (removed.is_err()) {
        log::warn("cannot remove failed install dir: %s",
                  removed.error().message.c_str());
    }
}

int64_t tree_size(const fs::path& dir) {
    int64_t total = 0;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code sec;
        if (it->is_regular_file(sec)) {
            auto sz = it->file_size(sec);
            if (!sec) total += static_cast<int64_t>(sz);
        }
    }
    return total;
}

} // namespace

std::string DepCacheKey::dir_name() const {
    return fingerprint.substr(0, 32) + "-" + kiln::to_string(mode);
}

std::string DepCacheKey::to_string() const {
    return ecosystem + "/" + fingerprint.substr(0, 12) + "/" + kiln::to_string(mode);
}

std::string DepCacheKey::id() const {
    return ecosystem + "/" + fingerprint + "/" + kiln::to_string(mode);
}

DependencyCache::DependencyCache(fs::path root, ArtifactStore* store)
    : root_(std::move(root)), store_(store) {}

fs::path DependencyCache::entry_path(const DepCacheKey& key) const {
    return root_ / "deps" / key.ecosystem / key.dir_name();
}

std::optional<DepCacheEntry> DependencyCache::lookup(const DepCacheKey& key) const {
    return read_entry(entry_path(key));
}

Result<CacheLookup> DependencyCache::get_or_install(const DepCacheKey& key,
                                                    const Installer& install) {
    if (auto entry = lookup(key)) {
        log::debug("dependency cache hit: %s", key.to_string().c_str());
        return Result<CacheLookup>::ok(CacheLookup{*entry, true, false});
    }

    const std::string id = key.id();
    std::promise<Result<DepCacheEntry>> promise;
    std::shared_future<Result<DepCacheEntry>> pending;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = inflight_.find(id);
        if (it != inflight_.end()) {
            pending = it->second;
        } else {
            pending = promise.get_future().share();
            inflight_.emplace(id, pending);
            owner = true;
        }
    }

    if (!owner) {
        log::debug("waiting for in-flight install of %s", key.to_string().c_str());
        const Result<DepCacheEntry>& shared = pending.get();
        if (shared.is_err()) return shared.error();
        return Result<CacheLookup>::ok(CacheLookup{shared.value(), true, true});
    }

    log::debug("dependency cache miss: %s", key.to_string().c_str());
    auto result = install_exclusive(key, install);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (result.is_ok()) {
            promise.set_value(Result<DepCacheEntry>::ok(result.value().entry));
        } else {
            promise.set_value(Result<DepCacheEntry>(result.error()));
        }
        inflight_.erase(id);
    }
    return result;
}

Result<CacheLookup> DependencyCache::install_exclusive(const DepCacheKey& key,
                                                       const Installer& install) {
    fs::path entry = entry_path(key);
    fs::path eco_dir = entry.parent_path();

    std::error_code ec;
    fs::create_directories(eco_dir, ec);
    if (ec) {
        return KilnError{KilnError::IO,
            "cannot create cache directory " + eco_dir.string() + ": " + ec.message()};
    }

    auto lock = FileLock::acquire(fs::path(entry.string() + ".lock"));
    if (lock.is_err()) return std::move(lock).error();

    // Another process may have published the entry while we waited
    if (auto existing = read_entry(entry)) {
        log::debug("dependency cache filled by another process: %s", key.to_string().c_str());
        return Result<CacheLookup>::ok(CacheLookup{*existing, true, true});
    }

    fs::path tmp = eco_dir / (TMP_PREFIX + key.dir_name() + "-" + Uuid::v4().short_id());
    fs::create_directories(tmp, ec);
    if (ec) {
        return KilnError{KilnError::IO,
            "cannot create install dir " + tmp.string() + ": " + ec.message()};
    }

    log::info("installing %s dependencies (%s)", key.ecosystem.c_str(), key.to_string().c_str());
    auto installed = install(tmp);
    if (installed.is_err()) {
        discard(tmp);
        return std::move(installed).error();
    }

    auto hash = tree_checksum(tmp);
    if (hash.is_err()) {
        discard(tmp);
        return std::move(hash).error();
    }
    {
        std::ofstream out(tmp / ENTRY_HASH_FILE, std::ios::trunc);
        out << hash.value() << "\n";
        if (!out) {
            discard(tmp);
            return KilnError{KilnError::IO, "cannot write " + (tmp / ENTRY_HASH_FILE).string()};
        }
    }

    auto published = publish_dir(tmp, entry);
    if (published.is_err()) {
        discard(tmp);
        return std::move(published).error();
    }

    if (store_) {
        DepEntryRecord rec;
        rec.ecosystem = key.ecosystem;
        rec.fingerprint = key.fingerprint;
        rec.install_mode = key.mode;
        rec.path = entry.string();
        rec.content_hash = hash.value();
        rec.created_at = ArtifactStore::now();
        KILN_TRY(store_->record_dep(rec));
    }

    return Result<CacheLookup>::ok(
        CacheLookup{DepCacheEntry{entry, std::move(hash).value()}, false, false});
}

Result<DepCacheStats> DependencyCache::stats() const {
    DepCacheStats stats;
    fs::path deps = root_ / "deps";
    std::error_code ec;
    if (!fs::exists(deps, ec)) return Result<DepCacheStats>::ok(stats);

    for (const auto& eco : fs::directory_iterator(deps, ec)) {
        if (!eco.is_directory()) continue;
        std::error_code iec;
        for (const auto& entry : fs::directory_iterator(eco.path(), iec)) {
            std::string name = entry.path().filename().string();
            if (name.rfind(TMP_PREFIX, 0) == 0) continue;
            if (!read_entry(entry.path())) continue;
            ++stats.entries;
            stats.total_bytes += tree_size(entry.path());
        }
        if (iec) {
            return KilnError{KilnError::IO,
                "cannot list " + eco.path().string() + ": " + iec.message()};
        }
    }
    if (ec) {
        return KilnError{KilnError::IO, "cannot list " + deps.string() + ": " + ec.message()};
    }
    return Result<DepCacheStats>::ok(stats);
}

Status DependencyCache::clean() {
    KILN_TRY(remove_tree(root_ / "deps"));
    if (store_) {
        auto rows = store_->list_deps();
        if (rows.is_err()) return std::move(rows).error();
        for (const auto& r : rows.value()) {
            KILN_TRY(store_->remove_dep(r.ecosystem, r.fingerprint, r.install_mode));
        }
    }
    return ok_status();
}

Result<int> DependencyCache::prune() {
    int removed = 0;
    fs::path deps = root_ / "deps";
    std::error_code ec;
    if (!fs::exists(deps, ec)) return Result<int>::ok(0);

    std::vector<fs::path> stale;
    for (const auto& eco : fs::directory_iterator(deps, ec)) {
        if (!eco.is_directory()) continue;
        std::error_code iec;
        for (const auto& entry : fs::directory_iterator(eco.path(), iec)) {
            std::string name = entry.path().filename().string();
            if (name.rfind(TMP_PREFIX, 0) == 0) stale.push_back(entry.path());
        }
    }

    for (const auto& tmp : stale) {
        // .tmp-<dir_name>-<id>: only remove it when no one holds <dir_name>.lock
        std::string name = tmp.filename().string().substr(std::strlen(TMP_PREFIX));
        size_t dash = name.rfind('-');
        if (dash == std::string::npos) continue;
        fs::path lock_path = tmp.parent_path() / (name.substr(0, dash) + ".lock");
        auto lock = FileLock::try_acquire(lock_path);
        if (!lock) {
            log::debug("install in progress, keeping %s", tmp.string().c_str());
            continue;
        }
        KILN_TRY(remove_tree(tmp));
        ++removed;
    }
    return Result<int>::ok(removed);
}

} // namespace kiln
