#include <kiln/store.hpp>
#include <sqlite3.h>

#include <chrono>
#include <filesystem>
#include <mutex>

namespace fs = std::filesystem;

namespace kiln {

// ---------------------------------------------------------------------------
// pImpl
// ---------------------------------------------------------------------------

static const std::string SCHEMA_VERSION = "1";

static std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

static InstallMode mode_from_column(const std::string& s) {
    return s == "ci-clean" ? InstallMode::CiClean : InstallMode::Full;
}

static OutputKind kind_from_column(const std::string& s) {
    return s == "runnable_image" ? OutputKind::RunnableImage : OutputKind::StaticDir;
}

struct ArtifactStore::Impl {
    sqlite3* db = nullptr;
    std::mutex mutex;

    // Prepared statements (lazily initialized, cached)
    sqlite3_stmt* stmt_record_dep = nullptr;
    sqlite3_stmt* stmt_lookup_dep = nullptr;
    sqlite3_stmt* stmt_remove_dep = nullptr;
    sqlite3_stmt* stmt_record_artifact = nullptr;
    sqlite3_stmt* stmt_latest_artifact = nullptr;
    sqlite3_stmt* stmt_record_tag = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_record_dep);
        fin(stmt_lookup_dep);
        fin(stmt_remove_dep);
        fin(stmt_record_artifact);
        fin(stmt_latest_artifact);
        fin(stmt_record_tag);
    }

    Status require_open() const {
        if (!db) return KilnError(KilnError::IO, "artifact store is not open");
        return ok_status();
    }

    Status prepare(const char* sql, sqlite3_stmt*& out) {
        if (out) return ok_status();
        int rc = sqlite3_prepare_v2(db, sql, -1, &out, nullptr);
        if (rc != SQLITE_OK) {
            return KilnError(KilnError::IO,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Status exec(const char* sql) {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            return KilnError(KilnError::IO, "SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    Status step_done(sqlite3_stmt* stmt, const char* what) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            return KilnError(KilnError::IO,
                std::string("Failed to ") + what + ": " + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Status init_schema() {
        KILN_TRY(exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS dep_entry ("
            "  ecosystem TEXT,"
            "  fingerprint TEXT,"
            "  mode TEXT,"
            "  path TEXT,"
            "  content_hash TEXT,"
            "  created_at INTEGER,"
            "  PRIMARY KEY (ecosystem, fingerprint, mode)"
            ");"
            "CREATE TABLE IF NOT EXISTS artifact ("
            "  service TEXT,"
            "  environment TEXT,"
            "  output_kind TEXT,"
            "  produced_at INTEGER,"
            "  content_hash TEXT,"
            "  path TEXT,"
            "  PRIMARY KEY (service, environment, output_kind)"
            ");"
            "CREATE TABLE IF NOT EXISTS image_tag ("
            "  tag TEXT PRIMARY KEY,"
            "  service TEXT,"
            "  environment TEXT,"
            "  content_hash TEXT,"
            "  created_at INTEGER"
            ");"
        ));

        // Check schema version
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db,
            "SELECT value FROM schema_info WHERE key='version'", -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            if (stmt) sqlite3_finalize(stmt);
            return KilnError(KilnError::IO,
                std::string("Failed to read schema version: ") + sqlite3_errmsg(db));
        }

        rc = sqlite3_step(stmt);
        std::string ver = rc == SQLITE_ROW ? column_text(stmt, 0) : "";
        sqlite3_finalize(stmt);

        if (ver == SCHEMA_VERSION) return ok_status();
        if (!ver.empty()) {
            // Version mismatch: the index is rebuilt as builds run again
            KILN_TRY(exec(
                "DELETE FROM dep_entry;"
                "DELETE FROM artifact;"
                "DELETE FROM image_tag;"
            ));
        }
        std::string ver_sql = "INSERT OR REPLACE INTO schema_info (key, value) "
            "VALUES ('version', '" + SCHEMA_VERSION + "');";
        return exec(ver_sql.c_str());
    }

    Status setup() {
        sqlite3_busy_timeout(db, 5000);
        KILN_TRY(exec(
            "PRAGMA journal_mode=WAL;"
            "PRAGMA synchronous=NORMAL;"
        ));
        return init_schema();
    }

    Status open_db(const std::string& db_path) {
        int rc = sqlite3_open_v2(db_path.c_str(), &db,
            SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
        if (rc != SQLITE_OK) {
            std::string err_msg = db ? sqlite3_errmsg(db) : "unknown";
            if (db) { sqlite3_close(db); db = nullptr; }
            return KilnError(KilnError::IO,
                "Failed to open artifact store " + db_path + ": " + err_msg);
        }
        return ok_status();
    }

    void close_db() {
        if (db) {
            finalize_all();
            sqlite3_close(db);
            db = nullptr;
        }
    }
};

// ---------------------------------------------------------------------------
// ArtifactStore public interface
// ---------------------------------------------------------------------------

ArtifactStore::ArtifactStore() : impl_(std::make_unique<Impl>()) {}
ArtifactStore::~ArtifactStore() = default;
ArtifactStore::ArtifactStore(ArtifactStore&&) noexcept = default;
ArtifactStore& ArtifactStore::operator=(ArtifactStore&&) noexcept = default;

int64_t ArtifactStore::now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

Status ArtifactStore::open(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->close_db();

    fs::path parent = fs::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return KilnError(KilnError::IO,
                "Failed to create store directory: " + parent.string());
        }
    }

    KILN_TRY(impl_->open_db(db_path));

    auto setup_result = impl_->setup();
    if (setup_result.is_err()) {
        // Corrupt DB: the store only indexes what is on disk, so delete
        // and retry once
        impl_->close_db();
        std::error_code ec;
        fs::remove(db_path, ec);
        fs::remove(db_path + "-wal", ec);
        fs::remove(db_path + "-shm", ec);
        KILN_TRY(impl_->open_db(db_path));
        KILN_TRY(impl_->setup());
    }

    return ok_status();
}

void ArtifactStore::close() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->close_db();
}

bool ArtifactStore::is_open() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->db != nullptr;
}

// ---------------------------------------------------------------------------
// Dependency cache index
// ---------------------------------------------------------------------------

Status ArtifactStore::record_dep(const DepEntryRecord& entry) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    KILN_TRY(impl_->require_open());
    KILN_TRY(impl_->prepare(
        "INSERT OR REPLACE INTO dep_entry "
        "(ecosystem, fingerprint, mode, path, content_hash, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?)",
        impl_->stmt_record_dep));

    sqlite3_stmt* s = impl_->stmt_record_dep;
    sqlite3_reset(s);
    sqlite3_bind_text(s, 1, entry.ecosystem.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 2, entry.fingerprint.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 3, to_string(entry.install_mode), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 4, entry.path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 5, entry.content_hash.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(s, 6, entry.created_at);
    return impl_->step_done(s, "record dependency entry");
}

Result<DepEntryRecord> ArtifactStore::lookup_dep(const std::string& ecosystem,
                                                 const std::string& fingerprint,
                                                 InstallMode mode) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    KILN_TRY(impl_->require_open());
    KILN_TRY(impl_->prepare(
        "SELECT ecosystem, fingerprint, mode, path, content_hash, created_at "
        "FROM dep_entry WHERE ecosystem=? AND fingerprint=? AND mode=?",
        impl_->stmt_lookup_dep));

    sqlite3_stmt* s = impl_->stmt_lookup_dep;
    sqlite3_reset(s);
    sqlite3_bind_text(s, 1, ecosystem.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 2, fingerprint.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 3, to_string(mode), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(s) == SQLITE_ROW) {
        DepEntryRecord e;
        e.ecosystem = column_text(s, 0);
        e.fingerprint = column_text(s, 1);
        e.install_mode = mode_from_column(column_text(s, 2));
        e.path = column_text(s, 3);
        e.content_hash = column_text(s, 4);
        e.created_at = sqlite3_column_int64(s, 5);
        return Result<DepEntryRecord>::ok(std::move(e));
    }

    return KilnError(KilnError::NotFound,
        "No dependency entry for " + ecosystem + "/" + fingerprint.substr(0, 12));
}

Status ArtifactStore::remove_dep(const std::string& ecosystem,
                                 const std::string& fingerprint,
                                 InstallMode mode) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    KILN_TRY(impl_->require_open());
    KILN_TRY(impl_->prepare(
        "DELETE FROM dep_entry WHERE ecosystem=? AND fingerprint=? AND mode=?",
        impl_->stmt_remove_dep));

    sqlite3_stmt* s = impl_->stmt_remove_dep;
    sqlite3_reset(s);
    sqlite3_bind_text(s, 1, ecosystem.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 2, fingerprint.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 3, to_string(mode), -1, SQLITE_TRANSIENT);
    return impl_->step_done(s, "remove dependency entry");
}

Result<std::vector<DepEntryRecord>> ArtifactStore::list_deps() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    KILN_TRY(impl_->require_open());

    sqlite3_stmt* s = nullptr;
    KILN_TRY(impl_->prepare(
        "SELECT ecosystem, fingerprint, mode, path, content_hash, created_at "
        "FROM dep_entry ORDER BY ecosystem, created_at", s));

    std::vector<DepEntryRecord> out;
    while (sqlite3_step(s) == SQLITE_ROW) {
        DepEntryRecord e;
        e.ecosystem = column_text(s, 0);
        e.fingerprint = column_text(s, 1);
        e.install_mode = mode_from_column(column_text(s, 2));
        e.path = column_text(s, 3);
        e.content_hash = column_text(s, 4);
        e.created_at = sqlite3_column_int64(s, 5);
        out.push_back(std::move(e));
    }
    sqlite3_finalize(s);
    return Result<std::vector<DepEntryRecord>>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// Build artifacts
// ---------------------------------------------------------------------------

Status ArtifactStore::record_artifact(const ArtifactRecord& artifact) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    KILN_TRY(impl_->require_open());
    KILN_TRY(impl_->prepare(
        "INSERT OR REPLACE INTO artifact "
        "(service, environment, output_kind, produced_at, content_hash, path) "
        "VALUES (?, ?, ?, ?, ?, ?)",
        impl_->stmt_record_artifact));

    sqlite3_stmt* s = impl_->stmt_record_artifact;
    sqlite3_reset(s);
    sqlite3_bind_text(s, 1, artifact.service.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 2, artifact.environment.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 3, to_string(artifact.output_kind), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(s, 4, artifact.produced_at);
    sqlite3_bind_text(s, 5, artifact.content_hash.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 6, artifact.path.c_str(), -1, SQLITE_TRANSIENT);
    return impl_->step_done(s, "record artifact");
}

Result<ArtifactRecord> ArtifactStore::latest_artifact(const std::string& service,
                                                      const std::string& environment,
                                                      OutputKind kind) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    KILN_TRY(impl_->require_open());
    KILN_TRY(impl_->prepare(
        "SELECT service, environment, output_kind, produced_at, content_hash, path "
        "FROM artifact WHERE service=? AND environment=? AND output_kind=?",
        impl_->stmt_latest_artifact));

    sqlite3_stmt* s = impl_->stmt_latest_artifact;
    sqlite3_reset(s);
    sqlite3_bind_text(s, 1, service.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 2, environment.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 3, to_string(kind), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(s) == SQLITE_ROW) {
        ArtifactRecord a;
        a.service = column_text(s, 0);
        a.environment = column_text(s, 1);
        a.output_kind = kind_from_column(column_text(s, 2));
        a.produced_at = sqlite3_column_int64(s, 3);
        a.content_hash = column_text(s, 4);
        a.path = column_text(s, 5);
        return Result<ArtifactRecord>::ok(std::move(a));
    }

    return KilnError(KilnError::NotFound,
        "No " + std::string(to_string(kind)) + " artifact for " + service + "/" + environment);
}

Result<std::vector<ArtifactRecord>> ArtifactStore::list_artifacts() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    KILN_TRY(impl_->require_open());

    sqlite3_stmt* s = nullptr;
    KILN_TRY(impl_->prepare(
        "SELECT service, environment, output_kind, produced_at, content_hash, path "
        "FROM artifact ORDER BY service, environment, output_kind", s));

    std::vector<ArtifactRecord> out;
    while (sqlite3_step(s) == SQLITE_ROW) {
        ArtifactRecord a;
        a.service = column_text(s, 0);
        a.environment = column_text(s, 1);
        a.output_kind = kind_from_column(column_text(s, 2));
        a.produced_at = sqlite3_column_int64(s, 3);
        a.content_hash = column_text(s, 4);
        a.path = column_text(s, 5);
        out.push_back(std::move(a));
    }
    sqlite3_finalize(s);
    return Result<std::vector<ArtifactRecord>>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// Image tags
// ---------------------------------------------------------------------------

Status ArtifactStore::record_tag(const ImageTagRecord& tag) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    KILN_TRY(impl_->require_open());
    KILN_TRY(impl_->prepare(
        "INSERT OR REPLACE INTO image_tag "
        "(tag, service, environment, content_hash, created_at) "
        "VALUES (?, ?, ?, ?, ?)",
        impl_->stmt_record_tag));

    sqlite3_stmt* s = impl_->stmt_record_tag;
    sqlite3_reset(s);
    sqlite3_bind_text(s, 1, tag.tag.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 2, tag.service.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 3, tag.environment.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 4, tag.content_hash.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(s, 5, tag.created_at);
    return impl_->step_done(s, "record image tag");
}

Result<std::vector<ImageTagRecord>> ArtifactStore::list_tags() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    KILN_TRY(impl_->require_open());

    sqlite3_stmt* s = nullptr;
    KILN_TRY(impl_->prepare(
        "SELECT tag, service, environment, content_hash, created_at "
        "FROM image_tag ORDER BY created_at, tag", s));

    std::vector<ImageTagRecord> out;
    while (sqlite3_step(s) == SQLITE_ROW) {
        ImageTagRecord t;
        t.tag = column_text(s, 0);
        t.service = column_text(s, 1);
        t.environment = column_text(s, 2);
        t.content_hash = column_text(s, 3);
        t.created_at = sqlite3_column_int64(s, 4);
        out.push_back(std::move(t));
    }
    sqlite3_finalize(s);
    return Result<std::vector<ImageTagRecord>>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// Maintenance
// ---------------------------------------------------------------------------

Result<StoreStats> ArtifactStore::stats() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    KILN_TRY(impl_->require_open());
    StoreStats stats;

    auto count_table = [&](const char* table, int64_t& out) -> Status {
        std::string sql = std::string("SELECT COUNT(*) FROM ") + table;
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(impl_->db, sql.c_str(), -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            if (stmt) sqlite3_finalize(stmt);
            return KilnError(KilnError::IO,
                std::string("Failed to count ") + table);
        }
        rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            out = sqlite3_column_int64(stmt, 0);
        }
        sqlite3_finalize(stmt);
        return ok_status();
    };

    KILN_TRY(count_table("dep_entry", stats.dep_entry_count));
    KILN_TRY(count_table("artifact", stats.artifact_count));
    KILN_TRY(count_table("image_tag", stats.image_tag_count));

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(impl_->db,
        "SELECT page_count * page_size FROM pragma_page_count(), pragma_page_size()",
        -1, &stmt, nullptr);
    if (rc == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            stats.total_bytes = sqlite3_column_int64(stmt, 0);
        }
        sqlite3_finalize(stmt);
    } else {
        if (stmt) sqlite3_finalize(stmt);
    }

    return Result<StoreStats>::ok(std::move(stats));
}

Status ArtifactStore::clear() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    KILN_TRY(impl_->require_open());
    return impl_->exec(
        "DELETE FROM dep_entry;"
        "DELETE FROM artifact;"
        "DELETE FROM image_tag;"
    );
}

Result<int> ArtifactStore::prune() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    KILN_TRY(impl_->require_open());

    // Collect vanished paths first; deleting while stepping the same
    // table is not allowed
    struct Row { const char* table; std::string path; };
    std::vector<Row> dead;
    for (const char* table : {"dep_entry", "artifact"}) {
        std::string sql = std::string("SELECT DISTINCT path FROM ") + table;
        sqlite3_stmt* s = nullptr;
        KILN_TRY(impl_->prepare(sql.c_str(), s));
        while (sqlite3_step(s) == SQLITE_ROW) {
            std::string path = column_text(s, 0);
            std::error_code ec;
            if (!fs::exists(path, ec)) dead.push_back({table, path});
        }
        sqlite3_finalize(s);
    }

    int removed = 0;
    for (const auto& row : dead) {
        std::string sql = std::string("DELETE FROM ") + row.table + " WHERE path=?";
        sqlite3_stmt* s = nullptr;
        KILN_TRY(impl_->prepare(sql.c_str(), s));
        sqlite3_bind_text(s, 1, row.path.c_str(), -1, SQLITE_TRANSIENT);
        auto done = impl_->step_done(s, "prune");
        sqlite3_finalize(s);
        KILN_TRY(done);
        removed += sqlite3_changes(impl_->db);
    }
    return Result<int>::ok(removed);
}

} // namespace kiln
