#include <ferry/cache.hpp>
#include <ferry/file_io.hpp>
#include <ferry/log.hpp>
#include <ferry/sha256.hpp>

#include <sqlite3.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <mutex>
#include <set>
#include <vector>

namespace fs = std::filesystem;

namespace ferry {

static const std::string SCHEMA_VERSION = "1";

namespace {

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

int64_t now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

// ---------------------------------------------------------------------------
// Impl: SQLite index
// ---------------------------------------------------------------------------

struct ModuleCache::Impl {
    sqlite3* db = nullptr;
    fs::path root;
    std::mutex mutex;

    // Prepared statements (lazily initialized, cached)
    sqlite3_stmt* stmt_lookup = nullptr;
    sqlite3_stmt* stmt_store = nullptr;
    sqlite3_stmt* stmt_remove = nullptr;
    sqlite3_stmt* stmt_hash_refs = nullptr;
    sqlite3_stmt* stmt_keys_with_prefix = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_lookup);
        fin(stmt_store);
        fin(stmt_remove);
        fin(stmt_hash_refs);
        fin(stmt_keys_with_prefix);
    }

    Status prepare(const char* sql, sqlite3_stmt*& out) {
        if (out) return ok_status();
        int rc = sqlite3_prepare_v2(db, sql, -1, &out, nullptr);
        if (rc != SQLITE_OK) {
            return FerryError(FerryError::IO,
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
            return FerryError(FerryError::IO, "SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    Status write_schema_version() {
        std::string sql = "INSERT OR REPLACE INTO schema_info (key, value) "
            "VALUES ('version', '" + SCHEMA_VERSION + "');";
        return exec(sql.c_str());
    }

    Status init_schema() {
        FERRY_TRY(exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS module ("
            "  key TEXT PRIMARY KEY,"
            "  hash TEXT NOT NULL,"
            "  size INTEGER,"
            "  fetched_at INTEGER"
            ");"
            "CREATE INDEX IF NOT EXISTS module_hash ON module(hash);"
        ));

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db,
            "SELECT value FROM schema_info WHERE key='version'", -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            if (stmt) sqlite3_finalize(stmt);
            return FerryError(FerryError::IO,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
        rc = sqlite3_step(stmt);
        if (rc != SQLITE_ROW) {
            sqlite3_finalize(stmt);
            return write_schema_version();
        }
        std::string ver = column_text(stmt, 0);
        sqlite3_finalize(stmt);
        if (ver != SCHEMA_VERSION) {
            log::info("module cache schema %s is outdated, resetting index", ver.c_str());
            FERRY_TRY(exec("DELETE FROM module;"));
            FERRY_TRY(write_schema_version());
        }
        return ok_status();
    }

    Status require_open() const {
        if (!db) return FerryError(FerryError::IO, "module cache is not open");
        return ok_status();
    }

    // Blob files left behind by interrupted writes
    void sweep_temp_files() {
        std::error_code ec;
        fs::path blobs = root / "blobs";
        if (!fs::is_directory(blobs, ec)) return;
        std::vector<fs::path> stale;
        for (auto it = fs::recursive_directory_iterator(blobs, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file() && is_temp_file(it->path())) stale.push_back(it->path());
        }
        for (const auto& p : stale) {
            std::error_code rm_ec;
            fs::remove(p, rm_ec);
            log::debug("removed stale cache file %s", p.c_str());
        }
    }

    Result<CacheEntry> lookup_locked(const std::string& key) {
        FERRY_TRY(require_open());
        FERRY_TRY(prepare(
            "SELECT key, hash, size, fetched_at FROM module WHERE key = ?",
            stmt_lookup));

        sqlite3_reset(stmt_lookup);
        sqlite3_bind_text(stmt_lookup, 1, key.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(stmt_lookup);
        if (rc == SQLITE_ROW) {
            CacheEntry e;
            e.key = column_text(stmt_lookup, 0);
            e.hash = column_text(stmt_lookup, 1);
            e.size = sqlite3_column_int64(stmt_lookup, 2);
            e.fetched_at = sqlite3_column_int64(stmt_lookup, 3);
            return Result<CacheEntry>::ok(std::move(e));
        }
        if (rc != SQLITE_DONE) {
            return FerryError(FerryError::IO,
                std::string("cache lookup failed: ") + sqlite3_errmsg(db));
        }
        return FerryError(FerryError::NotFound, key + " is not in the module cache");
    }

    Result<int64_t> hash_refs_locked(const std::string& hash) {
        FERRY_TRY(prepare("SELECT COUNT(*) FROM module WHERE hash = ?", stmt_hash_refs));
        sqlite3_reset(stmt_hash_refs);
        sqlite3_bind_text(stmt_hash_refs, 1, hash.c_str(), -1, SQLITE_TRANSIENT);
        int64_t count = 0;
        if (sqlite3_step(stmt_hash_refs) == SQLITE_ROW) {
            count = sqlite3_column_int64(stmt_hash_refs, 0);
        }
        return Result<int64_t>::ok(count);
    }
};

// ---------------------------------------------------------------------------
// ModuleCache public interface
// ---------------------------------------------------------------------------

ModuleCache::ModuleCache() : impl_(std::make_unique<Impl>()) {}
ModuleCache::~ModuleCache() = default;
ModuleCache::ModuleCache(ModuleCache&&) noexcept = default;
ModuleCache& ModuleCache::operator=(ModuleCache&&) noexcept = default;

fs::path ModuleCache::default_cache_root() {
    if (const char* dir = std::getenv("FERRY_DIR")) {
        if (*dir) return fs::path(dir);
    }
    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";
    return fs::path(home) / ".ferry" / "cache";
}

Status ModuleCache::open(const fs::path& root) {
    close();
    std::lock_guard<std::mutex> lock(impl_->mutex);

    std::error_code ec;
    fs::create_directories(root / "blobs", ec);
    if (ec) {
        return FerryError(FerryError::IO,
            "Failed to create cache directory: " + root.string() + ": " + ec.message());
    }
    impl_->root = root;

    std::string db_path = (root / "index.db").string();
    int rc = sqlite3_open(db_path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        // Corruption or invalid file: delete and retry
        std::string err_msg = impl_->db ? sqlite3_errmsg(impl_->db) : "unknown";
        if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }

        fs::remove(db_path, ec);
        rc = sqlite3_open(db_path.c_str(), &impl_->db);
        if (rc != SQLITE_OK) {
            if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
            return FerryError(FerryError::IO, "Failed to open cache index: " + err_msg);
        }
    }
    sqlite3_busy_timeout(impl_->db, 5000);

    auto setup = [&]() -> Status {
        FERRY_TRY(impl_->exec(
            "PRAGMA journal_mode=WAL;"
            "PRAGMA synchronous=NORMAL;"
        ));
        FERRY_TRY(impl_->init_schema());
        return ok_status();
    };

    auto setup_result = setup();
    if (setup_result.is_err()) {
        log::warn("module cache index is corrupt, recreating: %s",
                  setup_result.error().message.c_str());
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        fs::remove(db_path, ec);
        fs::remove(db_path + "-wal", ec);
        fs::remove(db_path + "-shm", ec);
        rc = sqlite3_open(db_path.c_str(), &impl_->db);
        if (rc != SQLITE_OK) {
            if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
            return FerryError(FerryError::IO, "Failed to recreate cache index");
        }
        FERRY_TRY(setup());
    }

    impl_->sweep_temp_files();
    log::debug("module cache at %s", root.c_str());
    return ok_status();
}

void ModuleCache::close() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->db) {
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool ModuleCache::is_open() const {
    return impl_->db != nullptr;
}

const fs::path& ModuleCache::root() const {
    return impl_->root;
}

fs::path ModuleCache::blob_path(const std::string& hash) const {
    return impl_->root / "blobs" / hash.substr(0, 2) / hash;
}

// ---------------------------------------------------------------------------
// Entries
// ---------------------------------------------------------------------------

Result<CacheEntry> ModuleCache::lookup(const std::string& key) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->lookup_locked(key);
}

bool ModuleCache::contains(const std::string& key) {
    auto entry = lookup(key);
    if (entry.is_err()) return false;
    std::error_code ec;
    return fs::is_regular_file(blob_path(entry.value().hash), ec);
}

Result<std::string> ModuleCache::read(const std::string& key) {
    auto entry = lookup(key);
    if (entry.is_err()) return std::move(entry).error();

    const std::string& hash = entry.value().hash;
    auto content = read_file(blob_path(hash));
    if (content.is_err()) {
        return FerryError(FerryError::NotFound,
            key + " is indexed but its cache blob is missing");
    }
    if (sha256_hex(content.value()) != hash) {
        log::warn("cache blob for %s does not match its hash, ignoring it", key.c_str());
        return FerryError(FerryError::NotFound, key + " has a damaged cache blob");
    }
    return content;
}

Result<CacheEntry> ModuleCache::store(const std::string& key, const std::string& content) {
    CacheEntry e;
    e.key = key;
    e.hash = sha256_hex(content);
    e.size = static_cast<int64_t>(content.size());
    e.fetched_at = now_seconds();

    fs::path blob = blob_path(e.hash);
    std::error_code ec;
    if (!fs::is_regular_file(blob, ec)) {
        FERRY_TRY(write_file_atomic(blob, content));
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);
    FERRY_TRY(impl_->require_open());
    FERRY_TRY(impl_->prepare(
        "INSERT OR REPLACE INTO module (key, hash, size, fetched_at) VALUES (?, ?, ?, ?)",
        impl_->stmt_store));

    sqlite3_reset(impl_->stmt_store);
    sqlite3_bind_text(impl_->stmt_store, 1, e.key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(impl_->stmt_store, 2, e.hash.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(impl_->stmt_store, 3, e.size);
    sqlite3_bind_int64(impl_->stmt_store, 4, e.fetched_at);

    int rc = sqlite3_step(impl_->stmt_store);
    if (rc != SQLITE_DONE) {
        return FerryError(FerryError::IO,
            std::string("Failed to index ") + key + ": " + sqlite3_errmsg(impl_->db));
    }
    return Result<CacheEntry>::ok(std::move(e));
}

Status ModuleCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto entry = impl_->lookup_locked(key);
    if (entry.is_err()) return std::move(entry).error();

    FERRY_TRY(impl_->prepare("DELETE FROM module WHERE key = ?", impl_->stmt_remove));
    sqlite3_reset(impl_->stmt_remove);
    sqlite3_bind_text(impl_->stmt_remove, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(impl_->stmt_remove) != SQLITE_DONE) {
        return FerryError(FerryError::IO,
            std::string("Failed to remove ") + key + ": " + sqlite3_errmsg(impl_->db));
    }

    // Blobs are shared by keys with identical content
    auto refs = impl_->hash_refs_locked(entry.value().hash);
    if (refs.is_ok() && refs.value() == 0) {
        std::error_code ec;
        fs::remove(blob_path(entry.value().hash), ec);
    }
    return ok_status();
}

Status ModuleCache::clear() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    FERRY_TRY(impl_->require_open());
    FERRY_TRY(impl_->exec("DELETE FROM module;"));

    std::error_code ec;
    fs::remove_all(impl_->root / "blobs", ec);
    if (ec) {
        return FerryError(FerryError::IO,
            "Failed to remove cache blobs: " + ec.message());
    }
    fs::create_directories(impl_->root / "blobs", ec);
    return ok_status();
}

Result<std::vector<CacheEntry>> ModuleCache::entries() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    FERRY_TRY(impl_->require_open());

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(impl_->db,
        "SELECT key, hash, size, fetched_at FROM module ORDER BY key", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt) sqlite3_finalize(stmt);
        return FerryError(FerryError::IO, "Failed to list cache entries");
    }

    std::vector<CacheEntry> out;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        CacheEntry e;
        e.key = column_text(stmt, 0);
        e.hash = column_text(stmt, 1);
        e.size = sqlite3_column_int64(stmt, 2);
        e.fetched_at = sqlite3_column_int64(stmt, 3);
        out.push_back(std::move(e));
    }
    sqlite3_finalize(stmt);
    return Result<std::vector<CacheEntry>>::ok(std::move(out));
}

Result<CacheStats> ModuleCache::stats() {
    auto all = entries();
    if (all.is_err()) return std::move(all).error();

    CacheStats stats;
    std::set<std::string> hashes;
    for (const auto& e : all.value()) {
        stats.entry_count++;
        if (hashes.insert(e.hash).second) stats.content_bytes += e.size;
    }
    stats.blob_count = static_cast<int64_t>(hashes.size());

    std::lock_guard<std::mutex> lock(impl_->mutex);
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(impl_->db,
        "SELECT page_count * page_size FROM pragma_page_count(), pragma_page_size()",
        -1, &stmt, nullptr);
    if (rc == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            stats.index_bytes = sqlite3_column_int64(stmt, 0);
        }
        sqlite3_finalize(stmt);
    } else {
        if (stmt) sqlite3_finalize(stmt);
    }

    return Result<CacheStats>::ok(std::move(stats));
}

Result<std::vector<Version>> ModuleCache::versions_cached(const std::string& package_key) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    FERRY_TRY(impl_->require_open());

    std::string prefix = package_key + "@";
    FERRY_TRY(impl_->prepare(
        "SELECT key FROM module WHERE substr(key, 1, ?) = ?",
        impl_->stmt_keys_with_prefix));
    sqlite3_reset(impl_->stmt_keys_with_prefix);
    sqlite3_bind_int(impl_->stmt_keys_with_prefix, 1, static_cast<int>(prefix.size()));
    sqlite3_bind_text(impl_->stmt_keys_with_prefix, 2, prefix.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<Version> out;
    while (sqlite3_step(impl_->stmt_keys_with_prefix) == SQLITE_ROW) {
        std::string rest = column_text(impl_->stmt_keys_with_prefix, 0).substr(prefix.size());
        auto v = Version::parse(rest.substr(0, rest.find('/')));
        if (v.is_err()) continue;
        if (std::find(out.begin(), out.end(), v.value()) == out.end()) {
            out.push_back(std::move(v).value());
        }
    }
    return Result<std::vector<Version>>::ok(std::move(out));
}

} // namespace ferry
