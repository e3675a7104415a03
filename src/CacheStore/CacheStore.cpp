// === src/CacheStore/CacheStore.cpp ===
#include "CacheStore.hpp"
#include "IntegrityError.hpp"
#include "Logger.hpp"
#include "SqliteUtil.hpp"

#include <ctime>
#include <utility>

#define CACHE_KIND "lookup_cache"

static const char* kCacheSchemaSQL = R"SQL(
CREATE TABLE IF NOT EXISTS meta (
  key   TEXT PRIMARY KEY,
  value TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS lookup_cache (
  hash         BLOB PRIMARY KEY CHECK (length(hash) = 32),
  algorithm    TEXT NOT NULL DEFAULT 'sha256',
  verdict      INTEGER NOT NULL,
  trust_score  INTEGER,
  entry_time   INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_lookup_entry_time ON lookup_cache(entry_time);

INSERT OR IGNORE INTO meta(key, value) VALUES ('store_kind', 'lookup_cache');
INSERT OR IGNORE INTO meta(key, value) VALUES ('schema_version', '1');
)SQL";

const char* verdict_name(Verdict v) {
    switch (v) {
        case Verdict::Known:      return "known";
        case Verdict::Unknown:    return "unknown";
        case Verdict::Unresolved: return "unresolved";
    }
    return "?";
}

CacheStore::CacheStore(std::string location, sqlite3* db)
    : location_(std::move(location)) {
    db_.reset(db);
}

// Desc: open/init SQLite cache DB and apply schema
// In: const std::string& location
// Out: std::unique_ptr<CacheStore>; throws on open failure or foreign schema
std::unique_ptr<CacheStore> CacheStore::open(const std::string& location) {
    std::string err;
    sqlite3* raw = open_sqlite(location, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, err);
    if (!raw) throw IntegrityError(ErrorKind::StoreWriteFailed, "[cache] " + err);
    std::unique_ptr<CacheStore> cache(new CacheStore(location, raw));
    sqlite3* db = cache->db_.get();

    // a pre-existing file must already be a cache of this version
    const auto kind = read_meta(db, "store_kind");
    if (kind) {
        require_schema(db, location, CACHE_KIND, kSchemaVersion);
    } else {
        Stmt probe = prepare_or_throw(db, "SELECT count(*) FROM sqlite_master;", ErrorKind::SchemaMismatch);
        if (sqlite3_step(probe.get()) != SQLITE_ROW) {
            throw IntegrityError(ErrorKind::SchemaMismatch,
                                 location + " is not a lookup cache (" + sqlite3_errmsg(db) + ")");
        }
        if (sqlite3_column_int64(probe.get(), 0) != 0) {
            throw IntegrityError(ErrorKind::SchemaMismatch, location + " is not a lookup cache");
        }
    }

    apply_store_pragmas(db, /*wal=*/true);
    exec_or_throw(db, kCacheSchemaSQL, ErrorKind::StoreWriteFailed);
    log_debug("CacheStore", "opened " + location);
    return cache;
}

// Desc: look up a cached verdict
// In: const Digest& hash
// Out: std::optional<CacheEntry> (nullopt on miss); throws StoreReadFailed
std::optional<CacheEntry> CacheStore::get(const Digest& hash) const {
    std::lock_guard<std::mutex> lk(mu_);
    Stmt s = prepare_or_throw(db_.get(),
        "SELECT verdict, trust_score, entry_time FROM lookup_cache WHERE hash=?;",
        ErrorKind::StoreReadFailed);
    sqlite3_bind_blob(s.get(), 1, hash.data(), static_cast<int>(hash.size()), SQLITE_TRANSIENT);

    const int rc = sqlite3_step(s.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) {
        throw IntegrityError(ErrorKind::StoreReadFailed,
                             std::string("[cache] lookup failed: ") + sqlite3_errmsg(db_.get()));
    }

    CacheEntry e;
    const int v = sqlite3_column_int(s.get(), 0);
    if (v == static_cast<int>(Verdict::Known))        e.verdict = Verdict::Known;
    else if (v == static_cast<int>(Verdict::Unknown)) e.verdict = Verdict::Unknown;
    else return std::nullopt; // unresolved rows are never written; treat as miss
    if (sqlite3_column_type(s.get(), 1) != SQLITE_NULL) e.trust_score = sqlite3_column_int(s.get(), 1);
    e.entry_time = static_cast<int64_t>(sqlite3_column_int64(s.get(), 2));
    return e;
}

// Desc: persist one verdict (INSERT OR REPLACE)
// In: const Digest& hash, const CacheEntry& entry
// Out: void; throws StoreWriteFailed
void CacheStore::put(const Digest& hash, const CacheEntry& entry) {
    if (entry.verdict == Verdict::Unresolved) {
        throw IntegrityError(ErrorKind::StoreWriteFailed, "[cache] refusing to cache an unresolved verdict");
    }
    std::lock_guard<std::mutex> lk(mu_);

    #ifdef DEBUG
    log_trace("CacheStore", "put " + digest_to_hex(hash) + " verdict=" + verdict_name(entry.verdict));
    #endif

    Stmt s = prepare_or_throw(db_.get(),
        "INSERT OR REPLACE INTO lookup_cache (hash, algorithm, verdict, trust_score, entry_time) "
        "VALUES (?, 'sha256', ?, ?, ?);", ErrorKind::StoreWriteFailed);
    const int64_t ts = entry.entry_time ? entry.entry_time : static_cast<int64_t>(::time(nullptr));
    sqlite3_bind_blob(s.get(), 1, hash.data(), static_cast<int>(hash.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int(s.get(), 2, static_cast<int>(entry.verdict));
    if (entry.trust_score) sqlite3_bind_int(s.get(), 3, *entry.trust_score);
    else                   sqlite3_bind_null(s.get(), 3);
    sqlite3_bind_int64(s.get(), 4, static_cast<sqlite3_int64>(ts));

    if (sqlite3_step(s.get()) != SQLITE_DONE) {
        throw IntegrityError(ErrorKind::StoreWriteFailed,
                             std::string("[cache] insert failed: ") + sqlite3_errmsg(db_.get()));
    }
}

uint64_t CacheStore::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    Stmt s = prepare_or_throw(db_.get(), "SELECT COUNT(*) FROM lookup_cache;", ErrorKind::StoreReadFailed);
    if (sqlite3_step(s.get()) != SQLITE_ROW) {
        throw IntegrityError(ErrorKind::StoreReadFailed,
                             std::string("[cache] count failed: ") + sqlite3_errmsg(db_.get()));
    }
    return static_cast<uint64_t>(sqlite3_column_int64(s.get(), 0));
}

// Desc: delete entries older than the cutoff in one transaction
// In: int64_t cutoff_epoch_sec
// Out: uint64_t (rows deleted)
uint64_t CacheStore::purge_older_than(int64_t cutoff_epoch_sec) {
    std::lock_guard<std::mutex> lk(mu_);
    sqlite3* db = db_.get();
    exec_or_throw(db, "BEGIN IMMEDIATE;", ErrorKind::StoreWriteFailed);
    try {
        Stmt del = prepare_or_throw(db, "DELETE FROM lookup_cache WHERE entry_time < ?;",
                                    ErrorKind::StoreWriteFailed);
        sqlite3_bind_int64(del.get(), 1, static_cast<sqlite3_int64>(cutoff_epoch_sec));
        if (sqlite3_step(del.get()) != SQLITE_DONE) {
            throw IntegrityError(ErrorKind::StoreWriteFailed,
                                 std::string("[cache] purge failed: ") + sqlite3_errmsg(db));
        }
        const uint64_t removed = static_cast<uint64_t>(sqlite3_changes(db));
        del.reset();
        exec_or_throw(db, "COMMIT;", ErrorKind::StoreWriteFailed);
        return removed;
    } catch (...) {
        (void)sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
}
