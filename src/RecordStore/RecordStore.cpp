// === src/RecordStore/RecordStore.cpp ===
#include "RecordStore.hpp"
#include "IntegrityError.hpp"
#include "Logger.hpp"
#include "SqliteUtil.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

#define STORE_KIND "record_store"

// Create tables query
static const char* kRecordSchemaSQL = R"SQL(
CREATE TABLE IF NOT EXISTS meta (
  key   TEXT PRIMARY KEY,
  value TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS file_records (
  path          TEXT PRIMARY KEY,
  size          INTEGER NOT NULL,
  mtime_ns      INTEGER NOT NULL,
  mode          INTEGER NOT NULL,
  content_hash  BLOB NOT NULL CHECK (length(content_hash) = 32)
);
)SQL";

RecordStore::RecordStore(std::string location, sqlite3* db)
    : location_(std::move(location)) {
    db_.reset(db);
}

bool RecordStore::exists(const std::string& location) {
    struct stat st{};
    return ::stat(location.c_str(), &st) == 0;
}

std::vector<std::string> RecordStore::companion_paths(const std::string& location) {
    return { location + "-wal", location + "-shm", location + "-journal", location + ".tmp" };
}

static void remove_if_present(const std::string& path) {
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        throw IntegrityError(ErrorKind::StoreWriteFailed,
                             "cannot remove " + path + ": " + std::string(::strerror(errno)));
    }
}

// Desc: insert every record inside the caller's transaction
// In: sqlite3* db, const RecordSet& records, const RowCallback& on_row
// Out: uint64_t (rows written); throws StoreWriteFailed
static uint64_t insert_records(sqlite3* db, const RecordSet& records,
                               const RecordStore::RowCallback& on_row) {
    Stmt ins = prepare_or_throw(db,
        "INSERT INTO file_records (path, size, mtime_ns, mode, content_hash) "
        "VALUES (?, ?, ?, ?, ?);", ErrorKind::StoreWriteFailed);

    uint64_t rows = 0;
    for (const auto& kv : records) {
        const FileRecord& r = kv.second;
        sqlite3_bind_text(ins.get(), 1, kv.first.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(ins.get(), 2, static_cast<sqlite3_int64>(r.size));
        sqlite3_bind_int64(ins.get(), 3, static_cast<sqlite3_int64>(r.mtime_ns));
        sqlite3_bind_int64(ins.get(), 4, static_cast<sqlite3_int64>(r.mode));
        sqlite3_bind_blob(ins.get(), 5, r.content_hash.data(),
                          static_cast<int>(r.content_hash.size()), SQLITE_TRANSIENT);
        if (sqlite3_step(ins.get()) != SQLITE_DONE) {
            throw IntegrityError(ErrorKind::StoreWriteFailed,
                                 "insert " + kv.first + " failed: " + sqlite3_errmsg(db));
        }
        sqlite3_reset(ins.get());
        sqlite3_clear_bindings(ins.get());
        ++rows;
        if (on_row) on_row(rows);
    }
    return rows;
}

// Desc: build a complete store next to `location`, then rename over it
// In: location, overwrite, optional initial RecordSet
// Out: std::unique_ptr<RecordStore> opened on `location`
std::unique_ptr<RecordStore> RecordStore::open_or_create(const std::string& location,
                                                         bool overwrite,
                                                         const RecordSet* initial) {
    if (exists(location) && !overwrite) {
        throw IntegrityError(ErrorKind::StoreAlreadyExists, "database " + location + " already exists");
    }

    const std::string tmp = location + ".tmp";
    remove_if_present(tmp);
    remove_if_present(tmp + "-journal");

    {
        std::string err;
        sqlite3* raw = open_sqlite(tmp, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, err);
        if (!raw) throw IntegrityError(ErrorKind::StoreWriteFailed, "[" + tmp + "] " + err);
        std::unique_ptr<sqlite3, void(*)(sqlite3*)> db(raw, [](sqlite3* p){ if (p) sqlite3_close(p); });
        apply_store_pragmas(db.get(), /*wal=*/false);

        try {
            exec_or_throw(db.get(), "BEGIN IMMEDIATE;", ErrorKind::StoreWriteFailed);
            exec_or_throw(db.get(), kRecordSchemaSQL, ErrorKind::StoreWriteFailed);
            const std::string now = std::to_string(static_cast<long long>(::time(nullptr)));
            write_meta(db.get(), "store_kind", STORE_KIND, ErrorKind::StoreWriteFailed);
            write_meta(db.get(), "schema_version", std::to_string(kSchemaVersion), ErrorKind::StoreWriteFailed);
            write_meta(db.get(), "created_at", now, ErrorKind::StoreWriteFailed);
            write_meta(db.get(), "generation_ts", now, ErrorKind::StoreWriteFailed);
            write_meta(db.get(), "generation", initial ? "1" : "0", ErrorKind::StoreWriteFailed);
            if (initial) insert_records(db.get(), *initial, RowCallback());
            exec_or_throw(db.get(), "COMMIT;", ErrorKind::StoreWriteFailed);
        } catch (const IntegrityError&) {
            (void)sqlite3_exec(db.get(), "ROLLBACK;", nullptr, nullptr, nullptr);
            db.reset();
            (void)::unlink(tmp.c_str());
            throw;
        }
        if (sqlite3_close(db.release()) != SQLITE_OK) {
            throw IntegrityError(ErrorKind::StoreWriteFailed, "closing " + tmp + " failed");
        }
    }

    // sidecars of a replaced store would be replayed against the new file
    remove_if_present(location + "-wal");
    remove_if_present(location + "-shm");
    remove_if_present(location + "-journal");
    if (::rename(tmp.c_str(), location.c_str()) != 0) {
        const std::string e = ::strerror(errno);
        (void)::unlink(tmp.c_str());
        throw IntegrityError(ErrorKind::StoreWriteFailed, "rename " + tmp + " -> " + location + ": " + e);
    }
    log_debug("RecordStore", "created " + location);
    return open(location);
}

// Desc: open and validate an existing store
// In: const std::string& location
// Out: std::unique_ptr<RecordStore>; throws StoreNotFound / SchemaMismatch / StoreReadFailed
std::unique_ptr<RecordStore> RecordStore::open(const std::string& location) {
    if (!exists(location)) {
        throw IntegrityError(ErrorKind::StoreNotFound, "database " + location + " not found");
    }
    std::string err;
    sqlite3* raw = open_sqlite(location, SQLITE_OPEN_READWRITE, err);
    if (!raw) throw IntegrityError(ErrorKind::StoreReadFailed, "[" + location + "] " + err);

    std::unique_ptr<RecordStore> store(new RecordStore(location, raw));
    store->validate_schema();
    apply_store_pragmas(store->db_.get(), /*wal=*/true);
    return store;
}

void RecordStore::validate_schema() const {
    require_schema(db_.get(), location_, STORE_KIND, kSchemaVersion);
    Stmt s = prepare_or_throw(db_.get(),
        "SELECT path, size, mtime_ns, mode, content_hash FROM file_records LIMIT 0;",
        ErrorKind::SchemaMismatch);
}

// Desc: load every record of the current generation
// In: (none)
// Out: RecordSet; throws StoreReadFailed
RecordSet RecordStore::read() const {
    Stmt s = prepare_or_throw(db_.get(),
        "SELECT path, size, mtime_ns, mode, content_hash FROM file_records;",
        ErrorKind::StoreReadFailed);

    RecordSet out;
    int rc;
    while ((rc = sqlite3_step(s.get())) == SQLITE_ROW) {
        FileRecord r;
        const unsigned char* p = sqlite3_column_text(s.get(), 0);
        r.path     = p ? reinterpret_cast<const char*>(p) : "";
        r.size     = static_cast<uint64_t>(sqlite3_column_int64(s.get(), 1));
        r.mtime_ns = static_cast<int64_t>(sqlite3_column_int64(s.get(), 2));
        r.mode     = static_cast<uint32_t>(sqlite3_column_int64(s.get(), 3));
        const void* blob = sqlite3_column_blob(s.get(), 4);
        const int   blen = sqlite3_column_bytes(s.get(), 4);
        if (!blob || blen != static_cast<int>(r.content_hash.size())) {
            throw IntegrityError(ErrorKind::StoreReadFailed, "corrupt hash for " + r.path);
        }
        std::memcpy(r.content_hash.data(), blob, r.content_hash.size());
        std::string key = r.path;
        out.emplace(std::move(key), std::move(r));
    }
    if (rc != SQLITE_DONE) {
        throw IntegrityError(ErrorKind::StoreReadFailed,
                             "reading " + location_ + " failed: " + sqlite3_errmsg(db_.get()));
    }
    return out;
}

// Desc: atomically replace the stored RecordSet (all rows or none)
// In: const RecordSet& records, const RowCallback& on_row
// Out: void; throws StoreWriteFailed, store left at the previous generation
void RecordStore::write(const RecordSet& records, const RowCallback& on_row) {
    sqlite3* db = db_.get();
    exec_or_throw(db, "BEGIN IMMEDIATE;", ErrorKind::StoreWriteFailed);
    try {
        exec_or_throw(db, "DELETE FROM file_records;", ErrorKind::StoreWriteFailed);
        const uint64_t rows = insert_records(db, records, on_row);

        const auto gen = read_meta(db, "generation");
        const long long next_gen = (gen ? std::strtoll(gen->c_str(), nullptr, 10) : 0) + 1;
        write_meta(db, "generation", std::to_string(next_gen), ErrorKind::StoreWriteFailed);
        write_meta(db, "generation_ts", std::to_string(static_cast<long long>(::time(nullptr))),
                   ErrorKind::StoreWriteFailed);
        exec_or_throw(db, "COMMIT;", ErrorKind::StoreWriteFailed);

        log_debug("RecordStore", "wrote " + std::to_string(rows) + " records, generation " +
                  std::to_string(next_gen));
    } catch (...) {
        (void)sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
}

StoreMetadata RecordStore::metadata() const {
    StoreMetadata m;
    if (auto v = read_meta(db_.get(), "schema_version")) m.schema_version = std::atoi(v->c_str());
    if (auto v = read_meta(db_.get(), "created_at"))     m.created_at     = std::strtoll(v->c_str(), nullptr, 10);
    if (auto v = read_meta(db_.get(), "generation_ts"))  m.generation_ts  = std::strtoll(v->c_str(), nullptr, 10);
    if (auto v = read_meta(db_.get(), "generation"))     m.generation     = std::strtoll(v->c_str(), nullptr, 10);

    Stmt s = prepare_or_throw(db_.get(), "SELECT COUNT(*) FROM file_records;", ErrorKind::StoreReadFailed);
    if (sqlite3_step(s.get()) == SQLITE_ROW) {
        m.record_count = static_cast<uint64_t>(sqlite3_column_int64(s.get(), 0));
    }
    return m;
}
