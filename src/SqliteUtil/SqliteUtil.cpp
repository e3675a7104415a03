// === src/SqliteUtil/SqliteUtil.cpp ===
#include "SqliteUtil.hpp"
#include "Logger.hpp"

#include <cstdlib>

Stmt prepare_or_throw(sqlite3* db, const char* sql, ErrorKind kind) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
        if (raw) sqlite3_finalize(raw);
        throw IntegrityError(kind, std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
    }
    return Stmt(raw);
}

void exec_or_throw(sqlite3* db, const char* sql, ErrorKind kind) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string e = err ? err : sqlite3_errmsg(db);
        if (err) sqlite3_free(err);
        throw IntegrityError(kind, "sqlite exec failed: " + e);
    }
}

// Desc: open SQLite DB with the given flags
// In: const std::string& path, int flags, std::string& error
// Out: sqlite3* (nullptr on failure, error set)
sqlite3* open_sqlite(const std::string& path, int flags, std::string& error) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &raw, flags, nullptr);
    if (rc != SQLITE_OK) {
        error = std::string("sqlite open failed: ") + (raw ? sqlite3_errmsg(raw) : "unknown");
        if (raw) sqlite3_close(raw);
        return nullptr;
    }
    sqlite3_extended_result_codes(raw, 1);
    return raw;
}

static void run_pragma(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        log_debug("Sqlite", std::string(sql) + " failed: " + (err ? err : sqlite3_errmsg(db)));
        if (err) sqlite3_free(err);
    }
}

void apply_store_pragmas(sqlite3* db, bool wal) {
    sqlite3_busy_timeout(db, 5000);
    if (wal) {
        run_pragma(db, "PRAGMA journal_mode=WAL;");
        run_pragma(db, "PRAGMA synchronous=NORMAL;");
        sqlite3_wal_autocheckpoint(db, 512);
    } else {
        run_pragma(db, "PRAGMA synchronous=FULL;");
    }
}

std::optional<std::string> read_meta(sqlite3* db, const char* key) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT value FROM meta WHERE key=?", -1, &raw, nullptr) != SQLITE_OK) {
        if (raw) sqlite3_finalize(raw);
        return std::nullopt;
    }
    Stmt s(raw);
    sqlite3_bind_text(s.get(), 1, key, -1, SQLITE_TRANSIENT);
    if (sqlite3_step(s.get()) != SQLITE_ROW) return std::nullopt;
    const unsigned char* t = sqlite3_column_text(s.get(), 0);
    if (!t) return std::nullopt;
    return std::string(reinterpret_cast<const char*>(t));
}

void write_meta(sqlite3* db, const char* key, const std::string& value, ErrorKind kind) {
    Stmt u = prepare_or_throw(db, "INSERT OR REPLACE INTO meta(key,value) VALUES(?,?)", kind);
    sqlite3_bind_text(u.get(), 1, key, -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(u.get(), 2, value.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(u.get()) != SQLITE_DONE) {
        throw IntegrityError(kind, std::string("meta update failed: ") + sqlite3_errmsg(db));
    }
}

// Desc: verify the file is a store of the expected kind and version
// In: sqlite3* db, location, expected_kind, expected_version
// Out: void; throws IntegrityError(SchemaMismatch)
void require_schema(sqlite3* db, const std::string& location,
                    const char* expected_kind, int expected_version) {
    const auto kind = read_meta(db, "store_kind");
    if (!kind) {
        throw IntegrityError(ErrorKind::SchemaMismatch,
                             location + " is not a " + expected_kind + " (" + sqlite3_errmsg(db) + ")");
    }
    if (*kind != expected_kind) {
        throw IntegrityError(ErrorKind::SchemaMismatch,
                             location + " holds a " + *kind + ", expected " + expected_kind);
    }
    const auto ver = read_meta(db, "schema_version");
    const long v = ver ? std::strtol(ver->c_str(), nullptr, 10) : 0;
    if (v != expected_version) {
        throw IntegrityError(ErrorKind::SchemaMismatch,
                             location + " has schema version " + (ver ? *ver : std::string("?")) +
                             ", this build reads version " + std::to_string(expected_version));
    }
}
