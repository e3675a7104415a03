// === include/SqliteUtil.hpp ===
#pragma once
#include "IntegrityError.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <sqlite3.h>

// Finalizes on scope exit
struct StmtDeleter {
    void operator()(sqlite3_stmt* s) const noexcept { if (s) (void)sqlite3_finalize(s); }
};
using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

// Desc: prepare `sql`; throws IntegrityError(kind) with sqlite's message
Stmt prepare_or_throw(sqlite3* db, const char* sql, ErrorKind kind);
// Desc: run one or more statements; throws IntegrityError(kind)
void exec_or_throw(sqlite3* db, const char* sql, ErrorKind kind);

// Desc: open a database file; nullptr + error on failure
sqlite3* open_sqlite(const std::string& path, int flags, std::string& error);
// Desc: busy timeout / WAL / synchronous settings shared by both stores
void apply_store_pragmas(sqlite3* db, bool wal);

// Desc: meta(key,value) lookup; nullopt when row (or table) is missing
std::optional<std::string> read_meta(sqlite3* db, const char* key);
void write_meta(sqlite3* db, const char* key, const std::string& value, ErrorKind kind);

// Desc: check store_kind / schema_version meta rows; throws SchemaMismatch
void require_schema(sqlite3* db, const std::string& location,
                    const char* expected_kind, int expected_version);
