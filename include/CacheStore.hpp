// === include/CacheStore.hpp ===
#pragma once
#include "FileRecord.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <sqlite3.h>

enum class Verdict : int {
    Unresolved = 0, // lookup failed this run; never stored
    Known      = 1, // service knows the hash (trust score attached)
    Unknown    = 2  // service answered "not found"
};

const char* verdict_name(Verdict v);

struct CacheEntry {
    Verdict verdict{Verdict::Unresolved};
    std::optional<int> trust_score; // 0..100 when Known
    int64_t entry_time{0};          // epoch seconds the answer was obtained
};

// Persistent hash -> verdict map. Entries never expire on their own;
// purge_older_than() is the only removal path.
class CacheStore {
public:
    static constexpr int kSchemaVersion = 1;

    // Desc: open or create; throws SchemaMismatch / StoreWriteFailed
    static std::unique_ptr<CacheStore> open(const std::string& location);

    std::optional<CacheEntry> get(const Digest& hash) const;
    // Desc: durable on return; same hash twice is harmless
    void put(const Digest& hash, const CacheEntry& entry);
    uint64_t size() const;
    // Desc: delete entries obtained before `cutoff_epoch_sec`
    // Out: rows removed
    uint64_t purge_older_than(int64_t cutoff_epoch_sec);

    const std::string& location() const { return location_; }

private:
    CacheStore(std::string location, sqlite3* db);

    std::string location_;
    mutable std::mutex mu_; // one connection shared by resolver workers
    std::unique_ptr<sqlite3, void(*)(sqlite3*)> db_{nullptr, [](sqlite3* p){ if (p) sqlite3_close(p); }};
};
