// === include/RecordStore.hpp ===
#pragma once
#include "FileRecord.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <sqlite3.h>

struct StoreMetadata {
    int      schema_version = 0;
    int64_t  created_at = 0;    // epoch seconds
    int64_t  generation_ts = 0; // epoch seconds of the last write
    int64_t  generation = 0;    // number of completed writes
    uint64_t record_count = 0;
};

// One SQLite file holding exactly one RecordSet generation plus meta rows.
class RecordStore {
public:
    static constexpr int kSchemaVersion = 1;
    // invoked after each inserted row of write(); argument = rows so far
    using RowCallback = std::function<void(uint64_t)>;

    static bool exists(const std::string& location);

    // Desc: build a fresh store (optionally pre-filled) beside `location` and
    //       rename it into place. Throws StoreAlreadyExists when a store is
    //       present and overwrite is false, StoreWriteFailed on I/O errors.
    static std::unique_ptr<RecordStore> open_or_create(const std::string& location,
                                                       bool overwrite,
                                                       const RecordSet* initial = nullptr);
    // Desc: open an existing store. Throws StoreNotFound / SchemaMismatch.
    static std::unique_ptr<RecordStore> open(const std::string& location);

    RecordSet read() const;
    // Desc: replace the whole RecordSet in one transaction
    void write(const RecordSet& records, const RowCallback& on_row = RowCallback());
    StoreMetadata metadata() const;

    const std::string& location() const { return location_; }

    // sidecar files SQLite may keep next to `location`
    static std::vector<std::string> companion_paths(const std::string& location);

private:
    RecordStore(std::string location, sqlite3* db);
    void validate_schema() const;

    std::string location_;
    std::unique_ptr<sqlite3, void(*)(sqlite3*)> db_{nullptr, [](sqlite3* p){ if (p) sqlite3_close(p); }};
};
