// === include/Operations.hpp ===
#pragma once
#include "DiffEngine.hpp"
#include "FileRecord.hpp"
#include "HashLookupClient.hpp"
#include "IntegrityError.hpp"
#include "RecordStore.hpp"
#include "ReputationResolver.hpp"
#include "Scanner.hpp"
#include <cstdint>
#include <string>
#include <vector>

// What to scan for create / check / update
struct ScanRequest {
    std::vector<std::string> paths;
    std::vector<std::string> excludes;
    bool   exclude_store = true; // skip the store file and its sidecars
    size_t hash_workers = 1;
    size_t max_pending_files = 128;
};

struct CreateResult : OperationStatus {
    uint64_t  record_count = 0;
    ScanStats stats;
};

struct CheckResult : OperationStatus {
    DiffResult diff;
    ScanStats  stats;
};

struct UpdateResult : CheckResult {
    int64_t generation = 0; // store generation after the write
};

struct ListResult : OperationStatus {
    RecordSet     records;
    StoreMetadata meta;
};

struct CompareResult : OperationStatus {
    DiffResult diff;
};

struct PathVerdict {
    std::string path;
    Digest      hash{};
    Resolution  resolution;
};

struct CirclCheckResult : OperationStatus {
    std::vector<PathVerdict> entries; // sorted by path
    uint64_t known = 0;
    uint64_t unknown = 0;
    uint64_t unresolved = 0;
    uint64_t cache_hits = 0;
    uint64_t remote_queries = 0;
};

struct PurgeResult : OperationStatus {
    uint64_t removed = 0;
    uint64_t remaining = 0;
};

// Every operation reports fatal errors through OperationStatus::fail and
// never throws. A store is only mutated by create/update, and only after
// the scan completed.
CreateResult     create_store(const ScanRequest& req, const std::string& store_location, bool overwrite);
CheckResult      check_store(const ScanRequest& req, const std::string& store_location,
                             const DiffOptions& opts = DiffOptions());
UpdateResult     update_store(const ScanRequest& req, const std::string& store_location,
                              const DiffOptions& opts = DiffOptions());
ListResult       list_store(const std::string& store_location);
CompareResult    compare_stores(const std::string& store_a, const std::string& store_b,
                                const DiffOptions& opts = DiffOptions());
CirclCheckResult circl_check(const std::string& store_location, const std::string& cache_location,
                             HashLookupClient& client, size_t lookup_workers);
PurgeResult      purge_cache(const std::string& cache_location, int64_t max_age_sec);
