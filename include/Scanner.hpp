// === include/Scanner.hpp ===
#pragma once
#include "FileRecord.hpp"
#include "IntegrityError.hpp"
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

struct ScanSettings {
    std::vector<std::string> roots;
    std::vector<std::string> excludes;
    size_t hash_workers = 1;
    size_t max_pending_files = 128;
};

struct ScanStats {
    uint64_t files_hashed = 0;
    uint64_t dirs_visited = 0;
    uint64_t excluded = 0;
    uint64_t skipped = 0;  // non-regular entries
    uint64_t bytes_hashed = 0;
};

struct ScanOutcome {
    RecordSet records;
    std::vector<Warning> warnings; // FileUnreadable only
    ScanStats stats;
};

// Worker-side half of a scan: hashes one file and merges the record, or a
// FileUnreadable warning, into the shared outcome under one lock
class ScanCollector {
public:
    explicit ScanCollector(ScanOutcome& out) : out_(out) {}

    void hash_and_merge(const std::string& path);

private:
    ScanOutcome& out_;
    std::mutex mtx_;
};

// Resolved exclude list: each entry kept in lexical and in resolved form
class ExcludeSet {
public:
    ExcludeSet() = default;
    explicit ExcludeSet(const std::vector<std::string>& paths);

    // whole-component prefix match against any stored form
    bool matches(const std::string& abs_path) const;
    const std::vector<std::string>& entries() const { return entries_; }

private:
    std::vector<std::string> entries_;
};

// Desc: lexical normalization of an absolute path ("." / ".." / "//" collapsed)
std::string normalize_absolute(const std::string& path);
// Desc: canonical path when it exists, weakly canonical otherwise
std::string resolve_path(const std::string& path);
// Desc: true when `path` equals `prefix` or lies below it
bool path_is_under(const std::string& path, const std::string& prefix);

// Desc: walk every root, hash every reachable regular file not excluded.
// Throws IntegrityError(RootPathNotFound) when a root does not exist.
ScanOutcome scan_tree(const ScanSettings& settings);
