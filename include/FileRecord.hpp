// === include/FileRecord.hpp ===
#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>
#include <sys/types.h>

// SHA-256 of the full file content
using Digest = std::array<unsigned char, 32>;

struct FileRecord {
    std::string path;        // normalized absolute path, key within a store
    uint64_t    size{0};     // bytes hashed
    int64_t     mtime_ns{0}; // informational only
    uint32_t    mode{0};     // st_mode, informational only
    Digest      content_hash{};

    bool operator==(const FileRecord& o) const noexcept {
        return path == o.path && size == o.size && mtime_ns == o.mtime_ns &&
               mode == o.mode && content_hash == o.content_hash;
    }
    bool operator!=(const FileRecord& o) const noexcept { return !(*this == o); }
};

// One scan or one store read. Keyed by FileRecord::path.
using RecordSet = std::unordered_map<std::string, FileRecord>;

std::string digest_to_hex(const Digest& d);
bool digest_from_hex(const std::string& hex, Digest& out);

std::string format_time_ns(int64_t ns);
std::string format_mode(uint32_t mode);
std::string format_record(const FileRecord& r);

// Paths of a RecordSet in lexical order
std::vector<std::string> sorted_paths(const RecordSet& set);
