// === src/FileRecord/FileRecord.cpp ===
#include "FileRecord.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <vector>

static const char* kHex = "0123456789abcdef";

// Desc: render digest as lowercase hex
// In: const Digest& d
// Out: std::string (64 chars)
std::string digest_to_hex(const Digest& d) {
    std::string h(d.size() * 2, '0');
    for (size_t i = 0; i < d.size(); i++) {
        h[2*i]   = kHex[(d[i] >> 4) & 0xF];
        h[2*i+1] = kHex[d[i] & 0xF];
    }
    return h;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Desc: parse 64 hex chars into a digest
// In: const std::string& hex, Digest& out
// Out: bool (false on wrong length or non-hex char; out untouched)
bool digest_from_hex(const std::string& hex, Digest& out) {
    Digest tmp{};
    if (hex.size() != tmp.size() * 2) return false;
    for (size_t i = 0; i < tmp.size(); i++) {
        const int hi = hex_value(hex[2*i]);
        const int lo = hex_value(hex[2*i+1]);
        if (hi < 0 || lo < 0) return false;
        tmp[i] = static_cast<unsigned char>((hi << 4) | lo);
    }
    out = tmp;
    return true;
}

// Desc: format epoch nanoseconds as UTC wall time
// In: int64_t ns
// Out: std::string ("YYYY-MM-DD HH:MM:SS UTC" or "#ERROR#")
std::string format_time_ns(int64_t ns) {
    time_t secs = static_cast<time_t>(ns / 1000000000LL);
    if (ns < 0 && ns % 1000000000LL != 0) secs -= 1;
    struct tm tm_utc{};
    if (gmtime_r(&secs, &tm_utc) == nullptr) return "#ERROR#";
    char buf[64];
    if (strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S UTC", &tm_utc) == 0) return "#ERROR#";
    return buf;
}

std::string format_mode(uint32_t mode) {
    char buf[16];
    snprintf(buf, sizeof(buf), "%o", static_cast<unsigned>(mode & 07777));
    return buf;
}

std::string format_record(const FileRecord& r) {
    return "hash: " + digest_to_hex(r.content_hash) +
           " perm: " + format_mode(r.mode) +
           " size: " + std::to_string(r.size) +
           " modified: " + format_time_ns(r.mtime_ns);
}

std::vector<std::string> sorted_paths(const RecordSet& set) {
    std::vector<std::string> out;
    out.reserve(set.size());
    for (const auto& kv : set) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}
