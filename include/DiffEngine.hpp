// === include/DiffEngine.hpp ===
#pragma once
#include "FileRecord.hpp"
#include <cstdint>
#include <string>
#include <vector>

struct DiffOptions {
    bool compare_time = false; // also report mtime deltas (informational)
};

struct ModifiedEntry {
    std::string path;
    FileRecord  before; // base side
    FileRecord  after;  // candidate side
};

// Permission drift between two records of the same path
struct ModeChange {
    std::string path;
    uint32_t    before{0};
    uint32_t    after{0};
};

struct TimeDelta {
    std::string path;
    int64_t     before_ns{0};
    int64_t     after_ns{0};
    bool        backwards{false}; // candidate mtime older than base
    bool        modified{false};  // path is also in `modified`
};

// Classification holds only key membership and hash equality. All vectors
// are sorted by path so the result does not depend on scan order.
struct DiffResult {
    std::vector<std::string>   added;
    std::vector<std::string>   removed;
    std::vector<ModifiedEntry> modified;
    std::vector<std::string>   unchanged;

    std::vector<ModeChange> mode_changes; // informational
    std::vector<TimeDelta>  time_deltas;  // only with compare_time

    bool has_changes() const { return !added.empty() || !removed.empty() || !modified.empty(); }
};

// Desc: classify every path of base and candidate
// In: const RecordSet& base, const RecordSet& candidate, DiffOptions
// Out: DiffResult
DiffResult diff(const RecordSet& base, const RecordSet& candidate, const DiffOptions& opts = DiffOptions());
