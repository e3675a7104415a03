// === src/DiffEngine/DiffEngine.cpp ===
#include "DiffEngine.hpp"
#include "Logger.hpp"

#include <algorithm>

DiffResult diff(const RecordSet& base, const RecordSet& candidate, const DiffOptions& opts) {
    DiffResult r;

    // one pass over base: removed, modified, unchanged
    for (const auto& kv : base) {
        const FileRecord& before = kv.second;
        auto it = candidate.find(kv.first);
        if (it == candidate.end()) {
            r.removed.push_back(kv.first);
            continue;
        }
        const FileRecord& after = it->second;
        const bool same_content = before.content_hash == after.content_hash;

        if (same_content) r.unchanged.push_back(kv.first);
        else              r.modified.push_back(ModifiedEntry{kv.first, before, after});

        if ((before.mode & 07777) != (after.mode & 07777)) {
            r.mode_changes.push_back(ModeChange{kv.first, before.mode, after.mode});
        }
        if (opts.compare_time && before.mtime_ns != after.mtime_ns) {
            r.time_deltas.push_back(TimeDelta{kv.first, before.mtime_ns, after.mtime_ns,
                                              after.mtime_ns < before.mtime_ns, !same_content});
        }
    }

    // one pass over candidate: added
    for (const auto& kv : candidate) {
        if (base.find(kv.first) == base.end()) r.added.push_back(kv.first);
    }

    std::sort(r.added.begin(), r.added.end());
    std::sort(r.removed.begin(), r.removed.end());
    std::sort(r.unchanged.begin(), r.unchanged.end());
    std::sort(r.modified.begin(), r.modified.end(),
              [](const ModifiedEntry& a, const ModifiedEntry& b) { return a.path < b.path; });
    std::sort(r.mode_changes.begin(), r.mode_changes.end(),
              [](const ModeChange& a, const ModeChange& b) { return a.path < b.path; });
    std::sort(r.time_deltas.begin(), r.time_deltas.end(),
              [](const TimeDelta& a, const TimeDelta& b) { return a.path < b.path; });

    log_debug("Diff", "added=" + std::to_string(r.added.size()) +
              " removed=" + std::to_string(r.removed.size()) +
              " modified=" + std::to_string(r.modified.size()) +
              " unchanged=" + std::to_string(r.unchanged.size()));
    return r;
}
