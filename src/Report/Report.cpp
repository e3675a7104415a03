// === src/Report/Report.cpp ===
#include "Report.hpp"

#include <string>

static std::string format_delta_ns(int64_t before, int64_t after) {
    const int64_t d = after - before;
    const int64_t abs_ms = (d < 0 ? -d : d) / 1000000;
    return std::string(d < 0 ? "-" : "+") + std::to_string(abs_ms / 1000) + "." +
           std::to_string(1000 + abs_ms % 1000).substr(1) + "s";
}

void print_diff(std::ostream& os, const DiffResult& d, bool compare_time) {
    for (const auto& p : d.added)   os << "Added:    " << p << "\n";
    for (const auto& p : d.removed) os << "Removed:  " << p << "\n";
    for (const auto& m : d.modified) {
        os << "Modified: " << m.path << "\n"
           << "    before " << format_record(m.before) << "\n"
           << "    after  " << format_record(m.after) << "\n";
    }
    for (const auto& c : d.mode_changes) {
        os << "Mode:     " << c.path << " " << format_mode(c.before) << " -> " << format_mode(c.after) << "\n";
    }
    if (compare_time) {
        for (const auto& t : d.time_deltas) {
            os << "Time:     " << t.path << " " << format_time_ns(t.before_ns) << " -> "
               << format_time_ns(t.after_ns) << " (" << format_delta_ns(t.before_ns, t.after_ns) << ")";
            if (t.backwards) os << " [moved backwards]";
            if (!t.modified) os << " [content unchanged]";
            os << "\n";
        }
    }
    os << "Summary: added=" << d.added.size() << " removed=" << d.removed.size()
       << " modified=" << d.modified.size() << " unchanged=" << d.unchanged.size() << "\n";
}

void print_create(std::ostream& os, const CreateResult& r) {
    os << "Recorded " << r.record_count << " files (" << r.stats.bytes_hashed << " bytes, "
       << r.stats.excluded << " excluded, " << r.stats.skipped << " skipped)\n";
}

void print_check(std::ostream& os, const CheckResult& r, bool compare_time) {
    print_diff(os, r.diff, compare_time);
}

void print_update(std::ostream& os, const UpdateResult& r, bool compare_time) {
    print_diff(os, r.diff, compare_time);
    os << "Store generation: " << r.generation << "\n";
}

void print_list(std::ostream& os, const ListResult& r) {
    for (const auto& p : sorted_paths(r.records)) {
        os << "File: " << p << ": " << format_record(r.records.at(p)) << "\n";
    }
    os << "Records: " << r.meta.record_count
       << "  schema: " << r.meta.schema_version
       << "  created: " << format_time_ns(r.meta.created_at * 1000000000LL)
       << "  generation: " << r.meta.generation
       << " (" << format_time_ns(r.meta.generation_ts * 1000000000LL) << ")\n";
}

void print_compare(std::ostream& os, const CompareResult& r, bool compare_time) {
    print_diff(os, r.diff, compare_time);
}

void print_circl_check(std::ostream& os, const CirclCheckResult& r) {
    for (const auto& e : r.entries) {
        os << "File " << e.path << " hash " << digest_to_hex(e.hash) << " ";
        switch (e.resolution.verdict) {
            case Verdict::Known:
                os << "found with score ";
                if (e.resolution.trust_score) os << *e.resolution.trust_score;
                else                          os << "?";
                break;
            case Verdict::Unknown:
                os << "not found";
                break;
            case Verdict::Unresolved:
                os << "unresolved";
                break;
        }
        if (e.resolution.from_cache) os << " (cached)";
        os << "\n";
    }
    os << "Summary: known=" << r.known << " unknown=" << r.unknown << " unresolved=" << r.unresolved
       << " cache_hits=" << r.cache_hits << " queries=" << r.remote_queries << "\n";
}

void print_purge(std::ostream& os, const PurgeResult& r) {
    os << "Purged " << r.removed << " cache entries, " << r.remaining << " remaining\n";
}

// already logged where they occurred; repeated here as part of the result
void print_warnings(std::ostream& os, const std::vector<Warning>& warnings) {
    if (warnings.empty()) return;
    os << "Warnings: " << warnings.size() << "\n";
    for (const auto& w : warnings) {
        os << "  " << error_kind_name(w.kind) << " " << w.subject << ": " << w.message << "\n";
    }
}
