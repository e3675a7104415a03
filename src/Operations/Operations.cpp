// === src/Operations/Operations.cpp ===
#include "Operations.hpp"
#include "CacheStore.hpp"
#include "Logger.hpp"

#include <ctime>
#include <exception>
#include <set>

namespace {
// Desc: run an operation body, turning any exception into a failed status
// In: Result& r, Fn body
// Out: void (r.ok set by the body on success)
template <typename Result, typename Fn>
void run_guarded(const char* op, Result& r, Fn body) {
    try {
        body();
        r.ok = true;
    } catch (const IntegrityError& e) {
        log_error(op, std::string(error_kind_name(e.kind())) + ": " + e.what());
        r.fail(e.kind(), e.what());
    } catch (const std::exception& e) {
        log_error(op, std::string("unexpected error: ") + e.what());
        r.fail(ErrorKind::None, e.what());
    }
}

ScanSettings to_settings(const ScanRequest& req, const std::string& store_location) {
    ScanSettings s;
    s.roots = req.paths;
    s.excludes = req.excludes;
    s.hash_workers = req.hash_workers;
    s.max_pending_files = req.max_pending_files;
    if (req.exclude_store && !store_location.empty()) {
        s.excludes.push_back(store_location);
        for (const auto& c : RecordStore::companion_paths(store_location)) s.excludes.push_back(c);
    }
    return s;
}

void log_changes(const char* op, const DiffResult& d) {
    for (const auto& p : d.added)    log_info(op, "New file " + p);
    for (const auto& p : d.removed)  log_info(op, "Removing file " + p);
    for (const auto& m : d.modified) {
        log_info(op, "File updated " + m.path + " " + digest_to_hex(m.before.content_hash) +
                 " -> " + digest_to_hex(m.after.content_hash));
    }
}
}

CreateResult create_store(const ScanRequest& req, const std::string& store_location, bool overwrite) {
    CreateResult r;
    run_guarded("Create", r, [&]() {
        // refuse before spending time on the scan
        if (!overwrite && RecordStore::exists(store_location)) {
            throw IntegrityError(ErrorKind::StoreAlreadyExists,
                                 "database " + store_location + " already exists");
        }
        log_info("Create", "Creating db " + store_location);
        ScanOutcome scan = scan_tree(to_settings(req, store_location));
        auto store = RecordStore::open_or_create(store_location, overwrite, &scan.records);
        r.record_count = scan.records.size();
        r.stats = scan.stats;
        r.warnings = std::move(scan.warnings);
        log_info("Create", "Added " + std::to_string(r.record_count) + " files");
    });
    return r;
}

CheckResult check_store(const ScanRequest& req, const std::string& store_location, const DiffOptions& opts) {
    CheckResult r;
    run_guarded("Check", r, [&]() {
        auto store = RecordStore::open(store_location);
        const RecordSet stored = store->read();
        ScanOutcome scan = scan_tree(to_settings(req, store_location));
        r.diff = diff(stored, scan.records, opts);
        r.stats = scan.stats;
        r.warnings = std::move(scan.warnings);
        log_info("Check", "Checked " + std::to_string(scan.records.size()) + " files");
    });
    return r;
}

UpdateResult update_store(const ScanRequest& req, const std::string& store_location, const DiffOptions& opts) {
    UpdateResult r;
    run_guarded("Update", r, [&]() {
        auto store = RecordStore::open(store_location);
        const RecordSet stored = store->read();
        ScanOutcome scan = scan_tree(to_settings(req, store_location));
        r.diff = diff(stored, scan.records, opts);
        log_changes("Update", r.diff);

        // unconditional: an unchanged tree still produces a new generation
        store->write(scan.records);
        r.generation = store->metadata().generation;
        r.stats = scan.stats;
        r.warnings = std::move(scan.warnings);
        log_info("Update", "Updated " + std::to_string(scan.records.size()) + " files, generation " +
                 std::to_string(r.generation));
    });
    return r;
}

ListResult list_store(const std::string& store_location) {
    ListResult r;
    run_guarded("List", r, [&]() {
        auto store = RecordStore::open(store_location);
        r.records = store->read();
        r.meta = store->metadata();
    });
    return r;
}

CompareResult compare_stores(const std::string& store_a, const std::string& store_b, const DiffOptions& opts) {
    CompareResult r;
    run_guarded("Compare", r, [&]() {
        if (store_b.empty()) {
            throw IntegrityError(ErrorKind::InvalidConfig, "Compare need db2 parameter");
        }
        auto a = RecordStore::open(store_a);
        auto b = RecordStore::open(store_b);
        const RecordSet base = a->read();
        const RecordSet candidate = b->read();
        r.diff = diff(base, candidate, opts);
        log_info("Compare", "Checked " + std::to_string(candidate.size()) + " files");
    });
    return r;
}

CirclCheckResult circl_check(const std::string& store_location, const std::string& cache_location,
                             HashLookupClient& client, size_t lookup_workers) {
    CirclCheckResult r;
    run_guarded("CirclCheck", r, [&]() {
        auto store = RecordStore::open(store_location);
        const RecordSet records = store->read();

        std::set<Digest> hashes;
        for (const auto& kv : records) hashes.insert(kv.second.content_hash);

        auto cache = CacheStore::open(cache_location);
        ReputationResolver resolver(*cache, client, lookup_workers);
        ResolveOutcome outcome = resolver.resolve(hashes);

        r.entries.reserve(records.size());
        for (const auto& path : sorted_paths(records)) {
            const Digest& h = records.at(path).content_hash;
            PathVerdict pv;
            pv.path = path;
            pv.hash = h;
            auto it = outcome.resolutions.find(h);
            if (it != outcome.resolutions.end()) pv.resolution = it->second;

            switch (pv.resolution.verdict) {
                case Verdict::Known:      r.known++;      break;
                case Verdict::Unknown:    r.unknown++;    break;
                case Verdict::Unresolved: r.unresolved++; break;
            }
            r.entries.push_back(std::move(pv));
        }
        r.cache_hits = outcome.cache_hits;
        r.remote_queries = outcome.remote_queries;
        r.warnings = std::move(outcome.warnings);
    });
    return r;
}

PurgeResult purge_cache(const std::string& cache_location, int64_t max_age_sec) {
    PurgeResult r;
    run_guarded("CachePurge", r, [&]() {
        if (max_age_sec < 0) {
            throw IntegrityError(ErrorKind::InvalidConfig, "max age must not be negative");
        }
        auto cache = CacheStore::open(cache_location);
        const int64_t cutoff = static_cast<int64_t>(::time(nullptr)) - max_age_sec;
        r.removed = cache->purge_older_than(cutoff);
        r.remaining = cache->size();
        log_info("CachePurge", "removed " + std::to_string(r.removed) + " entries, " +
                 std::to_string(r.remaining) + " left");
    });
    return r;
}
