// === src/ReputationResolver/ReputationResolver.cpp ===
#include "ReputationResolver.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <atomic>
#include <ctime>
#include <exception>
#include <mutex>
#include <thread>

ReputationResolver::ReputationResolver(CacheStore& cache, HashLookupClient& client, size_t max_workers)
    : cache_(cache), client_(client), max_workers_(max_workers == 0 ? 1 : max_workers) {}

// Desc: partition hashes into cache hits and misses, query misses remotely
// In: const std::set<Digest>& hashes (unique by construction)
// Out: ResolveOutcome
ResolveOutcome ReputationResolver::resolve(const std::set<Digest>& hashes) {
    ResolveOutcome out;
    std::vector<Digest> misses;

    // [Cache pass] no network for anything already answered
    for (const auto& h : hashes) {
        std::optional<CacheEntry> hit;
        try {
            hit = cache_.get(h);
        } catch (const IntegrityError& e) {
            log_warn("Resolver", "cache read failed for " + digest_to_hex(h) + ": " + e.what());
            out.warnings.push_back(Warning{e.kind(), digest_to_hex(h), e.what()});
        }
        if (hit) {
            out.resolutions[h] = Resolution{hit->verdict, hit->trust_score, true};
            out.cache_hits++;
        } else {
            misses.push_back(h);
        }
    }
    log_debug("Resolver", std::to_string(out.cache_hits) + " cache hits, " +
              std::to_string(misses.size()) + " to query");
    if (misses.empty()) return out;

    // [Remote pass] bounded workers, each miss handed out exactly once
    std::mutex merge_mtx;
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        for (;;) {
            const size_t i = next.fetch_add(1);
            if (i >= misses.size()) break;
            const Digest& h = misses[i];
            const std::string hex = digest_to_hex(h);

            LookupResponse resp;
            try {
                resp = client_.lookup(h);
            } catch (const std::exception& e) {
                resp.status = LookupResponse::Status::Failed;
                resp.error = e.what();
            }

            Resolution res;
            Warning warn;
            bool has_warning = false;

            if (resp.status == LookupResponse::Status::Failed) {
                log_error("Resolver", "lookup failed for " + hex + ": " + resp.error);
                warn = Warning{ErrorKind::RemoteLookupFailed, hex, resp.error};
                has_warning = true;
            } else {
                CacheEntry entry;
                entry.verdict = (resp.status == LookupResponse::Status::Found) ? Verdict::Known : Verdict::Unknown;
                entry.trust_score = resp.trust_score;
                entry.entry_time = static_cast<int64_t>(::time(nullptr));
                // persisted before the verdict is handed back
                try {
                    cache_.put(h, entry);
                } catch (const IntegrityError& e) {
                    log_warn("Resolver", "cache write failed for " + hex + ": " + e.what());
                    warn = Warning{e.kind(), hex, std::string("verdict not cached: ") + e.what()};
                    has_warning = true;
                }
                res.verdict = entry.verdict;
                res.trust_score = entry.trust_score;
            }

            std::lock_guard<std::mutex> lk(merge_mtx);
            out.remote_queries++;
            if (res.verdict == Verdict::Unresolved) out.failures++;
            if (has_warning) out.warnings.push_back(std::move(warn));
            out.resolutions[h] = res;
        }
    };

    const size_t n_workers = std::min(max_workers_, misses.size());
    std::vector<std::thread> pool;
    pool.reserve(n_workers);
    for (size_t i = 0; i < n_workers; ++i) pool.emplace_back(worker);
    for (auto& th : pool) th.join();

    log_info("Resolver", "resolved " + std::to_string(hashes.size()) + " hashes (" +
             std::to_string(out.cache_hits) + " cached, " + std::to_string(out.remote_queries) +
             " queried, " + std::to_string(out.failures) + " failed)");
    return out;
}
