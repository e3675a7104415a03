// === include/ReputationResolver.hpp ===
#pragma once
#include "CacheStore.hpp"
#include "FileRecord.hpp"
#include "HashLookupClient.hpp"
#include "IntegrityError.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <vector>

struct Resolution {
    Verdict verdict{Verdict::Unresolved};
    std::optional<int> trust_score;
    bool from_cache{false};
};

struct ResolveOutcome {
    std::map<Digest, Resolution> resolutions; // one per input hash
    std::vector<Warning> warnings;            // RemoteLookupFailed, cache write failures
    uint64_t cache_hits = 0;
    uint64_t remote_queries = 0;
    uint64_t failures = 0;
};

// Cache-first resolution: a hash reaches the client only when the cache
// has no verdict for it, and every answer is persisted before it is
// returned, so each distinct hash is queried at most once while the cache
// file lives.
class ReputationResolver {
public:
    ReputationResolver(CacheStore& cache, HashLookupClient& client, size_t max_workers);

    ResolveOutcome resolve(const std::set<Digest>& hashes);

private:
    CacheStore&       cache_;
    HashLookupClient& client_;
    size_t            max_workers_;
};
