#include "CacheStore.hpp"
#include "FileHasher.hpp"
#include "MockLookupClient.hpp"
#include "ReputationResolver.hpp"
#include "TestUtil.hpp"

class ReputationResolverTest : public QuietTest {
protected:
    TempDir dir;
    MockLookupClient client;

    std::string cache_loc() const { return dir / "cache.db"; }

    ResolveOutcome run(const std::set<Digest>& hashes, size_t workers = 4) {
        auto cache = CacheStore::open(cache_loc());
        ReputationResolver resolver(*cache, client, workers);
        return resolver.resolve(hashes);
    }
};

TEST_F(ReputationResolverTest, VerdictsFromService) {
    const Digest known = sha256_bytes("ls");
    const Digest unknown = sha256_bytes("mine");
    client.known[known] = 100;

    const ResolveOutcome out = run({known, unknown});
    ASSERT_EQ(2u, out.resolutions.size());
    EXPECT_EQ(Verdict::Known, out.resolutions.at(known).verdict);
    EXPECT_EQ(100, out.resolutions.at(known).trust_score.value_or(-1));
    EXPECT_FALSE(out.resolutions.at(known).from_cache);
    EXPECT_EQ(Verdict::Unknown, out.resolutions.at(unknown).verdict);
    EXPECT_EQ(2u, out.remote_queries);
    EXPECT_EQ(0u, out.cache_hits);
    EXPECT_TRUE(out.warnings.empty());
}

TEST_F(ReputationResolverTest, EachHashQueriedOnceAcrossRuns) {
    std::set<Digest> hashes;
    for (int i = 0; i < 60; ++i) {
        const Digest h = sha256_bytes("file" + std::to_string(i));
        hashes.insert(h);
        if (i % 2) client.known[h] = i;
    }

    for (int run_no = 0; run_no < 5; ++run_no) {
        const ResolveOutcome out = run(hashes, 8);
        EXPECT_EQ(hashes.size(), out.resolutions.size());
        if (run_no > 0) {
            EXPECT_EQ(hashes.size(), out.cache_hits);
            EXPECT_EQ(0u, out.remote_queries);
        }
    }
    for (const auto& h : hashes) EXPECT_EQ(1, client.calls(h));
    EXPECT_EQ(60, client.total_calls());
}

TEST_F(ReputationResolverTest, CachedAnswerServedWithoutNetwork) {
    const Digest h = sha256_bytes("cached");
    {
        auto cache = CacheStore::open(cache_loc());
        CacheEntry e;
        e.verdict = Verdict::Known;
        e.trust_score = 42;
        cache->put(h, e);
    }
    const ResolveOutcome out = run({h});
    EXPECT_EQ(0, client.total_calls());
    EXPECT_TRUE(out.resolutions.at(h).from_cache);
    EXPECT_EQ(42, out.resolutions.at(h).trust_score.value_or(-1));
}

TEST_F(ReputationResolverTest, FailureNotCachedAndRetriedNextRun) {
    const Digest ok = sha256_bytes("ok");
    const Digest bad = sha256_bytes("bad");
    client.broken.insert(bad);

    const ResolveOutcome first = run({ok, bad});
    EXPECT_EQ(Verdict::Unresolved, first.resolutions.at(bad).verdict);
    EXPECT_EQ(Verdict::Unknown, first.resolutions.at(ok).verdict);
    EXPECT_EQ(1u, first.failures);
    ASSERT_EQ(1u, first.warnings.size());
    EXPECT_EQ(ErrorKind::RemoteLookupFailed, first.warnings[0].kind);
    EXPECT_EQ(digest_to_hex(bad), first.warnings[0].subject);
    EXPECT_EQ(1u, CacheStore::open(cache_loc())->size());

    client.broken.clear();
    client.known[bad] = 5;
    const ResolveOutcome second = run({ok, bad});
    EXPECT_EQ(Verdict::Known, second.resolutions.at(bad).verdict);
    EXPECT_EQ(1u, second.cache_hits);
    EXPECT_EQ(2, client.calls(bad));
    EXPECT_EQ(1, client.calls(ok));
}

TEST_F(ReputationResolverTest, EmptyInput) {
    const ResolveOutcome out = run({});
    EXPECT_TRUE(out.resolutions.empty());
    EXPECT_EQ(0, client.total_calls());
}
