#include "DiffEngine.hpp"
#include "FileHasher.hpp"
#include "TestUtil.hpp"

namespace {
FileRecord rec(const std::string& path, const std::string& content, int64_t mtime_ns = 1, uint32_t mode = 0100644) {
    FileRecord r;
    r.path = path;
    r.size = content.size();
    r.mtime_ns = mtime_ns;
    r.mode = mode;
    r.content_hash = sha256_bytes(content);
    return r;
}

void put(RecordSet& s, const FileRecord& r) { s[r.path] = r; }
}

class DiffEngineTest : public QuietTest {};

TEST_F(DiffEngineTest, ClassifiesEveryPath) {
    RecordSet base, cand;
    put(base, rec("/a", "hello"));
    put(base, rec("/b", "world"));
    put(base, rec("/gone", "x"));
    put(cand, rec("/a", "hello"));
    put(cand, rec("/b", "world!"));
    put(cand, rec("/new", "y"));

    const DiffResult d = diff(base, cand);
    ASSERT_EQ(1u, d.added.size());
    EXPECT_EQ("/new", d.added[0]);
    ASSERT_EQ(1u, d.removed.size());
    EXPECT_EQ("/gone", d.removed[0]);
    ASSERT_EQ(1u, d.modified.size());
    EXPECT_EQ("/b", d.modified[0].path);
    EXPECT_EQ(sha256_bytes("world"), d.modified[0].before.content_hash);
    EXPECT_EQ(sha256_bytes("world!"), d.modified[0].after.content_hash);
    ASSERT_EQ(1u, d.unchanged.size());
    EXPECT_EQ("/a", d.unchanged[0]);
    EXPECT_TRUE(d.has_changes());
}

TEST_F(DiffEngineTest, Symmetry) {
    RecordSet a, b;
    for (int i = 0; i < 40; ++i) {
        if (i % 3 != 0) put(a, rec("/p" + std::to_string(i), std::to_string(i)));
        if (i % 4 != 0) put(b, rec("/p" + std::to_string(i), std::to_string(i % 7 == 0 ? -i : i)));
    }
    const DiffResult ab = diff(a, b);
    const DiffResult ba = diff(b, a);
    EXPECT_EQ(ab.added, ba.removed);
    EXPECT_EQ(ab.removed, ba.added);
    EXPECT_EQ(ab.unchanged, ba.unchanged);
    ASSERT_EQ(ab.modified.size(), ba.modified.size());
    for (size_t i = 0; i < ab.modified.size(); ++i) {
        EXPECT_EQ(ab.modified[i].path, ba.modified[i].path);
        EXPECT_EQ(ab.modified[i].before, ba.modified[i].after);
    }
}

TEST_F(DiffEngineTest, HashIsAuthoritative) {
    RecordSet base, cand;
    put(base, rec("/touched", "same", 100));
    FileRecord t = rec("/touched", "same", 999);
    t.size = 12345;
    put(cand, t);

    const DiffResult d = diff(base, cand);
    EXPECT_TRUE(d.modified.empty());
    ASSERT_EQ(1u, d.unchanged.size());
    EXPECT_FALSE(d.has_changes());
    EXPECT_TRUE(d.time_deltas.empty());
}

TEST_F(DiffEngineTest, CompareTimeIsInformational) {
    RecordSet base, cand;
    put(base, rec("/fwd", "same", 100));
    put(base, rec("/back", "old", 500));
    put(base, rec("/still", "s", 7));
    put(cand, rec("/fwd", "same", 200));
    put(cand, rec("/back", "new", 300));
    put(cand, rec("/still", "s", 7));

    DiffOptions opts;
    opts.compare_time = true;
    const DiffResult with_time = diff(base, cand, opts);
    const DiffResult without = diff(base, cand);

    EXPECT_EQ(with_time.unchanged, without.unchanged);
    EXPECT_EQ(with_time.modified.size(), without.modified.size());

    ASSERT_EQ(2u, with_time.time_deltas.size());
    EXPECT_EQ("/back", with_time.time_deltas[0].path);
    EXPECT_TRUE(with_time.time_deltas[0].backwards);
    EXPECT_TRUE(with_time.time_deltas[0].modified);
    EXPECT_EQ("/fwd", with_time.time_deltas[1].path);
    EXPECT_FALSE(with_time.time_deltas[1].backwards);
    EXPECT_FALSE(with_time.time_deltas[1].modified);
}

TEST_F(DiffEngineTest, ModeChangeDoesNotModify) {
    RecordSet base, cand;
    put(base, rec("/x", "c", 1, 0100644));
    put(cand, rec("/x", "c", 1, 0100755));
    const DiffResult d = diff(base, cand);
    EXPECT_EQ(1u, d.unchanged.size());
    ASSERT_EQ(1u, d.mode_changes.size());
    EXPECT_EQ("755", format_mode(d.mode_changes[0].after));
}

TEST_F(DiffEngineTest, EmptySets) {
    RecordSet empty, one;
    put(one, rec("/only", "1"));
    EXPECT_FALSE(diff(empty, empty).has_changes());
    EXPECT_EQ(1u, diff(empty, one).added.size());
    EXPECT_EQ(1u, diff(one, empty).removed.size());
}
