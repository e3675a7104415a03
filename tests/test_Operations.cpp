#include "FileHasher.hpp"
#include "MockLookupClient.hpp"
#include "Operations.hpp"
#include "TestUtil.hpp"

#include <filesystem>

class OperationsTest : public QuietTest {
protected:
    TempDir dir;

    std::string tree() const { return dir / "tree"; }
    std::string store() const { return dir / "files_data.db"; }

    ScanRequest request() const {
        ScanRequest req;
        req.paths = {tree()};
        req.hash_workers = 3;
        req.max_pending_files = 4;
        return req;
    }
};

TEST_F(OperationsTest, EndToEndScenario) {
    write_file(tree() + "/a.txt", "hello");
    write_file(tree() + "/b.txt", "world");

    const CreateResult created = create_store(request(), store(), false);
    ASSERT_TRUE(created.ok) << created.error;
    EXPECT_EQ(2u, created.record_count);

    const ListResult listed = list_store(store());
    ASSERT_TRUE(listed.ok) << listed.error;
    ASSERT_EQ(2u, listed.records.size());
    EXPECT_NE(listed.records.at(tree() + "/a.txt").content_hash,
              listed.records.at(tree() + "/b.txt").content_hash);

    write_file(tree() + "/b.txt", "world!");
    CheckResult checked = check_store(request(), store());
    ASSERT_TRUE(checked.ok) << checked.error;
    ASSERT_EQ(1u, checked.diff.modified.size());
    EXPECT_EQ(tree() + "/b.txt", checked.diff.modified[0].path);
    EXPECT_TRUE(checked.diff.added.empty());
    EXPECT_TRUE(checked.diff.removed.empty());

    std::filesystem::remove(tree() + "/a.txt");
    write_file(tree() + "/c.txt", "new");
    checked = check_store(request(), store());
    ASSERT_TRUE(checked.ok) << checked.error;
    EXPECT_EQ(std::vector<std::string>{tree() + "/a.txt"}, checked.diff.removed);
    EXPECT_EQ(std::vector<std::string>{tree() + "/c.txt"}, checked.diff.added);
    ASSERT_EQ(1u, checked.diff.modified.size());
    EXPECT_EQ(tree() + "/b.txt", checked.diff.modified[0].path);

    // check never mutates the store
    EXPECT_EQ(listed.records, list_store(store()).records);
}

TEST_F(OperationsTest, UpdateThenCheckIsClean) {
    write_file(tree() + "/a", "1");
    ASSERT_TRUE(create_store(request(), store(), false).ok);
    write_file(tree() + "/a", "2");
    write_file(tree() + "/b", "3");

    const UpdateResult updated = update_store(request(), store());
    ASSERT_TRUE(updated.ok) << updated.error;
    EXPECT_EQ(1u, updated.diff.modified.size());
    EXPECT_EQ(1u, updated.diff.added.size());
    EXPECT_EQ(2, updated.generation);

    const CheckResult checked = check_store(request(), store());
    ASSERT_TRUE(checked.ok);
    EXPECT_FALSE(checked.diff.has_changes());
    EXPECT_EQ(2u, checked.diff.unchanged.size());

    // an unchanged tree still writes a new generation
    const UpdateResult again = update_store(request(), store());
    ASSERT_TRUE(again.ok);
    EXPECT_FALSE(again.diff.has_changes());
    EXPECT_EQ(3, again.generation);
}

TEST_F(OperationsTest, StoreInsideTreeIsSkipped) {
    write_file(tree() + "/a", "1");
    const std::string inside = tree() + "/files_data.db";

    ASSERT_TRUE(create_store(request(), inside, false).ok);
    EXPECT_EQ(1u, list_store(inside).records.size());

    const CheckResult checked = check_store(request(), inside);
    ASSERT_TRUE(checked.ok);
    EXPECT_FALSE(checked.diff.has_changes());

    ScanRequest with_db = request();
    with_db.exclude_store = false;
    const CheckResult seen = check_store(with_db, inside);
    ASSERT_TRUE(seen.ok);
    EXPECT_FALSE(seen.diff.added.empty());
}

TEST_F(OperationsTest, CreateRefusesExistingStore) {
    write_file(tree() + "/a", "1");
    ASSERT_TRUE(create_store(request(), store(), false).ok);
    write_file(tree() + "/b", "2");

    const CreateResult again = create_store(request(), store(), false);
    EXPECT_FALSE(again.ok);
    EXPECT_EQ(ErrorKind::StoreAlreadyExists, again.error_kind);
    EXPECT_EQ(1u, list_store(store()).records.size());

    const CreateResult forced = create_store(request(), store(), true);
    ASSERT_TRUE(forced.ok) << forced.error;
    EXPECT_EQ(2u, list_store(store()).records.size());
}

TEST_F(OperationsTest, FatalErrorsReported) {
    const CheckResult no_store = check_store(request(), store());
    EXPECT_FALSE(no_store.ok);
    EXPECT_EQ(ErrorKind::StoreNotFound, no_store.error_kind);

    ScanRequest bad = request();
    bad.paths = {dir / "missing"};
    const CreateResult no_root = create_store(bad, store(), false);
    EXPECT_FALSE(no_root.ok);
    EXPECT_EQ(ErrorKind::RootPathNotFound, no_root.error_kind);
    EXPECT_FALSE(std::filesystem::exists(store()));
}

TEST_F(OperationsTest, CompareIdenticalScans) {
    write_file(tree() + "/x/1", "one");
    write_file(tree() + "/x/2", "two");
    write_file(tree() + "/3", "three");
    const std::string a = dir / "a.db";
    const std::string b = dir / "b.db";
    ASSERT_TRUE(create_store(request(), a, false).ok);
    ASSERT_TRUE(create_store(request(), b, false).ok);

    const CompareResult cmp = compare_stores(a, b);
    ASSERT_TRUE(cmp.ok) << cmp.error;
    EXPECT_FALSE(cmp.diff.has_changes());
    EXPECT_EQ(3u, cmp.diff.unchanged.size());

    EXPECT_EQ(ErrorKind::StoreNotFound, compare_stores(a, dir / "nope.db").error_kind);
}

TEST_F(OperationsTest, CirclCheckUsesCacheOnce) {
    write_file(tree() + "/a", "hello");
    write_file(tree() + "/copy-of-a", "hello");
    write_file(tree() + "/b", "mine");
    ASSERT_TRUE(create_store(request(), store(), false).ok);

    MockLookupClient client;
    client.known[sha256_bytes("hello")] = 90;
    const std::string cache = dir / "circl_cache.db";

    for (int i = 0; i < 3; ++i) {
        const CirclCheckResult r = circl_check(store(), cache, client, 4);
        ASSERT_TRUE(r.ok) << r.error;
        ASSERT_EQ(3u, r.entries.size());
        EXPECT_EQ(tree() + "/a", r.entries[0].path);
        EXPECT_EQ(2u, r.known);
        EXPECT_EQ(1u, r.unknown);
        EXPECT_EQ(0u, r.unresolved);
    }
    EXPECT_EQ(2, client.total_calls());

    const PurgeResult kept = purge_cache(cache, 3600);
    ASSERT_TRUE(kept.ok);
    EXPECT_EQ(0u, kept.removed);
    EXPECT_EQ(2u, kept.remaining);
}

TEST_F(OperationsTest, CirclCheckFailureIsWarning) {
    write_file(tree() + "/a", "hello");
    ASSERT_TRUE(create_store(request(), store(), false).ok);

    MockLookupClient client;
    client.broken.insert(sha256_bytes("hello"));
    const CirclCheckResult r = circl_check(store(), dir / "cache.db", client, 2);
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(1u, r.unresolved);
    ASSERT_EQ(1u, r.warnings.size());
    EXPECT_EQ(ErrorKind::RemoteLookupFailed, r.warnings[0].kind);
}
