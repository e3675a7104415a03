#include "FileHasher.hpp"
#include "IntegrityError.hpp"
#include "RecordStore.hpp"
#include "TestUtil.hpp"

#include <functional>
#include <sqlite3.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {
RecordSet make_set(const std::string& prefix, int n, const std::string& salt) {
    RecordSet set;
    for (int i = 0; i < n; ++i) {
        FileRecord r;
        r.path = prefix + "/f" + std::to_string(i);
        r.size = static_cast<uint64_t>(i);
        r.mtime_ns = 1000000000LL * (i + 1);
        r.mode = 0100644;
        r.content_hash = sha256_bytes(salt + std::to_string(i));
        set.emplace(r.path, r);
    }
    return set;
}

ErrorKind kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const IntegrityError& e) {
        return e.kind();
    }
    return ErrorKind::None;
}
}

class RecordStoreTest : public QuietTest {
protected:
    TempDir dir;
    std::string loc() const { return dir / "store.db"; }
};

TEST_F(RecordStoreTest, CreateThenRead) {
    EXPECT_FALSE(RecordStore::exists(loc()));
    const RecordSet set = make_set("/data", 10, "a");
    {
        auto store = RecordStore::open_or_create(loc(), false, &set);
        EXPECT_EQ(set, store->read());
    }
    EXPECT_TRUE(RecordStore::exists(loc()));
    EXPECT_FALSE(RecordStore::exists(loc() + ".tmp"));

    auto again = RecordStore::open(loc());
    EXPECT_EQ(set, again->read());
    const StoreMetadata m = again->metadata();
    EXPECT_EQ(RecordStore::kSchemaVersion, m.schema_version);
    EXPECT_EQ(10u, m.record_count);
    EXPECT_EQ(1, m.generation);
    EXPECT_GT(m.created_at, 0);
}

TEST_F(RecordStoreTest, ExistingStoreNotOverwritten) {
    const RecordSet first = make_set("/data", 3, "a");
    const RecordSet second = make_set("/other", 5, "b");
    RecordStore::open_or_create(loc(), false, &first);

    EXPECT_EQ(ErrorKind::StoreAlreadyExists,
              kind_of([&]() { RecordStore::open_or_create(loc(), false, &second); }));
    EXPECT_EQ(first, RecordStore::open(loc())->read());

    RecordStore::open_or_create(loc(), true, &second);
    EXPECT_EQ(second, RecordStore::open(loc())->read());
}

TEST_F(RecordStoreTest, MissingStore) {
    EXPECT_EQ(ErrorKind::StoreNotFound, kind_of([&]() { RecordStore::open(loc()); }));
}

TEST_F(RecordStoreTest, ForeignFileIsSchemaMismatch) {
    write_file(loc(), "this is not a database at all, just text padding it out to a page........");
    EXPECT_EQ(ErrorKind::SchemaMismatch, kind_of([&]() { RecordStore::open(loc()); }));
}

TEST_F(RecordStoreTest, FutureVersionIsSchemaMismatch) {
    RecordStore::open_or_create(loc(), false);
    {
        sqlite3* db = nullptr;
        ASSERT_EQ(SQLITE_OK, sqlite3_open(loc().c_str(), &db));
        ASSERT_EQ(SQLITE_OK, sqlite3_exec(db, "UPDATE meta SET value='99' WHERE key='schema_version';",
                                          nullptr, nullptr, nullptr));
        sqlite3_close(db);
    }
    EXPECT_EQ(ErrorKind::SchemaMismatch, kind_of([&]() { RecordStore::open(loc()); }));
}

TEST_F(RecordStoreTest, CacheFileIsNotARecordStore) {
    {
        sqlite3* db = nullptr;
        ASSERT_EQ(SQLITE_OK, sqlite3_open(loc().c_str(), &db));
        ASSERT_EQ(SQLITE_OK, sqlite3_exec(db,
            "CREATE TABLE meta(key TEXT PRIMARY KEY, value TEXT NOT NULL);"
            "INSERT INTO meta VALUES('store_kind','lookup_cache'),('schema_version','1');",
            nullptr, nullptr, nullptr));
        sqlite3_close(db);
    }
    EXPECT_EQ(ErrorKind::SchemaMismatch, kind_of([&]() { RecordStore::open(loc()); }));
}

TEST_F(RecordStoreTest, WriteReplacesWholeSet) {
    const RecordSet a = make_set("/data", 20, "a");
    const RecordSet b = make_set("/data", 7, "b");
    auto store = RecordStore::open_or_create(loc(), false, &a);
    store->write(b);
    EXPECT_EQ(b, store->read());
    store->write(b);
    EXPECT_EQ(b, RecordStore::open(loc())->read());
    EXPECT_EQ(3, store->metadata().generation);
}

TEST_F(RecordStoreTest, FailedWriteKeepsPreviousSet) {
    const RecordSet a = make_set("/data", 5, "a");
    const RecordSet b = make_set("/data", 50, "b");
    auto store = RecordStore::open_or_create(loc(), false, &a);

    EXPECT_THROW(store->write(b, [](uint64_t rows) {
        if (rows == 25) throw IntegrityError(ErrorKind::StoreWriteFailed, "disk full");
    }), IntegrityError);
    EXPECT_EQ(a, store->read());
    EXPECT_EQ(1, store->metadata().generation);
}

TEST_F(RecordStoreTest, CrashDuringWriteLeavesOldOrNewSet) {
    const RecordSet before = make_set("/data", 30, "old");
    const RecordSet after = make_set("/data", 200, "new");
    RecordStore::open_or_create(loc(), false, &before);

    const pid_t pid = ::fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        // the child dies half way through the transaction
        auto store = RecordStore::open(loc());
        store->write(after, [](uint64_t rows) {
            if (rows == 100) ::_exit(0);
        });
        ::_exit(1);
    }
    int status = 0;
    ASSERT_EQ(pid, ::waitpid(pid, &status, 0));
    ASSERT_TRUE(WIFEXITED(status));
    ASSERT_EQ(0, WEXITSTATUS(status));

    auto store = RecordStore::open(loc());
    const RecordSet seen = store->read();
    EXPECT_TRUE(seen == before || seen == after);
    EXPECT_EQ(before, seen);

    // the store stays writable after recovery
    store->write(after);
    EXPECT_EQ(after, RecordStore::open(loc())->read());
}
