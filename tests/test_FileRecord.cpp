#include "FileRecord.hpp"
#include <gtest/gtest.h>

TEST(FileRecord, HexRoundTrip) {
    Digest d{};
    for (size_t i = 0; i < d.size(); ++i) d[i] = static_cast<unsigned char>(i * 7 + 1);
    const std::string hex = digest_to_hex(d);
    ASSERT_EQ(64u, hex.size());
    EXPECT_EQ("0108", hex.substr(0, 4));

    Digest back{};
    ASSERT_TRUE(digest_from_hex(hex, back));
    EXPECT_EQ(d, back);
}

TEST(FileRecord, HexAcceptsUpperCase) {
    Digest d{};
    ASSERT_TRUE(digest_from_hex(std::string(64, 'F'), d));
    EXPECT_EQ(0xFF, d[0]);
    EXPECT_EQ(0xFF, d[31]);
}

TEST(FileRecord, HexRejectsBadInput) {
    Digest d{};
    d[0] = 42;
    EXPECT_FALSE(digest_from_hex("abc", d));
    EXPECT_FALSE(digest_from_hex(std::string(63, '0') + "g", d));
    EXPECT_EQ(42, d[0]);
}

TEST(FileRecord, FormatTimeIsUtc) {
    EXPECT_EQ("1970-01-01 00:00:00 UTC", format_time_ns(0));
    EXPECT_EQ("2001-09-09 01:46:40 UTC", format_time_ns(1000000000LL * 1000000000LL));
}

TEST(FileRecord, FormatModeKeepsPermissionBits) {
    EXPECT_EQ("644", format_mode(0100644));
    EXPECT_EQ("4755", format_mode(0104755));
}

TEST(FileRecord, SortedPaths) {
    RecordSet set;
    set["/b"].path = "/b";
    set["/a/z"].path = "/a/z";
    set["/a"].path = "/a";
    const auto paths = sorted_paths(set);
    ASSERT_EQ(3u, paths.size());
    EXPECT_EQ("/a", paths[0]);
    EXPECT_EQ("/a/z", paths[1]);
    EXPECT_EQ("/b", paths[2]);
}
