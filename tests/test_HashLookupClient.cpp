#include "HashLookupClient.hpp"
#include "TestUtil.hpp"

#include <sys/stat.h>

TEST(HashLookupParse, FoundWithIntegerTrust) {
    const LookupResponse r = parse_lookup_response(200,
        R"({"FileName": "./bin/ls", "hashlookup:trust": 93, "SHA-256": "ab"})");
    EXPECT_EQ(LookupResponse::Status::Found, r.status);
    ASSERT_TRUE(r.trust_score.has_value());
    EXPECT_EQ(93, *r.trust_score);
}

TEST(HashLookupParse, FoundWithStringTrust) {
    const LookupResponse r = parse_lookup_response(200, R"({"hashlookup:trust": "50"})");
    EXPECT_EQ(LookupResponse::Status::Found, r.status);
    EXPECT_EQ(50, r.trust_score.value_or(-1));
}

TEST(HashLookupParse, NotFound) {
    const LookupResponse r = parse_lookup_response(404, R"({"message": "Non existing SHA-256"})");
    EXPECT_EQ(LookupResponse::Status::NotFound, r.status);
    EXPECT_FALSE(r.trust_score.has_value());
}

TEST(HashLookupParse, FailuresAreNotVerdicts) {
    EXPECT_EQ(LookupResponse::Status::Failed, parse_lookup_response(500, "").status);
    EXPECT_EQ(LookupResponse::Status::Failed, parse_lookup_response(429, "{}").status);
    EXPECT_EQ(LookupResponse::Status::Failed, parse_lookup_response(200, "<html>").status);
    EXPECT_EQ(LookupResponse::Status::Failed, parse_lookup_response(200, "{}").status);
    EXPECT_EQ(LookupResponse::Status::Failed, parse_lookup_response(200, R"({"hashlookup:trust": 400})").status);
    EXPECT_EQ(LookupResponse::Status::Failed, parse_lookup_response(200, R"({"hashlookup:trust": null})").status);
}

class CurlClientTest : public QuietTest {
protected:
    TempDir dir;

    // stand-in for curl: prints `body`, then the status line curl's -w adds
    std::string fake_curl(const std::string& body, const std::string& code, int exit_code = 0) {
        const std::string p = dir / "fake_curl.sh";
        write_file(p, "#!/bin/sh\nprintf '%s\\n%s' '" + body + "' '" + code + "'\nexit " +
                      std::to_string(exit_code) + "\n");
        ::chmod(p.c_str(), 0755);
        return p;
    }
};

TEST_F(CurlClientTest, ParsesTransportOutput) {
    LookupSettings s;
    s.curl_binary = fake_curl(R"({"hashlookup:trust": 77})", "200");
    CurlHashLookupClient client(s);
    const LookupResponse r = client.lookup(Digest{});
    EXPECT_EQ(LookupResponse::Status::Found, r.status);
    EXPECT_EQ(77, r.trust_score.value_or(-1));
    EXPECT_EQ(200, r.http_status);
}

TEST_F(CurlClientTest, TransportErrorAfterRetries) {
    LookupSettings s;
    s.retries = 2;
    s.curl_binary = fake_curl("", "000", 28);
    CurlHashLookupClient client(s);
    const LookupResponse r = client.lookup(Digest{});
    EXPECT_EQ(LookupResponse::Status::Failed, r.status);
    EXPECT_FALSE(r.error.empty());
}
