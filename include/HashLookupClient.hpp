// === include/HashLookupClient.hpp ===
#pragma once
#include "FileRecord.hpp"
#include <optional>
#include <string>

struct LookupResponse {
    enum class Status { Found, NotFound, Failed };
    Status status{Status::Failed};
    std::optional<int> trust_score; // "hashlookup:trust" when Found
    int http_status{0};
    std::string error;              // set when Failed
};

// Boundary to the remote hash-reputation service. One call = one query
// for one hash; implementations must be callable from several threads.
class HashLookupClient {
public:
    virtual ~HashLookupClient() = default;
    virtual LookupResponse lookup(const Digest& hash) = 0;
};

struct LookupSettings {
    std::string endpoint = "https://hashlookup.circl.lu/lookup/sha256/";
    int timeout_sec = 3;
    int retries = 3;     // attempts per hash
    std::string curl_binary = "curl";
};

// Desc: parse an HTTP status + body pair from the service
LookupResponse parse_lookup_response(int http_status, const std::string& body);

// GET <endpoint><hex> through the system curl binary
class CurlHashLookupClient : public HashLookupClient {
public:
    explicit CurlHashLookupClient(LookupSettings settings);
    LookupResponse lookup(const Digest& hash) override;

private:
    LookupResponse query_once(const std::string& url) const;

    LookupSettings settings_;
};
