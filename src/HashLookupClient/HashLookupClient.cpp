// === src/HashLookupClient/HashLookupClient.cpp ===
#include "HashLookupClient.hpp"
#include "Logger.hpp"

#include <array>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <sys/wait.h>
#include <thread>
#include <utility>

#include <nlohmann/json.hpp>
using nlohmann::json;

// Desc: wrap a value in single quotes for /bin/sh
// In: const std::string& s
// Out: std::string
static std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

// Desc: map service status/body to a response
// In: int http_status, const std::string& body
// Out: LookupResponse
LookupResponse parse_lookup_response(int http_status, const std::string& body) {
    LookupResponse r;
    r.http_status = http_status;

    if (http_status == 404) {
        r.status = LookupResponse::Status::NotFound;
        return r;
    }
    if (http_status != 200) {
        r.error = "unexpected HTTP status " + std::to_string(http_status);
        return r;
    }

    json j = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        r.error = "malformed JSON response";
        return r;
    }
    if (!j.contains("hashlookup:trust")) {
        r.error = "response lacks 'hashlookup:trust'";
        return r;
    }
    const auto& t = j["hashlookup:trust"];
    int score = -1;
    if (t.is_number_integer()) {
        score = t.get<int>();
    } else if (t.is_string()) {
        const std::string s = t.get<std::string>();
        char* end = nullptr;
        long v = std::strtol(s.c_str(), &end, 10);
        if (!s.empty() && end && *end == '\0') score = static_cast<int>(v);
    }
    if (score < 0 || score > 100) {
        r.error = "invalid 'hashlookup:trust' value: " + t.dump();
        return r;
    }
    r.status = LookupResponse::Status::Found;
    r.trust_score = score;
    return r;
}

CurlHashLookupClient::CurlHashLookupClient(LookupSettings settings)
    : settings_(std::move(settings)) {
    if (settings_.retries < 1) settings_.retries = 1;
    if (settings_.timeout_sec < 1) settings_.timeout_sec = 1;
}

// Desc: run curl once and split body / trailing status line
// In: const std::string& url
// Out: LookupResponse (Failed on transport errors)
LookupResponse CurlHashLookupClient::query_once(const std::string& url) const {
    std::ostringstream command;
    command << settings_.curl_binary << " -sS"
            << " --max-time " << settings_.timeout_sec
            << " -H 'Accept: application/json'"
            << " -w '\\n%{http_code}' "
            << shell_quote(url) << " 2>/dev/null";

    LookupResponse failed;
    FILE* pipe = popen(command.str().c_str(), "r");
    if (!pipe) {
        failed.error = "failed to execute curl";
        return failed;
    }

    std::array<char, 4096> buffer{};
    std::string output;
    size_t n;
    while ((n = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        output.append(buffer.data(), n);
    }
    const int status = pclose(pipe);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        failed.error = "curl exited with status " +
                       std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : status);
        return failed;
    }

    const auto nl = output.rfind('\n');
    const std::string code = (nl == std::string::npos) ? output : output.substr(nl + 1);
    const std::string body = (nl == std::string::npos) ? std::string() : output.substr(0, nl);
    char* end = nullptr;
    const long http = std::strtol(code.c_str(), &end, 10);
    if (code.empty() || (end && *end != '\0') || http <= 0) {
        failed.error = "no HTTP status in curl output";
        return failed;
    }
    return parse_lookup_response(static_cast<int>(http), body);
}

// Desc: query one hash with bounded retries and linear back-off
// In: const Digest& hash
// Out: LookupResponse
LookupResponse CurlHashLookupClient::lookup(const Digest& hash) {
    const std::string url = settings_.endpoint + digest_to_hex(hash);
    LookupResponse last;
    for (int attempt = 1; attempt <= settings_.retries; ++attempt) {
        last = query_once(url);
        if (last.status != LookupResponse::Status::Failed) return last;
        if (attempt < settings_.retries) {
            log_error("Lookup", "error " + last.error + " on " + url + ", retrying");
            std::this_thread::sleep_for(std::chrono::milliseconds(50 * attempt));
        }
    }
    return last;
}
