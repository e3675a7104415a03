// === ConfigManager.cpp ===
#include "ConfigManager.hpp"

#include <fstream>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <nlohmann/json.hpp>
using nlohmann::json;

// Desc: trim leading and trailing spaces inplace
// In: std::string& t
// Out: void
static inline void trim_inplace(std::string& t) {
    t.erase(t.begin(), std::find_if(t.begin(), t.end(), [](unsigned char c){ return !std::isspace(c); }));
    t.erase(std::find_if(t.rbegin(), t.rend(), [](unsigned char c){ return !std::isspace(c); }).base(), t.end());
}

// Desc: read a string-or-array-of-strings key into `out`
// In: const json& j, const char* key, std::vector<std::string>& out
// Out: bool (false on wrong type)
static bool read_string_list(const json& j, const char* key, std::vector<std::string>& out) {
    if (!j.contains(key)) return true;
    const auto& v = j[key];
    if (v.is_string()) {
        for (auto& s : ConfigManager::split_list(v.get<std::string>())) out.push_back(s);
        return true;
    }
    if (!v.is_array()) return false;
    for (const auto& e : v) {
        if (!e.is_string()) return false;
        std::string s = e.get<std::string>();
        trim_inplace(s);
        if (!s.empty()) out.push_back(s);
    }
    return true;
}

// Desc: read a positive integer key
// In: const json& j, const char* key, std::uint64_t& out
// Out: bool (false on wrong type or non-positive value)
static bool read_positive(const json& j, const char* key, std::uint64_t& out) {
    if (!j.contains(key)) return true;
    const auto& v = j[key];
    if (!v.is_number_integer() || v.get<long long>() <= 0) return false;
    out = static_cast<std::uint64_t>(v.get<long long>());
    return true;
}

static bool read_string(const json& j, const char* key, std::string& out) {
    if (!j.contains(key)) return true;
    if (!j[key].is_string()) return false;
    out = j[key].get<std::string>();
    return true;
}

static bool read_bool(const json& j, const char* key, bool& out) {
    if (!j.contains(key)) return true;
    if (!j[key].is_boolean()) return false;
    out = j[key].get<bool>();
    return true;
}

const char* run_mode_name(RunMode m) {
    switch (m) {
        case RunMode::None:       return "none";
        case RunMode::Create:     return "create";
        case RunMode::Check:      return "check";
        case RunMode::Update:     return "update";
        case RunMode::List:       return "list";
        case RunMode::Compare:    return "compare";
        case RunMode::CirclCheck: return "circl-check";
        case RunMode::CachePurge: return "cache-purge";
    }
    return "?";
}

ConfigManager::ConfigManager() : cache_(default_cache_path()) {
    const unsigned hc = std::thread::hardware_concurrency();
    hash_workers_ = hc ? hc : 1;
}

std::vector<std::string> ConfigManager::split_list(const std::string& csv) {
    std::vector<std::string> out;
    std::string::size_type start = 0;
    while (start <= csv.size()) {
        auto comma = csv.find(',', start);
        if (comma == std::string::npos) comma = csv.size();
        std::string item = csv.substr(start, comma - start);
        trim_inplace(item);
        if (!item.empty()) out.push_back(item);
        start = comma + 1;
    }
    return out;
}

// Desc: per-user cache location for lookup verdicts
// Out: std::string ($XDG_CACHE_HOME, then $HOME/.cache, then cwd)
std::string ConfigManager::default_cache_path() {
    const char* xdg = std::getenv("XDG_CACHE_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/circl_cache.db";
    const char* home = std::getenv("HOME");
    if (home && *home) return std::string(home) + "/.cache/circl_cache.db";
    return "circl_cache.db";
}

void ConfigManager::add_paths(const std::string& csv) {
    if (!paths_from_flags_) {
        paths_.clear();
        paths_from_flags_ = true;
    }
    for (auto& p : split_list(csv)) paths_.push_back(p);
}

void ConfigManager::add_excludes(const std::string& csv) {
    if (!excludes_from_flags_) {
        excludes_.clear();
        excludes_from_flags_ = true;
    }
    for (auto& p : split_list(csv)) excludes_.push_back(p);
}

bool ConfigManager::loadFromFile(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cerr << "[ConfigManager] cannot open file: " << config_path << "\n";
        return false;
    }

    json j;
    try { file >> j; }
    catch (const json::exception& e) { std::cerr << "[ConfigManager] invalid JSON: " << e.what() << "\n"; return false; }

    if (!j.is_object()) { std::cerr << "[ConfigManager] top level must be an object\n"; return false; }

    if (!read_string(j, "store", store_))   { std::cerr << "[ConfigManager] 'store' must be a string\n"; return false; }
    if (!read_string(j, "store2", store2_)) { std::cerr << "[ConfigManager] 'store2' must be a string\n"; return false; }
    if (!read_string(j, "cache", cache_))   { std::cerr << "[ConfigManager] 'cache' must be a string\n"; return false; }

    if (!read_string_list(j, "paths", paths_)) {
        std::cerr << "[ConfigManager] 'paths' must be string or array of strings\n";
        return false;
    }
    if (!read_string_list(j, "exclude", excludes_)) {
        std::cerr << "[ConfigManager] 'exclude' must be string or array of strings\n";
        return false;
    }

    if (!read_bool(j, "dont_exclude_db", dont_exclude_db_)) { std::cerr << "[ConfigManager] 'dont_exclude_db' must be bool\n"; return false; }
    if (!read_bool(j, "overwrite", overwrite_))             { std::cerr << "[ConfigManager] 'overwrite' must be bool\n"; return false; }
    if (!read_bool(j, "compare_time", compare_time_))       { std::cerr << "[ConfigManager] 'compare_time' must be bool\n"; return false; }

    if (!read_positive(j, "hash_workers", hash_workers_)) {
        std::cerr << "[ConfigManager] 'hash_workers' must be a positive integer\n";
        return false;
    }
    if (!read_positive(j, "max_pending_files", max_pending_files_)) {
        std::cerr << "[ConfigManager] 'max_pending_files' must be a positive integer\n";
        return false;
    }

    // lookup { endpoint, workers, timeout_sec, retries }
    if (j.contains("lookup")) {
        const auto& l = j["lookup"];
        if (!l.is_object()) { std::cerr << "[ConfigManager] 'lookup' must be an object\n"; return false; }
        std::uint64_t timeout = static_cast<std::uint64_t>(lookup_.timeout_sec);
        std::uint64_t retries = static_cast<std::uint64_t>(lookup_.retries);
        if (!read_string(l, "endpoint", lookup_.endpoint) || lookup_.endpoint.empty()) {
            std::cerr << "[ConfigManager] 'lookup.endpoint' must be a non-empty string\n";
            return false;
        }
        if (!read_positive(l, "workers", lookup_workers_) ||
            !read_positive(l, "timeout_sec", timeout) ||
            !read_positive(l, "retries", retries)) {
            std::cerr << "[ConfigManager] 'lookup.workers/timeout_sec/retries' must be positive integers\n";
            return false;
        }
        lookup_.timeout_sec = static_cast<int>(timeout);
        lookup_.retries = static_cast<int>(retries);
    }

    // log { path, level }
    if (j.contains("log")) {
        const auto& l = j["log"];
        if (!l.is_object()) { std::cerr << "[ConfigManager] 'log' must be an object\n"; return false; }
        if (!read_string(l, "path", log_path_)) { std::cerr << "[ConfigManager] 'log.path' must be a string\n"; return false; }
        std::string level;
        if (!read_string(l, "level", level)) { std::cerr << "[ConfigManager] 'log.level' must be a string\n"; return false; }
        if (!level.empty() && !parse_log_level(level, log_level_)) {
            std::cerr << "[ConfigManager] unknown 'log.level': " << level << "\n";
            return false;
        }
    }

    #ifdef DEBUG
    std::cout << "[ConfigManager] store=" << store_ << " cache=" << cache_
              << " paths=" << paths_.size() << " excludes=" << excludes_.size() << "\n";
    #endif
    return true;
}

bool ConfigManager::validate(RunMode mode, std::string& error) const {
    if (mode == RunMode::None) { error = "no mode selected"; return false; }
    if (hash_workers_ == 0 || max_pending_files_ == 0 || lookup_workers_ == 0) {
        error = "worker counts must be positive";
        return false;
    }
    switch (mode) {
        case RunMode::Create:
        case RunMode::Check:
        case RunMode::Update:
            if (paths_.empty()) { error = std::string(run_mode_name(mode)) + " needs at least one --path"; return false; }
            if (store_.empty()) { error = "store location is empty"; return false; }
            break;
        case RunMode::List:
            if (store_.empty()) { error = "store location is empty"; return false; }
            break;
        case RunMode::Compare:
            if (store2_.empty()) { error = "Compare need db2 parameter"; return false; }
            break;
        case RunMode::CirclCheck:
            if (cache_.empty()) { error = "cache location is empty"; return false; }
            break;
        case RunMode::CachePurge:
            if (max_age_days_ < 0) { error = "cache-purge needs --max-age-days"; return false; }
            if (max_age_days_ > INT64_MAX / kSecondsPerDay) {
                error = "--max-age-days " + std::to_string(max_age_days_) + " is out of range";
                return false;
            }
            break;
        case RunMode::None:
            break;
    }
    return true;
}
