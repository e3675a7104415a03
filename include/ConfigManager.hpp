// include/ConfigManager.hpp
#pragma once
#include "HashLookupClient.hpp"
#include "Logger.hpp"
#include <vector>
#include <string>
#include <cstdint>

// Selected operation; exactly one per invocation
enum class RunMode { None, Create, Check, Update, List, Compare, CirclCheck, CachePurge };

const char* run_mode_name(RunMode m);

class ConfigManager {
public:
    static constexpr std::int64_t kSecondsPerDay = 86400;

    explicit ConfigManager();
    bool loadFromFile(const std::string& config_path);

    // Desc: mode-specific checks before anything is opened
    // Out: false with `error` set when the combination cannot run
    bool validate(RunMode mode, std::string& error) const;

    // Desc: split "a,b,c" into trimmed non-empty items
    static std::vector<std::string> split_list(const std::string& csv);
    static std::string default_cache_path();

    const std::string& store()  const { return store_; }
    const std::string& store2() const { return store2_; }
    const std::string& cache()  const { return cache_; }
    const std::vector<std::string>& paths()    const { return paths_; }
    const std::vector<std::string>& excludes() const { return excludes_; }
    bool dont_exclude_db() const { return dont_exclude_db_; }
    bool overwrite()       const { return overwrite_; }
    bool compare_time()    const { return compare_time_; }
    std::uint64_t hash_workers()      const { return hash_workers_; }
    std::uint64_t max_pending_files() const { return max_pending_files_; }
    std::uint64_t lookup_workers()    const { return lookup_workers_; }
    std::int64_t  max_age_days()      const { return max_age_days_; }
    // max_age_days in seconds; only meaningful after validate(CachePurge)
    std::int64_t  max_age_seconds()   const { return max_age_days_ * kSecondsPerDay; }
    const LookupSettings& lookup() const { return lookup_; }
    const std::string& log_path() const { return log_path_; }
    LogLevel log_level() const { return log_level_; }

    // command-line overrides; the first --path / --exclude replaces the
    // list read from the config file, later ones append
    void set_store(const std::string& v)  { store_ = v; }
    void set_store2(const std::string& v) { store2_ = v; }
    void set_cache(const std::string& v)  { cache_ = v; }
    void add_paths(const std::string& csv);
    void add_excludes(const std::string& csv);
    void set_dont_exclude_db(bool v) { dont_exclude_db_ = v; }
    void set_overwrite(bool v)       { overwrite_ = v; }
    void set_compare_time(bool v)    { compare_time_ = v; }
    void set_hash_workers(std::uint64_t v)   { hash_workers_ = v; }
    void set_lookup_workers(std::uint64_t v) { lookup_workers_ = v; }
    void set_max_age_days(std::int64_t v)    { max_age_days_ = v; }
    void set_log_path(const std::string& v)  { log_path_ = v; }
    void set_log_level(LogLevel v)           { log_level_ = v; }

private:
    std::string store_ = "files_data.db";
    std::string store2_;
    std::string cache_;
    std::vector<std::string> paths_;
    std::vector<std::string> excludes_;
    bool paths_from_flags_ = false;
    bool excludes_from_flags_ = false;
    bool dont_exclude_db_ = false;
    bool overwrite_ = false;
    bool compare_time_ = false;
    std::uint64_t hash_workers_ = 1;
    std::uint64_t max_pending_files_ = 128;
    std::uint64_t lookup_workers_ = 8;
    std::int64_t  max_age_days_ = -1; // unset
    LookupSettings lookup_;
    std::string log_path_;
    LogLevel log_level_ = LogLevel::Info;
};
