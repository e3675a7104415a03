// main.cpp
#include "ConfigManager.hpp"
#include "HashLookupClient.hpp"
#include "Logger.hpp"
#include "Operations.hpp"
#include "Report.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

void print_help() {
    std::cout << "Usage:\n"
              << "  ./integrity_watcher <mode> [options]\n"
              << "\nModes (exactly one):\n"
              << "  --create             Scan --path and record a new store\n"
              << "  --check              Scan --path and diff against the store\n"
              << "  --update             Like --check, then replace the stored records\n"
              << "  --list               Print the stored records\n"
              << "  --compare            Diff --db against --db2\n"
              << "  --circl-check        Look up stored hashes on hashlookup.circl.lu\n"
              << "  --cache-purge        Drop cached verdicts older than --max-age-days\n"
              << "\nOptions:\n"
              << "  --path a,b           Roots to scan\n"
              << "  --exclude x,y        Paths to leave out\n"
              << "  --db FILE            Record store (default files_data.db)\n"
              << "  --db2 FILE           Second store for --compare\n"
              << "  --cache FILE         Lookup cache (default ~/.cache/circl_cache.db)\n"
              << "  --config FILE        JSON config, flags override it\n"
              << "  --overwrite          Replace an existing store on --create\n"
              << "  --dont-exclude-db    Do not skip the store file while scanning\n"
              << "  --compare-time       Report modification time changes\n"
              << "  --hash-workers N     Hashing threads\n"
              << "  --lookup-workers N   Concurrent lookups\n"
              << "  --max-age-days N     Age limit for --cache-purge\n"
              << "  --log-level L        trace|debug|info|warn|error (env INTEGRITY_LOG)\n"
              << "  --log-file F         Also append log lines to F\n"
              << "  -h, --help           Show this help message\n";
}

// Desc: parse a non-negative decimal argument
// In: const std::string& s, long long& out
// Out: bool
static bool parse_count(const std::string& s, long long& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    const long long v = std::strtoll(s.c_str(), &end, 10);
    if (!end || *end != '\0' || v < 0) return false;
    out = v;
    return true;
}

// Desc: print a finished operation and map it to the exit code
// In: RunMode mode, const OperationStatus& r, Print print (result body)
// Out: int (0 ok, warnings allowed; 1 on fatal error)
template <typename Print>
static int finish(RunMode mode, const OperationStatus& r, Print print) {
    if (!r.ok) {
        std::cerr << "[Main] " << run_mode_name(mode) << " failed (" << error_kind_name(r.error_kind)
                  << "): " << r.error << "\n";
        return 1;
    }
    print();
    print_warnings(std::cout, r.warnings);
    return 0;
}

int main(int argc, char** argv) {
    // Handle help flag early
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "-h" || a == "--help") {
            print_help();
            return 0;
        }
    }

    // the config file is loaded first so that flags can override it
    ConfigManager cfg;
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            if (!cfg.loadFromFile(argv[i + 1])) {
                std::cerr << "[Main] aborted: invalid config " << argv[i + 1] << "\n";
                return 1;
            }
        }
    }

    RunMode mode = RunMode::None;
    bool log_level_flag = false;
    auto select = [&](RunMode m) {
        if (mode != RunMode::None && mode != m) {
            std::cerr << "[Main] only one mode allowed (" << run_mode_name(mode)
                      << " and " << run_mode_name(m) << ")\n";
            return false;
        }
        mode = m;
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "[Main] " << a << " needs a value\n";
                return false;
            }
            out = argv[++i];
            return true;
        };
        std::string v;
        long long n = 0;

        if      (a == "--create")      { if (!select(RunMode::Create)) return 1; }
        else if (a == "--check")       { if (!select(RunMode::Check)) return 1; }
        else if (a == "--update")      { if (!select(RunMode::Update)) return 1; }
        else if (a == "--list")        { if (!select(RunMode::List)) return 1; }
        else if (a == "--compare")     { if (!select(RunMode::Compare)) return 1; }
        else if (a == "--circl-check") { if (!select(RunMode::CirclCheck)) return 1; }
        else if (a == "--cache-purge") { if (!select(RunMode::CachePurge)) return 1; }
        else if (a == "--overwrite")       cfg.set_overwrite(true);
        else if (a == "--dont-exclude-db") cfg.set_dont_exclude_db(true);
        else if (a == "--compare-time")    cfg.set_compare_time(true);
        else if (a == "--config")  { if (!value(v)) return 1; }
        else if (a == "--path")    { if (!value(v)) return 1; cfg.add_paths(v); }
        else if (a == "--exclude") { if (!value(v)) return 1; cfg.add_excludes(v); }
        else if (a == "--db")      { if (!value(v)) return 1; cfg.set_store(v); }
        else if (a == "--db2")     { if (!value(v)) return 1; cfg.set_store2(v); }
        else if (a == "--cache")   { if (!value(v)) return 1; cfg.set_cache(v); }
        else if (a == "--log-file"){ if (!value(v)) return 1; cfg.set_log_path(v); }
        else if (a == "--log-level") {
            if (!value(v)) return 1;
            LogLevel lvl = LogLevel::Info;
            if (!parse_log_level(v, lvl)) {
                std::cerr << "[Main] unknown log level: " << v << "\n";
                return 1;
            }
            cfg.set_log_level(lvl);
            log_level_flag = true;
        }
        else if (a == "--hash-workers" || a == "--lookup-workers" || a == "--max-age-days") {
            if (!value(v)) return 1;
            if (!parse_count(v, n) || (n == 0 && a != "--max-age-days")) {
                std::cerr << "[Main] invalid value for " << a << ": " << v << "\n";
                return 1;
            }
            if (a == "--hash-workers")        cfg.set_hash_workers(static_cast<std::uint64_t>(n));
            else if (a == "--lookup-workers") cfg.set_lookup_workers(static_cast<std::uint64_t>(n));
            else                              cfg.set_max_age_days(n);
        }
        else {
            std::cerr << "[Main] unknown argument: " << a << "\n";
            print_help();
            return 1;
        }
    }

    // INTEGRITY_LOG beats the config file, --log-level beats both
    const LogLevel level = log_level_flag ? cfg.log_level() : log_level_from_env(cfg.log_level());
    logger_init(level, cfg.log_path());

    std::string error;
    if (!cfg.validate(mode, error)) {
        std::cerr << "[Main] aborted: " << error << "\n";
        if (mode == RunMode::None) print_help();
        return 1;
    }

    ScanRequest req;
    req.paths = cfg.paths();
    req.excludes = cfg.excludes();
    req.exclude_store = !cfg.dont_exclude_db();
    req.hash_workers = static_cast<size_t>(cfg.hash_workers());
    req.max_pending_files = static_cast<size_t>(cfg.max_pending_files());

    DiffOptions opts;
    opts.compare_time = cfg.compare_time();

    switch (mode) {
        case RunMode::Create: {
            const CreateResult r = create_store(req, cfg.store(), cfg.overwrite());
            return finish(mode, r, [&]() { print_create(std::cout, r); });
        }
        case RunMode::Check: {
            const CheckResult r = check_store(req, cfg.store(), opts);
            return finish(mode, r, [&]() { print_check(std::cout, r, opts.compare_time); });
        }
        case RunMode::Update: {
            const UpdateResult r = update_store(req, cfg.store(), opts);
            return finish(mode, r, [&]() { print_update(std::cout, r, opts.compare_time); });
        }
        case RunMode::List: {
            const ListResult r = list_store(cfg.store());
            return finish(mode, r, [&]() { print_list(std::cout, r); });
        }
        case RunMode::Compare: {
            const CompareResult r = compare_stores(cfg.store(), cfg.store2(), opts);
            return finish(mode, r, [&]() { print_compare(std::cout, r, opts.compare_time); });
        }
        case RunMode::CirclCheck: {
            CurlHashLookupClient client(cfg.lookup());
            const CirclCheckResult r = circl_check(cfg.store(), cfg.cache(), client,
                                                   static_cast<size_t>(cfg.lookup_workers()));
            return finish(mode, r, [&]() { print_circl_check(std::cout, r); });
        }
        case RunMode::CachePurge: {
            const PurgeResult r = purge_cache(cfg.cache(), cfg.max_age_seconds());
            return finish(mode, r, [&]() { print_purge(std::cout, r); });
        }
        case RunMode::None:
            break;
    }
    return 1;
}
