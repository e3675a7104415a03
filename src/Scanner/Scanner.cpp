// === src/Scanner/Scanner.cpp ===
#include "Scanner.hpp"
#include "AsyncHashQueue.hpp"
#include "FileHasher.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <dirent.h>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <sys/stat.h>
#include <utility>

namespace fs = std::filesystem;

namespace {
struct DirKey {
    uint64_t dev, ino;
    bool operator<(const DirKey& o) const noexcept {
        return (dev < o.dev) || (dev == o.dev && ino < o.ino);
    }
};

// directory waiting to be read: path as reached + its resolved form
struct PendingDir {
    std::string lexical;
    std::string resolved;
};

inline std::string join_path(const std::string& dir, const char* name) {
    if (!dir.empty() && dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

struct DirCloser {
    void operator()(DIR* d) const noexcept { if (d) ::closedir(d); }
};
using DirHandle = std::unique_ptr<DIR, DirCloser>;

struct FreeDeleter {
    void operator()(char* p) const noexcept { ::free(p); }
};

inline std::string strip_trailing_slash(std::string s) {
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}
}

// Desc: make absolute and collapse "." / ".." / repeated separators
// In: const std::string& path
// Out: std::string (absolute, no trailing slash)
std::string normalize_absolute(const std::string& path) {
    std::error_code ec;
    fs::path p(path);
    if (!p.is_absolute()) {
        fs::path abs = fs::absolute(p, ec);
        if (!ec) p = abs;
    }
    return strip_trailing_slash(p.lexically_normal().string());
}

// Desc: resolve symlinks of the existing part of a path
// In: const std::string& path
// Out: std::string (canonical form, lexical form on error)
std::string resolve_path(const std::string& path) {
    std::error_code ec;
    fs::path norm = fs::weakly_canonical(fs::path(normalize_absolute(path)), ec);
    if (ec) return normalize_absolute(path);
    return strip_trailing_slash(norm.lexically_normal().string());
}

bool path_is_under(const std::string& path, const std::string& prefix) {
    if (prefix.empty()) return false;
    if (prefix == "/") return !path.empty() && path[0] == '/';
    if (path.size() < prefix.size()) return false;
    if (path.compare(0, prefix.size(), prefix) != 0) return false;
    return path.size() == prefix.size() || path[prefix.size()] == '/';
}

ExcludeSet::ExcludeSet(const std::vector<std::string>& paths) {
    for (const auto& p : paths) {
        if (p.empty()) continue;
        const std::string lexical  = normalize_absolute(p);
        const std::string resolved = resolve_path(p);
        if (std::find(entries_.begin(), entries_.end(), lexical) == entries_.end())
            entries_.push_back(lexical);
        if (std::find(entries_.begin(), entries_.end(), resolved) == entries_.end())
            entries_.push_back(resolved);
    }
}

bool ExcludeSet::matches(const std::string& abs_path) const {
    for (const auto& e : entries_) {
        if (path_is_under(abs_path, e)) return true;
    }
    return false;
}

// Desc: hash one file on a worker thread and merge the result
// In: const std::string& path
// Out: void (records on success, FileUnreadable warning otherwise)
void ScanCollector::hash_and_merge(const std::string& path) {
    FileRecord rec;
    std::string err;
    if (!hash_file(path, rec, err)) {
        log_warn("Scanner", "skipping " + path + ": " + err);
        std::lock_guard<std::mutex> lk(mtx_);
        out_.warnings.push_back(Warning{ErrorKind::FileUnreadable, path, err});
        return;
    }
    #ifdef DEBUG
    log_trace("Scanner", "hashed " + path + " " + digest_to_hex(rec.content_hash));
    #endif
    std::lock_guard<std::mutex> lk(mtx_);
    out_.stats.bytes_hashed += rec.size;
    if (out_.records.emplace(rec.path, rec).second) out_.stats.files_hashed++;
}

// Desc: walk roots, hand regular files to the hash workers, merge results
// In: const ScanSettings& settings
// Out: ScanOutcome (records + soft warnings); throws IntegrityError on a missing root
ScanOutcome scan_tree(const ScanSettings& settings) {
    const ExcludeSet excludes(settings.excludes);

    // [Resolve roots first] a missing root aborts before any hashing starts
    std::vector<std::string> roots;
    for (const auto& r : settings.roots) {
        struct stat st{};
        const std::string lexical = normalize_absolute(r);
        if (::stat(lexical.c_str(), &st) != 0) {
            throw IntegrityError(ErrorKind::RootPathNotFound,
                                 "root path not found: " + r + " (" + std::string(::strerror(errno)) + ")");
        }
        const std::string root = resolve_path(lexical);
        if (std::find(roots.begin(), roots.end(), root) == roots.end())
            roots.push_back(root);
    }

    ScanOutcome out;
    ScanCollector collector(out);

    // [Fan-out] workers hash, the collector merges under a single lock
    AsyncHashQueue queue(settings.hash_workers, settings.max_pending_files,
        [&](const HashTask& t) { collector.hash_and_merge(t.path); });

    std::set<DirKey> visited;
    uint64_t dirs_visited = 0, excluded = 0, skipped = 0;
    std::vector<Warning> walk_warnings;

    auto soft_fail = [&](const std::string& path, const std::string& msg) {
        log_warn("Scanner", path + ": " + msg);
        walk_warnings.push_back(Warning{ErrorKind::FileUnreadable, path, msg});
    };

    for (const auto& root : roots) {
        if (excludes.matches(root)) {
            log_warn("Scanner", "excluding top dir " + root);
            excluded++;
            continue;
        }
        struct stat rst{};
        if (::stat(root.c_str(), &rst) != 0) {
            throw IntegrityError(ErrorKind::RootPathNotFound,
                                 "root path vanished: " + root + " (" + std::string(::strerror(errno)) + ")");
        }
        if (S_ISREG(rst.st_mode)) {
            queue.enqueue(HashTask{root});
            continue;
        }
        if (!S_ISDIR(rst.st_mode)) {
            log_warn("Scanner", "path " + root + " unsupported type");
            skipped++;
            continue;
        }

        std::deque<PendingDir> dqueue;
        dqueue.push_back(PendingDir{root, root});
        while (!dqueue.empty()) {
            PendingDir dir = std::move(dqueue.front());
            dqueue.pop_front();

            struct stat dst{};
            if (::stat(dir.lexical.c_str(), &dst) != 0) {
                soft_fail(dir.lexical, "stat failed: " + std::string(::strerror(errno)));
                continue;
            }
            // symlinked directories can loop back; device+inode identifies a dir
            const DirKey key{static_cast<uint64_t>(dst.st_dev), static_cast<uint64_t>(dst.st_ino)};
            if (!visited.insert(key).second) {
                log_debug("Scanner", "already visited " + dir.lexical + ", skipping");
                continue;
            }
            dirs_visited++;

            DirHandle d(::opendir(dir.lexical.c_str()));
            if (!d) {
                soft_fail(dir.lexical, "opendir failed: " + std::string(::strerror(errno)));
                continue;
            }

            struct dirent* ent;
            while ((ent = ::readdir(d.get())) != nullptr) {
                if (::strcmp(ent->d_name, ".") == 0 || ::strcmp(ent->d_name, "..") == 0) continue;

                const std::string child = join_path(dir.lexical, ent->d_name);
                std::string child_resolved = join_path(dir.resolved, ent->d_name);

                struct stat lst{};
                if (::lstat(child.c_str(), &lst) != 0) {
                    soft_fail(child, "lstat failed: " + std::string(::strerror(errno)));
                    continue;
                }
                if (S_ISLNK(lst.st_mode)) {
                    std::unique_ptr<char, FreeDeleter> real(::realpath(child.c_str(), nullptr));
                    if (!real) {
                        soft_fail(child, "dangling symlink: " + std::string(::strerror(errno)));
                        continue;
                    }
                    child_resolved = real.get();
                }

                if (excludes.matches(child) || excludes.matches(child_resolved)) {
                    log_debug("Scanner", "skipping " + child);
                    excluded++;
                    continue;
                }

                struct stat st{};
                if (::stat(child.c_str(), &st) != 0) {
                    soft_fail(child, "stat failed: " + std::string(::strerror(errno)));
                    continue;
                }
                if (S_ISDIR(st.st_mode)) {
                    dqueue.push_back(PendingDir{child, child_resolved});
                } else if (S_ISREG(st.st_mode)) {
                    queue.enqueue(HashTask{child});
                } else {
                    log_debug("Scanner", "path " + child + " unsupported type");
                    skipped++;
                }
            }
        }
    }

    // [Fan-in] nothing reads `out` until every worker has finished
    queue.drain_and_join();

    out.warnings.insert(out.warnings.end(), walk_warnings.begin(), walk_warnings.end());
    out.stats.dirs_visited = dirs_visited;
    out.stats.excluded     = excluded;
    out.stats.skipped      = skipped;

    log_info("Scanner", "scanned " + std::to_string(out.stats.files_hashed) + " files in " +
             std::to_string(dirs_visited) + " dirs (" + std::to_string(out.stats.bytes_hashed) +
             " bytes, " + std::to_string(excluded) + " excluded, " +
             std::to_string(out.warnings.size()) + " warnings)");
    return out;
}
