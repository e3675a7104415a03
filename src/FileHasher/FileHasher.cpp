// === src/FileHasher/FileHasher.cpp ===
#include "FileHasher.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

#include <openssl/evp.h>

#define READ_CHUNK (256 * 1024)

namespace {
struct EvpCtxDeleter {
    void operator()(EVP_MD_CTX* c) const noexcept { EVP_MD_CTX_free(c); }
};
using EvpCtx = std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter>;

// Closes the descriptor on every exit path
struct FdGuard {
    int fd;
    ~FdGuard() { if (fd >= 0) ::close(fd); }
};

inline int64_t to_ns(time_t s, long ns) {
    return static_cast<int64_t>(s) * 1000000000LL + static_cast<int64_t>(ns);
}
}

Digest sha256_bytes(const std::string& data) {
    Digest out{};
    EvpCtx ctx(EVP_MD_CTX_new());
    unsigned int len = 0;
    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) {
        throw std::runtime_error("sha256_bytes: EVP digest failed");
    }
    return out;
}

// Desc: stream a file through SHA-256 and capture its metadata
// In: const std::string& path, FileRecord& out, std::string& error
// Out: bool (true on success)
bool hash_file(const std::string& path, FileRecord& out, std::string& error) {
    // O_NONBLOCK: a fifo swapped in after enumeration must not block the worker
    int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        error = "open failed: " + std::string(::strerror(errno));
        return false;
    }
    FdGuard guard{fd};

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        error = "fstat failed: " + std::string(::strerror(errno));
        return false;
    }
    if (!S_ISREG(st.st_mode)) {
        error = "not a regular file";
        return false;
    }

    EvpCtx ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        error = "EVP digest init failed";
        return false;
    }

    std::vector<char> buffer(READ_CHUNK);
    uint64_t done = 0;
    for (;;) {
        ssize_t r = ::read(fd, buffer.data(), buffer.size());
        if (r == 0) break;
        if (r < 0) {
            if (errno == EINTR) continue;
            error = "read failed: " + std::string(::strerror(errno));
            return false;
        }
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(r)) != 1) {
            error = "EVP digest update failed";
            return false;
        }
        done += static_cast<uint64_t>(r);
    }

    Digest digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1) {
        error = "EVP digest final failed";
        return false;
    }

    out.path         = path;
    out.size         = done;
    out.mtime_ns     = to_ns(st.st_mtim.tv_sec, st.st_mtim.tv_nsec);
    out.mode         = static_cast<uint32_t>(st.st_mode);
    out.content_hash = digest;
    return true;
}
