// === include/FileHasher.hpp ===
#pragma once
#include "FileRecord.hpp"
#include <string>

// Desc: read the whole file behind `path` (symlinks followed) and fill
//       size/mtime/mode/content_hash of `out`; out.path is set to `path`.
// Out: false with `error` set when the file vanished, is unreadable or is
//      not a regular file.
bool hash_file(const std::string& path, FileRecord& out, std::string& error);

Digest sha256_bytes(const std::string& data);
