#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pkgstage {

// ============================================================================
// Durable Writes
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Readers of path see either the old content or all of the new content.
// The parent directory is synced after the rename.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// Move a finished directory onto `to`, discarding whatever was there
AtomicWriteResult replace_directory(const std::string& from, const std::string& to);

// Sibling of base that no other caller in this or another process will get:
// "<base>.tmp.<pid>.<seed>.<n>"
std::string make_temp_path(const std::string& base);

// ============================================================================
// Filesystem
// ============================================================================

std::string get_parent_directory(const std::string& path);

std::string get_filename(const std::string& path);

std::string join_path(const std::string& base, const std::string& rel);

// Absolute, lexically normalized form of path (no filesystem access)
std::string absolute_path(const std::string& path);

bool path_exists(const std::string& path);

bool is_directory(const std::string& path);

bool is_regular_file(const std::string& path);

// File names (not paths) of the entries of a directory, sorted
std::vector<std::string> list_directory(const std::string& path);

bool create_directories(const std::string& path);

bool remove_directory(const std::string& path);

bool copy_file(const std::string& src, const std::string& dst);

std::optional<std::string> read_file(const std::string& path);

// ============================================================================
// Content Digests
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // 64 lowercase hex digits
};

HashResult compute_sha256(const std::string& file_path);

struct FileDigest {
    std::string path;        // relative to the snapshot root, '/' separated
    std::string sha256;
    bool executable = false;
};

struct TreeSnapshot {
    bool ok = false;
    std::string error;
    std::vector<FileDigest> files;   // sorted by path
};

// Digest every regular file below root. Two snapshots compare equal iff
// the trees hold byte-identical files at identical paths.
TreeSnapshot snapshot_tree(const std::string& root);

} // namespace pkgstage
