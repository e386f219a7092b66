#include "pkgstage/platform.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

#include <openssl/evp.h>

namespace pkgstage {

namespace fs = std::filesystem;

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string to_hex(const unsigned char* bytes, unsigned int count) {
    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < count; ++i) {
        out << std::setw(2) << static_cast<unsigned>(bytes[i]);
    }
    return out.str();
}

// Feed a stream through the digest; empty string on success
std::string digest_stream(std::istream& in, EVP_MD_CTX* ctx) {
    char chunk[16 * 1024];
    while (in) {
        in.read(chunk, sizeof(chunk));
        std::streamsize got = in.gcount();
        if (got <= 0) break;
        if (EVP_DigestUpdate(ctx, chunk, static_cast<size_t>(got)) != 1) {
            return "sha256 update failed";
        }
    }
    if (in.bad()) return "read error";
    return {};
}

} // namespace

HashResult compute_sha256(const std::string& file_path) {
    HashResult result;

    std::ifstream in(file_path, std::ios::binary);
    if (!in) {
        result.error = "cannot open " + file_path;
        return result;
    }

    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        result.error = "sha256 unavailable";
        return result;
    }

    std::string failure = digest_stream(in, ctx.get());
    if (!failure.empty()) {
        result.error = failure + ": " + file_path;
        return result;
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md, &md_len) != 1) {
        result.error = "sha256 finalize failed: " + file_path;
        return result;
    }

    result.hex_digest = to_hex(md, md_len);
    result.ok = true;
    return result;
}

TreeSnapshot snapshot_tree(const std::string& root) {
    TreeSnapshot snapshot;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        snapshot.error = "not a directory: " + root;
        return snapshot;
    }

    const auto walk_failed = [&](const std::error_code& why) {
        snapshot.files.clear();
        snapshot.error = "cannot walk " + root + ": " + why.message();
        return snapshot;
    };

    fs::recursive_directory_iterator end;
    fs::recursive_directory_iterator it(root, ec);
    if (ec) return walk_failed(ec);

    while (it != end) {
        const fs::directory_entry& entry = *it;
        if (entry.is_regular_file(ec) && !ec) {
            auto hash = compute_sha256(entry.path().string());
            if (!hash.ok) {
                snapshot.files.clear();
                snapshot.error = hash.error;
                return snapshot;
            }

            fs::perms mode = entry.status(ec).permissions();
            if (ec) return walk_failed(ec);

            snapshot.files.push_back(FileDigest{
                entry.path().lexically_relative(root).generic_string(),
                hash.hex_digest,
                (mode & fs::perms::owner_exec) != fs::perms::none,
            });
        } else if (ec) {
            return walk_failed(ec);
        }

        it.increment(ec);
        if (ec) return walk_failed(ec);
    }

    std::sort(snapshot.files.begin(), snapshot.files.end(),
              [](const FileDigest& a, const FileDigest& b) { return a.path < b.path; });

    snapshot.ok = true;
    return snapshot;
}

} // namespace pkgstage
