#pragma once

#include "pkgstage/result.hpp"

#include <string>

namespace pkgstage {

// ============================================================================
// Staging Root
// ============================================================================

// Filesystem subtree that receives the installed image. Image paths such as
// "/usr/share/applications/x.desktop" map to "<root>/usr/share/...". Every
// write of a run goes through resolve(), which refuses paths that would
// leave the root. pkgstage never cleans a staging root.
class StagingRoot {
public:
    // root is made absolute; prefix must be an absolute image path
    static Result<StagingRoot> make(const std::string& root, const std::string& prefix);

    const std::string& path() const { return path_; }
    const std::string& prefix() const { return prefix_; }

    // Host path of an image path (absolute, or relative to the prefix)
    Result<std::string> resolve(const std::string& image_path) const;

    bool exists() const;

    // True if the root is missing or has no entries
    bool is_empty() const;

    // Create the root directory if missing
    Result<void> create() const;

private:
    StagingRoot(std::string path, std::string prefix)
        : path_(std::move(path)), prefix_(std::move(prefix)) {}

    std::string path_;
    std::string prefix_;
};

} // namespace pkgstage
