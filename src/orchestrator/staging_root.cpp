#include "pkgstage/staging_root.hpp"
#include "pkgstage/path_utils.hpp"
#include "pkgstage/platform.hpp"

namespace pkgstage {

namespace {

constexpr const char* STAGE = "staging";

} // namespace

Result<StagingRoot> StagingRoot::make(const std::string& root, const std::string& prefix) {
    if (root.empty()) {
        return Result<StagingRoot>::err(
            Error(ErrorCode::CONFIGURATION_ERROR, "staging root not set").withStage(STAGE));
    }
    if (prefix.empty() || prefix[0] != '/') {
        return Result<StagingRoot>::err(
            Error(ErrorCode::CONFIGURATION_ERROR, "install prefix must be absolute: '" + prefix + "'")
                .withStage(STAGE));
    }

    std::string abs_root = absolute_path(root);
    if (abs_root == "/") {
        return Result<StagingRoot>::err(
            Error(ErrorCode::CONFIGURATION_ERROR, "refusing to stage into /").withStage(STAGE));
    }

    // Normalize the prefix against a dummy root so "/usr/../opt" cannot escape
    auto normalized = normalize_under_root("/", prefix, true);
    if (!normalized.ok) {
        return Result<StagingRoot>::err(
            Error(ErrorCode::PATH_ESCAPES_ROOT, path_error_to_string(normalized.error))
                .withStage(STAGE).withSubject(prefix));
    }

    return Result<StagingRoot>::ok(StagingRoot(abs_root, normalized.path));
}

Result<std::string> StagingRoot::resolve(const std::string& image_path) const {
    std::string full = image_path;
    if (full.empty() || full[0] != '/') {
        full = join_path(prefix_, image_path);
    }

    auto result = normalize_under_root(path_, full, true);
    if (!result.ok) {
        return Result<std::string>::err(
            Error(ErrorCode::PATH_ESCAPES_ROOT, path_error_to_string(result.error))
                .withStage(STAGE).withSubject(image_path));
    }
    return Result<std::string>::ok(result.path);
}

bool StagingRoot::exists() const {
    return is_directory(path_);
}

bool StagingRoot::is_empty() const {
    return list_directory(path_).empty();
}

Result<void> StagingRoot::create() const {
    if (!create_directories(path_)) {
        return Result<void>::err(
            Error(ErrorCode::IO_ERROR, "cannot create staging root " + path_).withStage(STAGE));
    }
    return Result<void>::ok();
}

} // namespace pkgstage
