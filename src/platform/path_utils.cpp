#include "pkgstage/path_utils.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace pkgstage {

namespace fs = std::filesystem;

PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path,
                                bool allow_absolute) {
    PathResult result{false, {}, PathError::None};

    if (root.find('\0') != std::string::npos || relative_path.find('\0') != std::string::npos) {
        result.error = PathError::ContainsNul;
        return result;
    }

    fs::path rel(relative_path);
    if (rel.has_root_directory() && !allow_absolute) {
        result.error = PathError::AbsoluteNotAllowed;
        return result;
    }

    // Resolve "." and ".." purely on the components, so a symlink inside
    // the root can never be used to climb out of it
    std::vector<fs::path> kept;
    for (const fs::path& part : rel.relative_path()) {
        if (part.empty() || part == ".") continue;
        if (part == "..") {
            if (kept.empty()) {
                result.error = PathError::EscapesRoot;
                return result;
            }
            kept.pop_back();
            continue;
        }
        kept.push_back(part);
    }

    fs::path out = fs::path(root).lexically_normal();
    for (const auto& part : kept) {
        out /= part;
    }

    std::string text = out.generic_string();
    while (text.size() > 1 && text.back() == '/') {
        text.pop_back();
    }

    result.ok = true;
    result.path = std::move(text);
    return result;
}

} // namespace pkgstage
