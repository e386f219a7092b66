#pragma once

#include "pkgstage/recipe.hpp"
#include "pkgstage/result.hpp"
#include "pkgstage/staging_root.hpp"
#include "pkgstage/warnings.hpp"

#include <string>

namespace pkgstage {

// ============================================================================
// Asset Placer
// ============================================================================
//
//   <staging>/<prefix>/share/applications/<pkgname>.desktop
//   <staging>/<prefix>/share/pixmaps/<pkgname>.png
//
// The descriptor is copied with one substitution: the line
// "Icon=<icon_reference>" becomes "Icon=<pkgname>".

struct AssetSpec {
    std::string package_name;
    std::string desktop_source;
    std::string icon_source;
    std::string icon_reference = DEFAULT_ICON_REFERENCE;
};

AssetSpec make_asset_spec(const Recipe& recipe);

struct AssetReport {
    std::string desktop_path;     // host paths of the placed files
    std::string icon_path;
    bool icon_substituted = false;
};

struct IconRewrite {
    std::string content;
    bool replaced = false;
};

// Replace the first line exactly equal to "Icon=<reference>" with
// "Icon=<name>". Line endings are preserved.
IconRewrite rewrite_icon_reference(const std::string& descriptor,
                                   const std::string& reference,
                                   const std::string& name);

// Copy the descriptor and icon into the staging root. A missing source is
// ASSET_MISSING; a descriptor without the icon reference only warns.
Result<AssetReport> place_assets(const AssetSpec& spec,
                                 const StagingRoot& root,
                                 WarningCollector& warnings);

} // namespace pkgstage
