#include "pkgstage/asset_placer.hpp"
#include "pkgstage/platform.hpp"

#include <spdlog/spdlog.h>

namespace pkgstage {

namespace {

constexpr const char* STAGE = "assets";

Error asset_error(ErrorCode code, const std::string& subject, const std::string& message) {
    return Error(code, message).withStage(STAGE).withSubject(subject);
}

// Resolve an image path and make sure its parent exists
Result<std::string> prepare_destination(const StagingRoot& root, const std::string& image_path) {
    auto dest = root.resolve(image_path);
    if (dest.isErr()) {
        return dest;
    }
    std::string parent = get_parent_directory(dest.value());
    if (!create_directories(parent)) {
        return Result<std::string>::err(asset_error(ErrorCode::IO_ERROR, image_path,
            "cannot create " + parent));
    }
    return dest;
}

} // namespace

AssetSpec make_asset_spec(const Recipe& recipe) {
    AssetSpec spec;
    spec.package_name = recipe.package.name;
    spec.desktop_source = recipe.assets.desktop;
    spec.icon_source = recipe.assets.icon;
    spec.icon_reference = recipe.assets.icon_reference;
    return spec;
}

IconRewrite rewrite_icon_reference(const std::string& descriptor,
                                   const std::string& reference,
                                   const std::string& name) {
    const std::string expected = "Icon=" + reference;

    IconRewrite out;
    out.content = descriptor;

    size_t start = 0;
    while (start <= descriptor.size()) {
        size_t end = descriptor.find('\n', start);
        size_t line_end = end == std::string::npos ? descriptor.size() : end;
        size_t len = line_end - start;
        // Tolerate CRLF descriptors
        if (len > 0 && descriptor[line_end - 1] == '\r') {
            --len;
        }

        if (descriptor.compare(start, len, expected) == 0 && len == expected.size()) {
            out.content = descriptor.substr(0, start) + "Icon=" + name +
                          descriptor.substr(start + len);
            out.replaced = true;
            return out;
        }

        if (end == std::string::npos) break;
        start = end + 1;
    }
    return out;
}

Result<AssetReport> place_assets(const AssetSpec& spec,
                                 const StagingRoot& root,
                                 WarningCollector& warnings) {
    if (spec.package_name.empty()) {
        return Result<AssetReport>::err(
            Error(ErrorCode::CONFIGURATION_ERROR, "package name not set").withStage(STAGE));
    }

    // Check both sources before writing anything
    if (!is_regular_file(spec.desktop_source)) {
        return Result<AssetReport>::err(asset_error(ErrorCode::ASSET_MISSING, spec.desktop_source,
            "menu descriptor not found"));
    }
    if (!is_regular_file(spec.icon_source)) {
        return Result<AssetReport>::err(asset_error(ErrorCode::ASSET_MISSING, spec.icon_source,
            "icon not found"));
    }

    auto descriptor = read_file(spec.desktop_source);
    if (!descriptor) {
        return Result<AssetReport>::err(asset_error(ErrorCode::IO_ERROR, spec.desktop_source,
            "cannot read menu descriptor"));
    }

    AssetReport report;

    auto desktop_dest = prepare_destination(
        root, "share/applications/" + spec.package_name + ".desktop");
    if (desktop_dest.isErr()) {
        return Result<AssetReport>::err(desktop_dest.error());
    }

    auto rewritten = rewrite_icon_reference(*descriptor, spec.icon_reference, spec.package_name);
    if (!rewritten.replaced) {
        warnings.emit(Warning::asset_substitution_miss,
                      warnings::asset_substitution_miss(spec.desktop_source,
                                                        "Icon=" + spec.icon_reference));
    }

    auto written = atomic_write_file(desktop_dest.value(), rewritten.content);
    if (!written.ok) {
        return Result<AssetReport>::err(asset_error(ErrorCode::IO_ERROR, desktop_dest.value(),
            written.error));
    }
    report.desktop_path = desktop_dest.value();
    report.icon_substituted = rewritten.replaced;
    spdlog::info("Placed menu entry {}", report.desktop_path);

    auto icon_dest = prepare_destination(root, "share/pixmaps/" + spec.package_name + ".png");
    if (icon_dest.isErr()) {
        return Result<AssetReport>::err(icon_dest.error());
    }
    if (!copy_file(spec.icon_source, icon_dest.value())) {
        return Result<AssetReport>::err(asset_error(ErrorCode::IO_ERROR, spec.icon_source,
            "cannot copy to " + icon_dest.value()));
    }
    report.icon_path = icon_dest.value();
    spdlog::info("Placed icon {}", report.icon_path);

    return Result<AssetReport>::ok(std::move(report));
}

} // namespace pkgstage
