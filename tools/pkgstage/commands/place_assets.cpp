/**
 * pkgstage CLI - place-assets command
 */

#include "../common.hpp"
#include <pkgstage/pipeline.hpp>
#include <pkgstage/recipe.hpp>
#include <CLI/CLI.hpp>

namespace pkgstage::cli::commands {

namespace {

struct PlaceAssetsOptions {
    std::string recipe;
    std::string staging_root;
    std::string prefix;
};

int cmd_place_assets(const GlobalOptions& opts, const PlaceAssetsOptions& asset_opts) {
    init_logging(opts);
    WarningCollector warnings;

    auto recipe = load_recipe(asset_opts.recipe, warnings);
    if (recipe.isErr()) {
        return fail(recipe.error(), opts, warnings);
    }

    StageOptions overrides;
    overrides.prefix = asset_opts.prefix;
    apply_stage_overrides(recipe.value(), overrides);

    auto placed = run_place_assets(recipe.value(), asset_opts.staging_root, warnings);
    if (placed.isErr()) {
        return fail(placed.error(), opts, warnings);
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["desktop"] = placed.value().desktop_path;
        j["icon"] = placed.value().icon_path;
        j["icon_substituted"] = placed.value().icon_substituted;
        output_json(j, warnings);
    } else {
        print_success(placed.value().desktop_path, opts);
        print_success(placed.value().icon_path, opts);
    }
    return 0;
}

} // anonymous namespace

void setup_place_assets(CLI::App* app, GlobalOptions& opts) {
    static PlaceAssetsOptions asset_opts;

    app->add_option("recipe", asset_opts.recipe, "Recipe file")->required();
    app->add_option("-r,--staging-root", asset_opts.staging_root, "Staging root directory")
        ->required();
    app->add_option("--prefix", asset_opts.prefix, "Install prefix inside the staging root");

    app->callback([&opts]() {
        std::exit(cmd_place_assets(opts, asset_opts));
    });
}

} // namespace pkgstage::cli::commands
