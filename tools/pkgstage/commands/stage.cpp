/**
 * pkgstage CLI - stage command
 *
 * Full pipeline: build, classify, install into the staging root, place
 * menu assets.
 */

#include "../common.hpp"
#include <pkgstage/pipeline.hpp>
#include <pkgstage/platform.hpp>
#include <pkgstage/process.hpp>
#include <pkgstage/recipe.hpp>
#include <CLI/CLI.hpp>

namespace pkgstage::cli::commands {

namespace {

struct StageCommandOptions {
    std::string recipe;
    std::string staging_root;
    std::string output_dir;
    std::string prefix;
    std::string record;
    bool skip_build = false;
    bool skip_assets = false;
    bool dry_run = false;
};

int cmd_stage(const GlobalOptions& opts, const StageCommandOptions& stage_opts) {
    init_logging(opts);
    WarningCollector warnings;

    auto recipe = load_recipe(stage_opts.recipe, warnings);
    if (recipe.isErr()) {
        return fail(recipe.error(), opts, warnings);
    }

    StageOptions options;
    options.staging_root = stage_opts.staging_root;
    options.output_dir = stage_opts.output_dir;
    options.prefix = stage_opts.prefix;
    options.skip_build = stage_opts.skip_build;
    options.skip_assets = stage_opts.skip_assets;
    options.dry_run = stage_opts.dry_run;
    options.record_path = stage_opts.record;
    apply_stage_overrides(recipe.value(), options);

    auto result = run_stage(recipe.value(), options, warnings);
    if (result.isErr()) {
        return fail(result.error(), opts, warnings);
    }

    const auto& staged = result.value();
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["dry_run"] = options.dry_run;
        j["staging_root"] = absolute_path(options.staging_root);
        if (staged.plan) {
            j["plan"] = plan_to_json(*staged.plan);
        }
        if (staged.install) {
            j["invocations"] = invocations_to_json(staged.install->invocations);
        }
        if (staged.assets) {
            j["assets"] = {{"desktop", staged.assets->desktop_path},
                           {"icon", staged.assets->icon_path},
                           {"icon_substituted", staged.assets->icon_substituted}};
        }
        output_json(j, warnings);
    } else if (options.dry_run && staged.install) {
        for (const auto& inv : staged.install->invocations) {
            print_success(format_command(inv.argv), opts);
        }
    } else {
        print_success("Staged " + recipe.value().package.name + " into " +
                      absolute_path(options.staging_root), opts);
    }
    return 0;
}

} // anonymous namespace

void setup_stage(CLI::App* app, GlobalOptions& opts) {
    static StageCommandOptions stage_opts;

    app->add_option("recipe", stage_opts.recipe, "Recipe file")->required();
    app->add_option("-r,--staging-root", stage_opts.staging_root, "Staging root directory")
        ->required();
    app->add_option("-o,--output-dir", stage_opts.output_dir, "Build output directory");
    app->add_option("--prefix", stage_opts.prefix, "Install prefix inside the staging root");
    app->add_option("--record", stage_opts.record, "Write a JSON run record to this file");
    app->add_flag("--skip-build", stage_opts.skip_build, "Reuse wheels from an earlier build");
    app->add_flag("--skip-assets", stage_opts.skip_assets, "Do not place menu entry and icon");
    app->add_flag("-n,--dry-run", stage_opts.dry_run, "Print installer invocations only");

    app->callback([&opts]() {
        std::exit(cmd_stage(opts, stage_opts));
    });
}

} // namespace pkgstage::cli::commands
