/**
 * pkgstage CLI - build command
 *
 * Run the Artifact Builder for the recipe's package and subproject.
 */

#include "../common.hpp"
#include <pkgstage/pipeline.hpp>
#include <pkgstage/recipe.hpp>
#include <CLI/CLI.hpp>

namespace pkgstage::cli::commands {

namespace {

struct BuildOptions {
    std::string recipe;
    std::string output_dir;
};

int cmd_build(const GlobalOptions& opts, const BuildOptions& build_opts) {
    init_logging(opts);
    WarningCollector warnings;

    auto recipe = load_recipe(build_opts.recipe, warnings);
    if (recipe.isErr()) {
        return fail(recipe.error(), opts, warnings);
    }

    StageOptions overrides;
    overrides.output_dir = build_opts.output_dir;
    apply_stage_overrides(recipe.value(), overrides);

    auto artifacts = run_build(recipe.value(), warnings);
    if (artifacts.isErr()) {
        return fail(artifacts.error(), opts, warnings);
    }

    if (opts.json) {
        auto rendered = artifacts_to_json(artifacts.value());
        if (rendered.isErr()) {
            return fail(rendered.error(), opts, warnings);
        }
        nlohmann::json j;
        j["ok"] = true;
        j["output_dir"] = recipe.value().output_dir;
        j["artifacts"] = rendered.value();
        output_json(j, warnings);
    } else {
        for (const auto& artifact : artifacts.value()) {
            print_success(artifact.path, opts);
        }
    }
    return 0;
}

} // anonymous namespace

void setup_build(CLI::App* app, GlobalOptions& opts) {
    static BuildOptions build_opts;

    app->add_option("recipe", build_opts.recipe, "Recipe file")->required();
    app->add_option("-o,--output-dir", build_opts.output_dir, "Build output directory");

    app->callback([&opts]() {
        std::exit(cmd_build(opts, build_opts));
    });
}

} // namespace pkgstage::cli::commands
