/**
 * pkgstage CLI - plan command
 *
 * Classify dependencies against wheels from an earlier build.
 */

#include "../common.hpp"
#include <pkgstage/artifact_builder.hpp>
#include <pkgstage/pipeline.hpp>
#include <pkgstage/recipe.hpp>
#include <CLI/CLI.hpp>

namespace pkgstage::cli::commands {

namespace {

struct PlanOptions {
    std::string recipe;
    std::string output_dir;
};

int cmd_plan(const GlobalOptions& opts, const PlanOptions& plan_opts) {
    init_logging(opts);
    WarningCollector warnings;

    auto recipe = load_recipe(plan_opts.recipe, warnings);
    if (recipe.isErr()) {
        return fail(recipe.error(), opts, warnings);
    }

    StageOptions overrides;
    overrides.output_dir = plan_opts.output_dir;
    apply_stage_overrides(recipe.value(), overrides);

    auto artifacts = scan_artifacts(make_build_request(recipe.value()));
    if (artifacts.isErr()) {
        return fail(artifacts.error(), opts, warnings);
    }

    auto plan = plan_recipe(recipe.value(), artifacts.value(), warnings);
    if (plan.isErr()) {
        return fail(plan.error(), opts, warnings);
    }

    if (opts.json) {
        auto rendered = artifacts_to_json(artifacts.value());
        if (rendered.isErr()) {
            return fail(rendered.error(), opts, warnings);
        }
        nlohmann::json j;
        j["ok"] = true;
        j["artifacts"] = rendered.value();
        j["plan"] = plan_to_json(plan.value());
        output_json(j, warnings);
    } else if (!opts.quiet) {
        print_plan(plan.value());
    }
    return 0;
}

} // anonymous namespace

void setup_plan(CLI::App* app, GlobalOptions& opts) {
    static PlanOptions plan_opts;

    app->add_option("recipe", plan_opts.recipe, "Recipe file")->required();
    app->add_option("-o,--output-dir", plan_opts.output_dir, "Build output directory");

    app->callback([&opts]() {
        std::exit(cmd_plan(opts, plan_opts));
    });
}

} // namespace pkgstage::cli::commands
