/**
 * pkgstage CLI - check command
 *
 * Parse a recipe and classify its dependencies against the artifacts it
 * will build. Nothing is executed.
 */

#include "../common.hpp"
#include <pkgstage/artifact_builder.hpp>
#include <pkgstage/pipeline.hpp>
#include <pkgstage/recipe.hpp>
#include <CLI/CLI.hpp>

namespace pkgstage::cli::commands {

namespace {

struct CheckOptions {
    std::string recipe;
};

int cmd_check(const GlobalOptions& opts, const CheckOptions& check_opts) {
    init_logging(opts);
    WarningCollector warnings;

    auto recipe = load_recipe(check_opts.recipe, warnings);
    if (recipe.isErr()) {
        return fail(recipe.error(), opts, warnings);
    }

    auto plan = plan_recipe(recipe.value(), predict_artifacts(recipe.value()), warnings);
    if (plan.isErr()) {
        return fail(plan.error(), opts, warnings);
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["package"] = {{"name", recipe.value().package.name},
                        {"version", recipe.value().package.version}};
        j["plan"] = plan_to_json(plan.value());
        output_json(j, warnings);
    } else if (!opts.quiet) {
        std::cout << "Recipe OK: " << recipe.value().package.name << " "
                  << recipe.value().package.version << std::endl;
        print_plan(plan.value());
    }
    return 0;
}

} // anonymous namespace

void setup_check(CLI::App* app, GlobalOptions& opts) {
    static CheckOptions check_opts;

    app->add_option("recipe", check_opts.recipe, "Recipe file")->required();

    app->callback([&opts]() {
        std::exit(cmd_check(opts, check_opts));
    });
}

} // namespace pkgstage::cli::commands
