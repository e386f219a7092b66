/**
 * pkgstage CLI - Entry Point
 *
 * Builds a desktop application's wheels and stages them, their
 * dependencies and the menu assets into a package staging root.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace pkgstage::cli::commands {
    void setup_check(CLI::App* app, GlobalOptions& opts);
    void setup_build(CLI::App* app, GlobalOptions& opts);
    void setup_plan(CLI::App* app, GlobalOptions& opts);
    void setup_stage(CLI::App* app, GlobalOptions& opts);
    void setup_place_assets(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace pkgstage::cli;

    CLI::App app{"pkgstage - multi-channel dependency installer"};
    app.set_version_flag("-V,--version", PKGSTAGE_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    // Commands
    auto* check_cmd = app.add_subcommand("check", "Validate a recipe and show its plan");
    commands::setup_check(check_cmd, opts);

    auto* build_cmd = app.add_subcommand("build", "Build the recipe's wheels");
    commands::setup_build(build_cmd, opts);

    auto* plan_cmd = app.add_subcommand("plan", "Classify dependencies of built wheels");
    commands::setup_plan(plan_cmd, opts);

    auto* stage_cmd = app.add_subcommand("stage", "Build, install and place assets");
    commands::setup_stage(stage_cmd, opts);

    auto* assets_cmd = app.add_subcommand("place-assets", "Place menu entry and icon only");
    commands::setup_place_assets(assets_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
