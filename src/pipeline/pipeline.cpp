#include "pkgstage/pipeline.hpp"
#include "pkgstage/plan_record.hpp"
#include "pkgstage/platform.hpp"

#include <spdlog/spdlog.h>

namespace pkgstage {

void apply_stage_overrides(Recipe& recipe, const StageOptions& options) {
    if (options.output_dir && !options.output_dir->empty()) {
        recipe.output_dir = absolute_path(*options.output_dir);
    }
    if (options.prefix && !options.prefix->empty()) {
        recipe.install.prefix = *options.prefix;
    }
}

std::unordered_set<std::string> host_satisfied_set(const Recipe& recipe) {
    return std::unordered_set<std::string>(recipe.host_packages.begin(),
                                           recipe.host_packages.end());
}

Result<InstallPlan> plan_recipe(const Recipe& recipe,
                                const std::vector<LocalArtifact>& artifacts,
                                WarningCollector& warnings) {
    ClassifyOptions options;
    options.dedupe_by_name = recipe.install.dedupe_by_name;

    auto plan = classify(recipe.declared_dependencies(), host_satisfied_set(recipe),
                         artifacts, options, warnings);
    if (plan.isErr()) {
        return plan;
    }

    auto policy = check_warning_policy(warnings, "classify");
    if (policy.isErr()) {
        return Result<InstallPlan>::err(policy.error());
    }
    return plan;
}

Result<std::vector<LocalArtifact>> run_build(const Recipe& recipe, WarningCollector& warnings) {
    auto policy = check_warning_policy(warnings, "recipe");
    if (policy.isErr()) {
        return Result<std::vector<LocalArtifact>>::err(policy.error());
    }
    return build_artifacts(make_build_request(recipe));
}

Result<AssetReport> run_place_assets(const Recipe& recipe,
                                     const std::string& staging_root,
                                     WarningCollector& warnings) {
    if (!recipe.assets.enabled()) {
        return Result<AssetReport>::err(
            Error(ErrorCode::CONFIGURATION_ERROR, "recipe declares no assets")
                .withStage("assets").withSubject(recipe.source_path));
    }

    // Recipe findings upgraded to errors stop the run before anything is written
    auto loaded = check_warning_policy(warnings, "recipe");
    if (loaded.isErr()) {
        return Result<AssetReport>::err(loaded.error());
    }

    auto root = StagingRoot::make(staging_root, recipe.install.prefix);
    if (root.isErr()) {
        return Result<AssetReport>::err(root.error());
    }

    auto placed = place_assets(make_asset_spec(recipe), root.value(), warnings);
    if (placed.isErr()) {
        return placed;
    }

    auto policy = check_warning_policy(warnings, "assets");
    if (policy.isErr()) {
        return Result<AssetReport>::err(policy.error());
    }
    return placed;
}

Result<StageResult> run_stage(const Recipe& recipe,
                              const StageOptions& options,
                              WarningCollector& warnings) {
    StageResult result;

    // Validate the staging root before building so a bad path costs nothing
    auto root = StagingRoot::make(options.staging_root, recipe.install.prefix);
    if (root.isErr()) {
        return Result<StageResult>::err(root.error());
    }

    spdlog::info("Staging {} into {} (prefix {})", recipe.package.name,
                 root.value().path(), root.value().prefix());

    // 1. Artifact Builder
    auto artifacts = options.skip_build ? scan_artifacts(make_build_request(recipe))
                                        : run_build(recipe, warnings);
    if (artifacts.isErr()) {
        return Result<StageResult>::err(artifacts.error());
    }
    result.artifacts = artifacts.value();

    // 2. Channel Classifier
    auto plan = plan_recipe(recipe, result.artifacts, warnings);
    if (plan.isErr()) {
        return Result<StageResult>::err(plan.error());
    }
    result.plan = plan.value();

    // 3. Installation Orchestrator
    Orchestrator orchestrator(root.value(), make_installer_config(recipe), warnings);
    auto install = orchestrator.execute(plan.value(), options.dry_run);
    if (install.isErr()) {
        return Result<StageResult>::err(install.error());
    }
    result.install = install.value();

    // 4. Asset Placer
    if (options.dry_run || options.skip_assets) {
        spdlog::debug("skipping asset placement");
    } else if (!recipe.assets.enabled()) {
        spdlog::info("No assets declared");
    } else {
        auto placed = place_assets(make_asset_spec(recipe), root.value(), warnings);
        if (placed.isErr()) {
            return Result<StageResult>::err(placed.error());
        }
        result.assets = placed.value();

        auto policy = check_warning_policy(warnings, "assets");
        if (policy.isErr()) {
            return Result<StageResult>::err(policy.error());
        }
    }

    if (!options.record_path.empty()) {
        RunRecord record;
        record.package_name = recipe.package.name;
        record.package_version = recipe.package.version;
        record.recipe_path = recipe.source_path;
        record.staging_root = root.value().path();
        record.prefix = root.value().prefix();
        record.artifacts = result.artifacts;
        record.plan = result.plan;
        record.install = result.install;
        record.assets = result.assets;
        record.warnings = warnings.get_warnings();
        record.snapshot_staging_root = !options.dry_run;

        auto rendered = record_to_json(record);
        if (rendered.isErr()) {
            return Result<StageResult>::err(rendered.error());
        }
        auto written = write_record(options.record_path, rendered.value());
        if (written.isErr()) {
            return Result<StageResult>::err(written.error());
        }
    }

    spdlog::info("Staged {} {}", recipe.package.name, recipe.package.version);
    return Result<StageResult>::ok(std::move(result));
}

} // namespace pkgstage
