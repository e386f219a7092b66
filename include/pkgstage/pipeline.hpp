#pragma once

#include "pkgstage/artifact_builder.hpp"
#include "pkgstage/asset_placer.hpp"
#include "pkgstage/classifier.hpp"
#include "pkgstage/orchestrator.hpp"
#include "pkgstage/recipe.hpp"
#include "pkgstage/result.hpp"
#include "pkgstage/warnings.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace pkgstage {

// ============================================================================
// Pipeline
// ============================================================================
//
// build -> classify -> install -> assets, stopping at the first error.
// A warning upgraded to an error by policy stops the run after the stage
// that emitted it.

struct StageOptions {
    std::string staging_root;
    std::optional<std::string> output_dir;   // overrides recipe output_dir
    std::optional<std::string> prefix;       // overrides install.prefix
    bool skip_build = false;                 // reuse wheels from an earlier build
    bool dry_run = false;                    // plan and log invocations only
    bool skip_assets = false;
    std::string record_path;                 // empty: no run record
};

struct StageResult {
    std::vector<LocalArtifact> artifacts;
    std::optional<InstallPlan> plan;
    std::optional<InstallReport> install;
    std::optional<AssetReport> assets;
};

// Apply command-line overrides of output_dir and prefix
void apply_stage_overrides(Recipe& recipe, const StageOptions& options);

// host_packages of the recipe
std::unordered_set<std::string> host_satisfied_set(const Recipe& recipe);

// Classify the recipe's declarations against the given artifacts
Result<InstallPlan> plan_recipe(const Recipe& recipe,
                                const std::vector<LocalArtifact>& artifacts,
                                WarningCollector& warnings);

// Artifact Builder stage on its own
Result<std::vector<LocalArtifact>> run_build(const Recipe& recipe, WarningCollector& warnings);

// Asset Placer stage on its own
Result<AssetReport> run_place_assets(const Recipe& recipe,
                                     const std::string& staging_root,
                                     WarningCollector& warnings);

// The whole pipeline
Result<StageResult> run_stage(const Recipe& recipe,
                              const StageOptions& options,
                              WarningCollector& warnings);

} // namespace pkgstage
