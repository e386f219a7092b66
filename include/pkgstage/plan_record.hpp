#pragma once

/**
 * @file plan_record.hpp
 * @brief JSON rendering of install plans and audit records of a run
 *
 * Output is deterministic: no timestamps, object keys sorted, arrays in
 * plan order. Two runs of the same recipe against equal inputs produce
 * identical records apart from absolute paths.
 */

#include "pkgstage/asset_placer.hpp"
#include "pkgstage/classifier.hpp"
#include "pkgstage/orchestrator.hpp"
#include "pkgstage/result.hpp"
#include "pkgstage/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace pkgstage {

constexpr const char* RECORD_SCHEMA = "pkgstage.record.v1";

nlohmann::json plan_to_json(const InstallPlan& plan);

nlohmann::json invocations_to_json(const std::vector<Invocation>& invocations);

nlohmann::json warnings_to_json(const std::vector<WarningObject>& warnings);

// Artifacts with their sha256; fails if a wheel cannot be read
Result<nlohmann::json> artifacts_to_json(const std::vector<LocalArtifact>& artifacts);

// Everything a finished (or dry) run knows about itself
struct RunRecord {
    std::string package_name;
    std::string package_version;
    std::string recipe_path;
    std::string staging_root;
    std::string prefix;
    std::vector<LocalArtifact> artifacts;
    std::optional<InstallPlan> plan;
    std::optional<InstallReport> install;
    std::optional<AssetReport> assets;
    std::vector<WarningObject> warnings;
    bool snapshot_staging_root = true;
};

// Render a record; with snapshot_staging_root every staged file is listed
// with its digest
Result<nlohmann::json> record_to_json(const RunRecord& record);

// Atomically write a rendered record
Result<void> write_record(const std::string& path, const nlohmann::json& record);

} // namespace pkgstage
