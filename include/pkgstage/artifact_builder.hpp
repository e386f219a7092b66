#pragma once

#include "pkgstage/recipe.hpp"
#include "pkgstage/result.hpp"
#include "pkgstage/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pkgstage {

// ============================================================================
// Artifact Builder
// ============================================================================
//
// Turns source trees into wheels under a build output directory:
//
//   <output_dir>/
//     mcp-central/mcp_central-0.1.0-py3-none-any.whl
//     mcp-client-for-ollama/mcp_client_for_ollama-0.2.0-py3-none-any.whl
//
// Each target builds into a private temporary directory that replaces its
// final directory only after the tool succeeded and produced the expected
// wheel, so an aborted build never leaves something that looks finished.

struct BuildTarget {
    std::string name;              // declared package name
    std::string source_dir;
    ArtifactRole role = ArtifactRole::Primary;
    bool dependency_routed = false;
    DepsMode deps_mode = DepsMode::Skip;
};

struct BuildRequest {
    std::vector<BuildTarget> targets;      // primary first
    std::string output_dir;
    std::vector<std::string> build_command;
    std::unordered_map<std::string, std::string> environment;
    int timeout_seconds = 0;
};

// Targets for the recipe's package and subproject
BuildRequest make_build_request(const Recipe& recipe);

// True if dir contains pyproject.toml or setup.py
bool has_project_manifest(const std::string& dir);

// Components of "{distribution}-{version}(-{build})?-{python}-{abi}-{platform}.whl"
struct WheelName {
    std::string distribution;
    std::string version;
    std::string build;
    std::string python;
    std::string abi;
    std::string platform;
};

std::optional<WheelName> parse_wheel_filename(const std::string& filename);

// Final directory of one target under the output directory
std::string artifact_directory(const BuildRequest& request, const BuildTarget& target);

// Build every target in order; stops at the first failure
Result<std::vector<LocalArtifact>> build_artifacts(const BuildRequest& request);

// Rediscover wheels produced by an earlier build_artifacts() run
Result<std::vector<LocalArtifact>> scan_artifacts(const BuildRequest& request);

// Artifacts the recipe will produce, without paths or versions. Lets the
// classifier check a recipe before anything is built.
std::vector<LocalArtifact> predict_artifacts(const Recipe& recipe);

} // namespace pkgstage
