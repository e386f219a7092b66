#pragma once

#include "pkgstage/result.hpp"
#include "pkgstage/types.hpp"
#include "pkgstage/warnings.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pkgstage {

// ============================================================================
// Recipe
// ============================================================================
//
// A recipe is the single declarative description of how one application is
// staged: what to build, which dependencies the host package manager already
// provides, and how the remaining ones are installed. It replaces the
// per-variant dependency-list edits of hand-written packaging scripts.
//
//   {
//     "$schema": "pkgstage.recipe.v1",
//     "package":    { "name": "mcp-central", "version": "0.1.0", "path": ".",
//                     "dependencies": ["textual>=0.47", {"name": "PyQt6", "channel": "host"}] },
//     "subproject": { "name": "mcp-client-for-ollama", "path": "mcp-client-for-ollama",
//                     "dependencies": ["ollama"] },
//     "host_packages": ["keyring"],
//     "install": { "prefix": "/usr", "dedupe_by_name": true },
//     "tools":   { "build": [...], "install": [...], "no_deps_flag": "--no-deps" },
//     "assets":  { "desktop": "mcp-central.desktop", "icon": "icon.png" },
//     "environment": { "SOURCE_DATE_EPOCH": "315532800" },
//     "warnings": { "asset_substitution_miss": "warn" }
//   }

constexpr const char* RECIPE_SCHEMA = "pkgstage.recipe.v1";

constexpr const char* DEFAULT_ICON_REFERENCE = "/usr/share/pixmaps/mcp-central.png";

struct ToolConfig {
    // {source} and {outdir} are expanded per artifact
    std::vector<std::string> build = {
        "python", "-m", "build", "--wheel", "--no-isolation", "--outdir", "{outdir}", "{source}"};
    // {root} and {prefix} are expanded per run; specifiers are appended
    std::vector<std::string> install = {
        "python", "-m", "pip", "install", "--root", "{root}", "--prefix", "{prefix}",
        "--no-warn-script-location"};
    std::string no_deps_flag = "--no-deps";
    int build_timeout = 0;     // seconds, 0 = none
    int install_timeout = 0;   // seconds, 0 = none
};

struct AssetConfig {
    std::string desktop;        // menu descriptor source; empty disables asset placement
    std::string icon;           // icon source
    std::string icon_reference = DEFAULT_ICON_REFERENCE;

    bool enabled() const { return !desktop.empty() || !icon.empty(); }
};

struct Recipe {
    std::string schema;

    Package package;
    std::optional<Package> subproject;

    // Names the host package manager installs before pkgstage runs
    std::vector<std::string> host_packages;

    struct {
        std::string prefix = "/usr";
        bool dedupe_by_name = true;
    } install;

    ToolConfig tools;
    AssetConfig assets;

    std::unordered_map<std::string, std::string> environment;
    std::unordered_map<std::string, WarningAction> warnings;

    std::string output_dir;     // build output, absolute after resolution
    std::string source_path;    // recipe file, for diagnostics
    std::string base_dir;       // relative paths resolve against this

    // Primary declarations first, then the subproject's
    std::vector<DependencyRef> declared_dependencies() const;
};

struct RecipeParseResult {
    bool ok = false;
    std::string error;
    Recipe recipe;
    std::vector<std::string> warnings;
};

// Parse a recipe from a JSON string. Relative paths are resolved against
// base_dir (current directory when empty).
RecipeParseResult parse_recipe(const std::string& json_str,
                               const std::string& source_path = "",
                               const std::string& base_dir = "");

// Check cross-field constraints that the parser does not enforce
Result<void> validate_recipe(const Recipe& recipe);

// Read, parse and validate a recipe file. The recipe's warning policy is
// installed into the collector, then parse warnings are emitted through it
// as invalid_configuration.
Result<Recipe> load_recipe(const std::string& path, WarningCollector& warnings);

// Parse "name", "name>=1.2" into a dependency reference
std::optional<DependencyRef> parse_dependency_specifier(const std::string& spec);

// ============================================================================
// Command Templates
// ============================================================================

// Expand {NAME} placeholders in each argument. Unknown placeholders are a
// configuration error; text without braces passes through untouched.
Result<std::vector<std::string>> expand_command(
    const std::vector<std::string>& argv,
    const std::unordered_map<std::string, std::string>& vars);

} // namespace pkgstage
