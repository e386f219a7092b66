#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pkgstage {

// ============================================================================
// Installation Channels
// ============================================================================

// The pathway a dependency is installed through. Exactly one per dependency.
enum class Channel {
    HostManaged,           // satisfied by the host package manager, no action
    IndexInstall,          // fetched and installed from the language package index
    LocalArtifactInstall   // installed from a wheel built by the artifact builder
};

inline const char* channel_to_string(Channel c) {
    switch (c) {
        case Channel::HostManaged: return "host-managed";
        case Channel::IndexInstall: return "index-install";
        case Channel::LocalArtifactInstall: return "local-artifact-install";
        default: return "unknown";
    }
}

// Channel a recipe author asked for. The classifier has the final word.
enum class PreferredChannel {
    Host,
    Index,
    Bundled
};

inline const char* preferred_channel_to_string(PreferredChannel c) {
    switch (c) {
        case PreferredChannel::Host: return "host";
        case PreferredChannel::Index: return "index";
        case PreferredChannel::Bundled: return "bundled";
        default: return "index";
    }
}

// Accepts "host", "index", "language-index", "bundled" (case-insensitive)
std::optional<PreferredChannel> parse_preferred_channel(const std::string& s);

// ============================================================================
// Packages and Dependencies
// ============================================================================

enum class PackageSource {
    HostRepo,
    LanguageIndex,
    LocalBuild
};

inline const char* package_source_to_string(PackageSource s) {
    switch (s) {
        case PackageSource::HostRepo: return "host-repo";
        case PackageSource::LanguageIndex: return "language-index";
        case PackageSource::LocalBuild: return "local-build";
        default: return "local-build";
    }
}

std::optional<PackageSource> parse_package_source(const std::string& s);

// Whether an artifact install may pull in its own dependencies.
enum class DepsMode {
    Skip,   // installer runs with the dependency-skip flag
    Full
};

inline const char* deps_mode_to_string(DepsMode m) {
    switch (m) {
        case DepsMode::Skip: return "skip";
        case DepsMode::Full: return "full";
        default: return "skip";
    }
}

std::optional<DepsMode> parse_deps_mode(const std::string& s);

struct DependencyRef {
    std::string name;
    std::string min_version;   // empty when unconstrained
    PreferredChannel preferred = PreferredChannel::Index;
    std::string origin;        // name of the declaring package

    // "name" or "name>=min_version", as handed to the index installer
    std::string specifier() const {
        if (min_version.empty()) return name;
        return name + ">=" + min_version;
    }
};

struct Package {
    std::string name;
    std::string version;
    PackageSource source = PackageSource::LocalBuild;
    std::string path;                          // source tree, local-build only
    std::vector<DependencyRef> dependencies;
    bool dependency_routed = false;            // dependencies list was declared
    DepsMode deps_mode = DepsMode::Skip;
};

// ============================================================================
// Built Artifacts
// ============================================================================

enum class ArtifactRole {
    Primary,
    Subproject
};

inline const char* artifact_role_to_string(ArtifactRole r) {
    switch (r) {
        case ArtifactRole::Primary: return "primary";
        case ArtifactRole::Subproject: return "subproject";
        default: return "primary";
    }
}

struct LocalArtifact {
    std::string name;      // distribution name from the wheel file name
    std::string version;
    std::string path;      // absolute path to the .whl
    ArtifactRole role = ArtifactRole::Primary;
    bool dependency_routed = false;
    DepsMode deps_mode = DepsMode::Skip;
};

// Normalize a distribution name for comparison: lower case, runs of
// '-', '_' and '.' collapsed to a single '-'.
std::string normalize_name(const std::string& name);

// ============================================================================
// Warning System
// ============================================================================

enum class Warning {
    asset_substitution_miss,
    preferred_channel_overridden,
    duplicate_dependency,
    staging_root_not_empty,
    invalid_configuration,
};

inline const char* warning_to_string(Warning w) {
    switch (w) {
        case Warning::asset_substitution_miss: return "asset_substitution_miss";
        case Warning::preferred_channel_overridden: return "preferred_channel_overridden";
        case Warning::duplicate_dependency: return "duplicate_dependency";
        case Warning::staging_root_not_empty: return "staging_root_not_empty";
        case Warning::invalid_configuration: return "invalid_configuration";
        default: return "unknown";
    }
}

// Parse warning key string to enum (case-insensitive)
std::optional<Warning> parse_warning_key(const std::string& key);

enum class WarningAction {
    Warn,
    Ignore,
    Error
};

inline const char* action_to_string(WarningAction a) {
    switch (a) {
        case WarningAction::Warn: return "warn";
        case WarningAction::Ignore: return "ignore";
        case WarningAction::Error: return "error";
        default: return "warn";
    }
}

std::optional<WarningAction> parse_warning_action(const std::string& s);

struct WarningObject {
    std::string key;                                      // lowercase snake_case
    std::string action;                                   // "warn" | "error"
    std::unordered_map<std::string, std::string> fields;  // warning-specific
};

} // namespace pkgstage
