#pragma once

#include "pkgstage/result.hpp"
#include "pkgstage/types.hpp"
#include "pkgstage/warnings.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace pkgstage {

// ============================================================================
// Install Plan
// ============================================================================

// One unit of installation work. Local items carry the artifact to install;
// index items carry the dependency name and optional minimum version.
struct PlanItem {
    std::string name;
    std::string min_version;                  // index items only
    std::vector<std::string> origins;         // declaring packages, in declaration order
    std::optional<LocalArtifact> artifact;    // set for local-artifact items

    // What the installer receives: "name", "name>=X", or the wheel path
    std::string specifier() const;
};

struct PlanAction {
    Channel channel = Channel::IndexInstall;
    ArtifactRole role = ArtifactRole::Primary;   // which artifacts a local action installs
    std::vector<PlanItem> items;
};

/**
 * @brief Ordered, immutable result of dependency classification
 *
 * Actions run in order: local install of the primary artifact, index
 * installs, local install of subproject artifacts. Empty actions are
 * omitted. Host-managed dependencies are recorded for auditing only.
 */
class InstallPlan {
public:
    InstallPlan(std::vector<PlanAction> actions, std::vector<PlanItem> host_managed)
        : actions_(std::move(actions)), host_managed_(std::move(host_managed)) {}

    const std::vector<PlanAction>& actions() const { return actions_; }
    const std::vector<PlanItem>& host_managed() const { return host_managed_; }

    // Channel a name was assigned to (normalized comparison), if any
    std::optional<Channel> channel_of(const std::string& name) const;

    // Number of times a name occurs across host-managed and executable items
    size_t occurrences(const std::string& name) const;

    size_t executable_item_count() const;

private:
    std::vector<PlanAction> actions_;
    std::vector<PlanItem> host_managed_;
};

// ============================================================================
// Channel Classifier
// ============================================================================

struct ClassifyOptions {
    // Merge repeated declarations of one name into a single install
    // (the stricter minimum version wins). When off, repeats stay in the
    // plan and the orchestrator refuses them.
    bool dedupe_by_name = true;
};

/**
 * @brief Assign every declared dependency to exactly one channel
 *
 * 1. name in host_satisfied, or preferred channel "host" -> HostManaged
 * 2. a local artifact of that name exists              -> LocalArtifactInstall
 * 3. otherwise                                         -> IndexInstall
 *
 * A name that is both host-satisfied and a local artifact is a
 * CLASSIFICATION_CONFLICT, as is a "bundled" dependency without a local
 * artifact or a local artifact older than a declared minimum version.
 * Every local artifact is scheduled, declared or not.
 */
Result<InstallPlan> classify(const std::vector<DependencyRef>& declared,
                             const std::unordered_set<std::string>& host_satisfied,
                             const std::vector<LocalArtifact>& local_artifacts,
                             const ClassifyOptions& options,
                             WarningCollector& warnings);

} // namespace pkgstage
