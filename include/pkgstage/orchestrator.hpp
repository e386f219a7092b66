#pragma once

#include "pkgstage/classifier.hpp"
#include "pkgstage/recipe.hpp"
#include "pkgstage/result.hpp"
#include "pkgstage/staging_root.hpp"
#include "pkgstage/warnings.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace pkgstage {

// ============================================================================
// Installation Orchestrator
// ============================================================================

struct InstallerConfig {
    std::vector<std::string> command;      // {root} and {prefix} placeholders
    std::string no_deps_flag = "--no-deps";
    std::unordered_map<std::string, std::string> environment;
    int timeout_seconds = 0;
};

InstallerConfig make_installer_config(const Recipe& recipe);

// One installer run: the plan items it covers and the full argv
struct Invocation {
    Channel channel = Channel::IndexInstall;
    std::vector<std::string> subjects;
    std::vector<std::string> argv;
    bool executed = false;
    int exit_code = 0;
};

struct InstallReport {
    std::vector<Invocation> invocations;
    std::vector<std::string> host_managed;
    bool dry_run = false;
};

/**
 * @brief Executes an InstallPlan into a staging root
 *
 * Local artifacts install one per invocation with the dependency-skip
 * flag; index dependencies install one per invocation with dependency
 * resolution enabled. Every invocation targets the same root and prefix.
 * The first failure aborts the remaining plan and leaves the staging
 * root as it is.
 */
class Orchestrator {
public:
    Orchestrator(StagingRoot root, InstallerConfig installer, WarningCollector& warnings)
        : root_(std::move(root)), installer_(std::move(installer)), warnings_(warnings) {}

    // Refuse a plan that installs a name twice, or a dependency-routed
    // artifact whose deps mode would let the installer resolve on its own
    Result<void> check(const InstallPlan& plan) const;

    // Invocations for the plan, in execution order
    Result<std::vector<Invocation>> invocations(const InstallPlan& plan) const;

    // check(), then run every invocation. With dry_run nothing is spawned
    // and nothing is written.
    Result<InstallReport> execute(const InstallPlan& plan, bool dry_run = false);

    const StagingRoot& staging_root() const { return root_; }

private:
    Result<std::vector<std::string>> base_command() const;

    StagingRoot root_;
    InstallerConfig installer_;
    WarningCollector& warnings_;
};

} // namespace pkgstage
