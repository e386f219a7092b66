#include "pkgstage/classifier.hpp"
#include "pkgstage/semver.hpp"

#include <unordered_map>

#include <spdlog/spdlog.h>

namespace pkgstage {

namespace {

constexpr const char* STAGE = "classify";

Error conflict(const std::string& subject, const std::string& message) {
    return Error(ErrorCode::CLASSIFICATION_CONFLICT, message).withStage(STAGE).withSubject(subject);
}

void add_origin(PlanItem& item, const std::string& origin) {
    if (origin.empty()) return;
    for (const auto& existing : item.origins) {
        if (existing == origin) return;
    }
    item.origins.push_back(origin);
}

} // namespace

// ============================================================================
// InstallPlan
// ============================================================================

std::string PlanItem::specifier() const {
    if (artifact) return artifact->path;
    if (min_version.empty()) return name;
    return name + ">=" + min_version;
}

std::optional<Channel> InstallPlan::channel_of(const std::string& name) const {
    std::string key = normalize_name(name);
    for (const auto& item : host_managed_) {
        if (normalize_name(item.name) == key) return Channel::HostManaged;
    }
    for (const auto& action : actions_) {
        for (const auto& item : action.items) {
            if (normalize_name(item.name) == key) return action.channel;
        }
    }
    return std::nullopt;
}

size_t InstallPlan::occurrences(const std::string& name) const {
    std::string key = normalize_name(name);
    size_t count = 0;
    for (const auto& item : host_managed_) {
        if (normalize_name(item.name) == key) ++count;
    }
    for (const auto& action : actions_) {
        for (const auto& item : action.items) {
            if (normalize_name(item.name) == key) ++count;
        }
    }
    return count;
}

size_t InstallPlan::executable_item_count() const {
    size_t count = 0;
    for (const auto& action : actions_) {
        count += action.items.size();
    }
    return count;
}

// ============================================================================
// Classification
// ============================================================================

Result<InstallPlan> classify(const std::vector<DependencyRef>& declared,
                             const std::unordered_set<std::string>& host_satisfied,
                             const std::vector<LocalArtifact>& local_artifacts,
                             const ClassifyOptions& options,
                             WarningCollector& warnings) {
    // Effective host set: configured names plus dependencies preferring host
    std::unordered_set<std::string> host;
    for (const auto& name : host_satisfied) {
        host.insert(normalize_name(name));
    }
    for (const auto& dep : declared) {
        if (dep.preferred == PreferredChannel::Host) {
            host.insert(normalize_name(dep.name));
        }
    }

    // Local artifacts keyed by name; one item each, installed exactly once
    std::vector<PlanItem> local_items;
    std::unordered_map<std::string, size_t> local_index;
    for (const auto& artifact : local_artifacts) {
        std::string key = normalize_name(artifact.name);
        if (host.count(key)) {
            return Result<InstallPlan>::err(conflict(artifact.name,
                "declared as provided by the host package manager and built locally as the " +
                std::string(artifact_role_to_string(artifact.role)) + " artifact"));
        }
        if (local_index.count(key)) {
            return Result<InstallPlan>::err(conflict(artifact.name,
                "more than one local artifact with this name"));
        }
        PlanItem item;
        item.name = artifact.name;
        item.artifact = artifact;
        local_index[key] = local_items.size();
        local_items.push_back(std::move(item));
    }

    std::vector<PlanItem> host_items;
    std::unordered_map<std::string, size_t> host_index;
    std::vector<PlanItem> index_items;
    std::unordered_map<std::string, size_t> index_index;

    for (const auto& dep : declared) {
        std::string key = normalize_name(dep.name);

        if (host.count(key)) {
            if (dep.preferred != PreferredChannel::Host) {
                if (dep.preferred == PreferredChannel::Bundled) {
                    return Result<InstallPlan>::err(conflict(dep.name,
                        "preferred channel is bundled but the host package manager provides it"));
                }
                warnings.emit(Warning::preferred_channel_overridden,
                              warnings::preferred_channel_overridden(
                                  dep.name, preferred_channel_to_string(dep.preferred),
                                  channel_to_string(Channel::HostManaged)));
            }
            auto it = host_index.find(key);
            if (it != host_index.end()) {
                add_origin(host_items[it->second], dep.origin);
                continue;
            }
            PlanItem item;
            item.name = dep.name;
            add_origin(item, dep.origin);
            host_index[key] = host_items.size();
            host_items.push_back(std::move(item));
            continue;
        }

        auto local = local_index.find(key);
        if (local != local_index.end()) {
            PlanItem& item = local_items[local->second];
            const auto& version = item.artifact->version;
            if (!dep.min_version.empty() && !version.empty()) {
                auto parsed = parse_version(version);
                if (parsed && !satisfies_min(*parsed, dep.min_version)) {
                    return Result<InstallPlan>::err(conflict(dep.name,
                        "local artifact version " + version + " does not satisfy >=" +
                        dep.min_version + " required by " + dep.origin));
                }
            }
            if (dep.preferred == PreferredChannel::Index) {
                warnings.emit(Warning::preferred_channel_overridden,
                              warnings::preferred_channel_overridden(
                                  dep.name, preferred_channel_to_string(dep.preferred),
                                  channel_to_string(Channel::LocalArtifactInstall)));
            }
            add_origin(item, dep.origin);
            continue;
        }

        if (dep.preferred == PreferredChannel::Bundled) {
            return Result<InstallPlan>::err(conflict(dep.name,
                "preferred channel is bundled but no local artifact provides it"));
        }

        auto seen = index_index.find(key);
        if (seen != index_index.end()) {
            PlanItem& first = index_items[seen->second];
            if (options.dedupe_by_name) {
                spdlog::debug("merging repeated declaration of {} from {}", dep.name, dep.origin);
                first.min_version = stricter_min_version(first.min_version, dep.min_version);
                add_origin(first, dep.origin);
                continue;
            }
            warnings.emit(Warning::duplicate_dependency,
                          warnings::duplicate_dependency(
                              dep.name, first.origins.empty() ? "" : first.origins.front(),
                              dep.origin));
        } else {
            index_index[key] = index_items.size();
        }

        PlanItem item;
        item.name = dep.name;
        item.min_version = dep.min_version;
        add_origin(item, dep.origin);
        index_items.push_back(std::move(item));
    }

    // Primary artifacts, then the index, then subproject artifacts
    PlanAction primary{Channel::LocalArtifactInstall, ArtifactRole::Primary, {}};
    PlanAction index{Channel::IndexInstall, ArtifactRole::Primary, std::move(index_items)};
    PlanAction subproject{Channel::LocalArtifactInstall, ArtifactRole::Subproject, {}};
    for (auto& item : local_items) {
        if (item.artifact->role == ArtifactRole::Primary) {
            primary.items.push_back(std::move(item));
        } else {
            subproject.items.push_back(std::move(item));
        }
    }

    std::vector<PlanAction> actions;
    for (auto* action : {&primary, &index, &subproject}) {
        if (!action->items.empty()) {
            actions.push_back(std::move(*action));
        }
    }

    spdlog::debug("classified {} declarations: {} host-managed, {} install actions",
                  declared.size(), host_items.size(), actions.size());

    return Result<InstallPlan>::ok(InstallPlan(std::move(actions), std::move(host_items)));
}

} // namespace pkgstage
