#include "pkgstage/plan_record.hpp"
#include "pkgstage/platform.hpp"

#include <spdlog/spdlog.h>

namespace pkgstage {

namespace {

constexpr const char* STAGE = "record";

nlohmann::json item_to_json(const PlanItem& item) {
    nlohmann::json j;
    j["name"] = item.name;
    j["specifier"] = item.specifier();
    j["origins"] = item.origins;
    if (!item.min_version.empty()) {
        j["min_version"] = item.min_version;
    }
    if (item.artifact) {
        j["version"] = item.artifact->version;
        j["deps_mode"] = deps_mode_to_string(item.artifact->deps_mode);
        j["dependency_routed"] = item.artifact->dependency_routed;
    }
    return j;
}

} // namespace

nlohmann::json plan_to_json(const InstallPlan& plan) {
    nlohmann::json j;

    nlohmann::json host = nlohmann::json::array();
    for (const auto& item : plan.host_managed()) {
        nlohmann::json h;
        h["name"] = item.name;
        h["origins"] = item.origins;
        host.push_back(h);
    }
    j["host_managed"] = host;

    nlohmann::json actions = nlohmann::json::array();
    for (const auto& action : plan.actions()) {
        nlohmann::json a;
        a["channel"] = channel_to_string(action.channel);
        if (action.channel == Channel::LocalArtifactInstall) {
            a["role"] = artifact_role_to_string(action.role);
        }
        nlohmann::json items = nlohmann::json::array();
        for (const auto& item : action.items) {
            items.push_back(item_to_json(item));
        }
        a["items"] = items;
        actions.push_back(a);
    }
    j["actions"] = actions;

    return j;
}

nlohmann::json invocations_to_json(const std::vector<Invocation>& invocations) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& inv : invocations) {
        nlohmann::json j;
        j["channel"] = channel_to_string(inv.channel);
        j["subjects"] = inv.subjects;
        j["argv"] = inv.argv;
        j["executed"] = inv.executed;
        if (inv.executed) {
            j["exit_code"] = inv.exit_code;
        }
        arr.push_back(j);
    }
    return arr;
}

nlohmann::json warnings_to_json(const std::vector<WarningObject>& warnings) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& w : warnings) {
        nlohmann::json j;
        j["key"] = w.key;
        j["action"] = w.action;
        // nlohmann::json objects keep keys sorted
        nlohmann::json fields = nlohmann::json::object();
        for (const auto& [k, v] : w.fields) {
            fields[k] = v;
        }
        j["fields"] = fields;
        arr.push_back(j);
    }
    return arr;
}

Result<nlohmann::json> artifacts_to_json(const std::vector<LocalArtifact>& artifacts) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& artifact : artifacts) {
        nlohmann::json j;
        j["name"] = artifact.name;
        j["version"] = artifact.version;
        j["role"] = artifact_role_to_string(artifact.role);
        j["path"] = artifact.path;
        j["filename"] = get_filename(artifact.path);

        auto hash = compute_sha256(artifact.path);
        if (!hash.ok) {
            return Result<nlohmann::json>::err(
                Error(ErrorCode::IO_ERROR, hash.error).withStage(STAGE).withSubject(artifact.path));
        }
        j["sha256"] = hash.hex_digest;
        arr.push_back(j);
    }
    return Result<nlohmann::json>::ok(arr);
}

Result<nlohmann::json> record_to_json(const RunRecord& record) {
    nlohmann::json j;
    j["$schema"] = RECORD_SCHEMA;

    nlohmann::json package;
    package["name"] = record.package_name;
    package["version"] = record.package_version;
    j["package"] = package;

    if (!record.recipe_path.empty()) {
        j["recipe"] = record.recipe_path;
    }
    j["staging_root"] = record.staging_root;
    j["prefix"] = record.prefix;

    auto artifacts = artifacts_to_json(record.artifacts);
    if (artifacts.isErr()) {
        return artifacts;
    }
    j["artifacts"] = artifacts.value();

    if (record.plan) {
        j["plan"] = plan_to_json(*record.plan);
    }

    if (record.install) {
        j["dry_run"] = record.install->dry_run;
        j["invocations"] = invocations_to_json(record.install->invocations);
    }

    if (record.assets) {
        nlohmann::json assets;
        assets["desktop"] = record.assets->desktop_path;
        assets["icon"] = record.assets->icon_path;
        assets["icon_substituted"] = record.assets->icon_substituted;
        j["assets"] = assets;
    }

    j["warnings"] = warnings_to_json(record.warnings);

    if (record.snapshot_staging_root && is_directory(record.staging_root)) {
        auto snapshot = snapshot_tree(record.staging_root);
        if (!snapshot.ok) {
            return Result<nlohmann::json>::err(
                Error(ErrorCode::IO_ERROR, snapshot.error).withStage(STAGE)
                    .withSubject(record.staging_root));
        }
        nlohmann::json files = nlohmann::json::array();
        for (const auto& f : snapshot.files) {
            nlohmann::json entry;
            entry["path"] = f.path;
            entry["sha256"] = f.sha256;
            if (f.executable) {
                entry["executable"] = true;
            }
            files.push_back(entry);
        }
        j["staged_files"] = files;
    }

    return Result<nlohmann::json>::ok(j);
}

Result<void> write_record(const std::string& path, const nlohmann::json& record) {
    std::string parent = get_parent_directory(path);
    if (!parent.empty() && !create_directories(parent)) {
        return Result<void>::err(
            Error(ErrorCode::IO_ERROR, "cannot create " + parent).withStage(STAGE).withSubject(path));
    }

    auto written = atomic_write_file(path, record.dump(2) + "\n");
    if (!written.ok) {
        return Result<void>::err(
            Error(ErrorCode::IO_ERROR, written.error).withStage(STAGE).withSubject(path));
    }
    spdlog::info("Wrote run record {}", path);
    return Result<void>::ok();
}

} // namespace pkgstage
