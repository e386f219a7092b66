#include "pkgstage/orchestrator.hpp"
#include "pkgstage/process.hpp"

#include <unordered_map>

#include <spdlog/spdlog.h>

namespace pkgstage {

namespace {

constexpr const char* STAGE = "install";

Error install_error(ErrorCode code, const std::string& subject, const std::string& message) {
    return Error(code, message).withStage(STAGE).withSubject(subject);
}

std::string join_subjects(const std::vector<std::string>& subjects) {
    std::string out;
    for (const auto& s : subjects) {
        if (!out.empty()) out += ", ";
        out += s;
    }
    return out;
}

} // namespace

InstallerConfig make_installer_config(const Recipe& recipe) {
    InstallerConfig config;
    config.command = recipe.tools.install;
    config.no_deps_flag = recipe.tools.no_deps_flag;
    config.environment = recipe.environment;
    config.timeout_seconds = recipe.tools.install_timeout;
    return config;
}

Result<void> Orchestrator::check(const InstallPlan& plan) const {
    // name -> channel of first occurrence
    std::unordered_map<std::string, Channel> seen;

    auto record = [&seen](const PlanItem& item, Channel channel) -> Result<void> {
        std::string key = normalize_name(item.name);
        auto it = seen.find(key);
        if (it != seen.end()) {
            return Result<void>::err(install_error(ErrorCode::DUPLICATE_INSTALL, item.name,
                std::string("already scheduled via ") + channel_to_string(it->second) +
                ", refusing second install via " + channel_to_string(channel)));
        }
        seen.emplace(key, channel);
        return Result<void>::ok();
    };

    for (const auto& item : plan.host_managed()) {
        auto r = record(item, Channel::HostManaged);
        if (r.isErr()) return r;
    }

    for (const auto& action : plan.actions()) {
        for (const auto& item : action.items) {
            auto r = record(item, action.channel);
            if (r.isErr()) return r;

            if (action.channel != Channel::LocalArtifactInstall) continue;
            if (!item.artifact) {
                return Result<void>::err(install_error(ErrorCode::CONFIGURATION_ERROR, item.name,
                    "local install without a built artifact"));
            }
            if (item.artifact->dependency_routed && item.artifact->deps_mode == DepsMode::Full) {
                return Result<void>::err(install_error(ErrorCode::CONFIGURATION_ERROR, item.name,
                    "deps_mode \"full\" conflicts with a declared dependencies list; "
                    "its dependencies are installed through the plan"));
            }
        }
    }

    return Result<void>::ok();
}

Result<std::vector<std::string>> Orchestrator::base_command() const {
    if (installer_.command.empty()) {
        return Result<std::vector<std::string>>::err(
            Error(ErrorCode::CONFIGURATION_ERROR, "installer command is empty").withStage(STAGE));
    }
    auto argv = expand_command(installer_.command,
                               {{"root", root_.path()}, {"prefix", root_.prefix()}});
    if (argv.isErr()) {
        argv.error().withStage(STAGE);
    }
    return argv;
}

Result<std::vector<Invocation>> Orchestrator::invocations(const InstallPlan& plan) const {
    auto base = base_command();
    if (base.isErr()) {
        return Result<std::vector<Invocation>>::err(base.error());
    }

    std::vector<Invocation> out;
    for (const auto& action : plan.actions()) {
        for (const auto& item : action.items) {
            Invocation inv;
            inv.channel = action.channel;
            inv.subjects.push_back(item.name);
            inv.argv = base.value();

            if (action.channel == Channel::LocalArtifactInstall) {
                if (!item.artifact) {
                    return Result<std::vector<Invocation>>::err(install_error(
                        ErrorCode::CONFIGURATION_ERROR, item.name,
                        "local install without a built artifact"));
                }
                // Routed artifacts always skip; check() refused routed + full
                bool skip = item.artifact->dependency_routed ||
                            item.artifact->deps_mode == DepsMode::Skip;
                if (skip && !installer_.no_deps_flag.empty()) {
                    inv.argv.push_back(installer_.no_deps_flag);
                }
            }
            inv.argv.push_back(item.specifier());
            out.push_back(std::move(inv));
        }
    }
    return Result<std::vector<Invocation>>::ok(std::move(out));
}

Result<InstallReport> Orchestrator::execute(const InstallPlan& plan, bool dry_run) {
    auto checked = check(plan);
    if (checked.isErr()) {
        return Result<InstallReport>::err(checked.error());
    }

    auto planned = invocations(plan);
    if (planned.isErr()) {
        return Result<InstallReport>::err(planned.error());
    }

    InstallReport report;
    report.dry_run = dry_run;
    for (const auto& item : plan.host_managed()) {
        spdlog::info("{}: provided by the host package manager", item.name);
        report.host_managed.push_back(item.name);
    }

    if (root_.exists() && !root_.is_empty()) {
        warnings_.emit(Warning::staging_root_not_empty,
                       warnings::staging_root_not_empty(root_.path()));
        auto policy = check_warning_policy(warnings_, STAGE);
        if (policy.isErr()) {
            return Result<InstallReport>::err(policy.error());
        }
    }

    if (!dry_run) {
        auto created = root_.create();
        if (created.isErr()) {
            return Result<InstallReport>::err(created.error());
        }
    }

    for (auto& inv : planned.value()) {
        std::string subjects = join_subjects(inv.subjects);
        spdlog::info("Installing {} ({})", subjects, channel_to_string(inv.channel));
        spdlog::debug("  $ {}", format_command(inv.argv));

        if (dry_run) {
            report.invocations.push_back(std::move(inv));
            continue;
        }

        ProcessSpec spec;
        spec.argv = inv.argv;
        spec.env = installer_.environment;
        spec.timeout_seconds = installer_.timeout_seconds;

        auto run = run_process(spec);
        inv.executed = run.ok;
        inv.exit_code = run.exit_code;

        if (!run.ok || run.timed_out || run.exit_code != 0 || !run.error.empty()) {
            ErrorCode code = run.timed_out ? ErrorCode::TIMEOUT : ErrorCode::INSTALL_FAILURE;
            std::string message = run.error.empty()
                ? "installer exited with status " + std::to_string(run.exit_code)
                : run.error;
            Error error = install_error(code, subjects, message);
            // An exec failure has no tool status of its own
            if (run.ok && run.error.empty()) error.withStatus(run.exit_code);
            return Result<InstallReport>::err(error);
        }

        report.invocations.push_back(std::move(inv));
    }

    spdlog::info("{} {} item(s) into {}", dry_run ? "Would install" : "Installed",
                 report.invocations.size(), root_.path());
    return Result<InstallReport>::ok(std::move(report));
}

} // namespace pkgstage
