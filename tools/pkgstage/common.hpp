/**
 * pkgstage CLI - Common utilities and types
 */

#pragma once

#include <pkgstage/classifier.hpp>
#include <pkgstage/plan_record.hpp>
#include <pkgstage/result.hpp>
#include <pkgstage/warnings.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <string>

namespace pkgstage::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Route logs to stderr so that --json output on stdout stays parseable.
 */
inline void init_logging(const GlobalOptions& opts) {
    auto logger = spdlog::get("pkgstage");
    if (!logger) {
        logger = spdlog::stderr_color_mt("pkgstage");
        logger->set_pattern("%^[%l]%$ %v");
        spdlog::set_default_logger(logger);
    }

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

/**
 * Output utilities.
 */
inline void output_json(nlohmann::json j, const WarningCollector& warnings) {
    if (!j.contains("warnings")) {
        j["warnings"] = warnings_to_json(warnings.get_warnings());
    }
    std::cout << j.dump(2) << std::endl;
}

// Report an error and return the exit status it maps to
inline int fail(const Error& error, const GlobalOptions& opts, const WarningCollector& warnings) {
    int code = exit_code_for(error);
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = {
            {"code", error_code_to_string(error.code())},
            {"stage", error.stage()},
            {"subject", error.subject()},
            {"message", error.message()},
        };
        j["exit_code"] = code;
        output_json(j, warnings);
    } else {
        spdlog::error("{}", error.toString());
    }
    return code;
}

inline void print_success(const std::string& msg, const GlobalOptions& opts) {
    if (!opts.json && !opts.quiet) {
        std::cout << msg << std::endl;
    }
}

/**
 * Human-readable rendering of a plan.
 */
inline void print_plan(const InstallPlan& plan) {
    std::cout << "Host-managed (no action):" << std::endl;
    if (plan.host_managed().empty()) {
        std::cout << "  (none)" << std::endl;
    }
    for (const auto& item : plan.host_managed()) {
        std::cout << "  " << item.name << std::endl;
    }

    int step = 1;
    for (const auto& action : plan.actions()) {
        std::cout << step++ << ". " << channel_to_string(action.channel);
        if (action.channel == Channel::LocalArtifactInstall) {
            std::cout << " (" << artifact_role_to_string(action.role) << ")";
        }
        std::cout << ":" << std::endl;
        for (const auto& item : action.items) {
            std::cout << "  " << item.specifier();
            if (!item.origins.empty()) {
                std::cout << "  <- ";
                for (size_t i = 0; i < item.origins.size(); ++i) {
                    if (i > 0) std::cout << ", ";
                    std::cout << item.origins[i];
                }
            }
            std::cout << std::endl;
        }
    }
}

} // namespace pkgstage::cli
