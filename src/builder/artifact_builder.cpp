#include "pkgstage/artifact_builder.hpp"
#include "pkgstage/platform.hpp"
#include "pkgstage/process.hpp"

#include <sstream>

#include <spdlog/spdlog.h>

namespace pkgstage {

namespace {

constexpr const char* STAGE = "build";

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(s);
    while (std::getline(ss, current, delim)) {
        parts.push_back(current);
    }
    return parts;
}

// Failed builds must not leave their temporary output behind
void discard_directory(const std::string& dir) {
    if (!remove_directory(dir)) {
        spdlog::warn("could not remove {}", dir);
    }
}

Error build_error(ErrorCode code, const BuildTarget& target, const std::string& message) {
    return Error(code, message).withStage(STAGE).withSubject(target.name);
}

// Locate the single wheel for target in dir
Result<LocalArtifact> find_wheel(const std::string& dir, const BuildTarget& target) {
    std::vector<std::pair<std::string, WheelName>> matches;
    std::vector<std::string> others;

    for (const auto& entry : list_directory(dir)) {
        if (!ends_with(entry, ".whl")) continue;
        auto wheel = parse_wheel_filename(entry);
        if (wheel && normalize_name(wheel->distribution) == normalize_name(target.name)) {
            matches.emplace_back(entry, *wheel);
        } else {
            others.push_back(entry);
        }
    }

    if (matches.empty()) {
        std::string message = "no wheel for distribution '" + target.name + "' in " + dir;
        if (!others.empty()) {
            message += " (found " + others.front() + ")";
        }
        return Result<LocalArtifact>::err(build_error(ErrorCode::BUILD_FAILURE, target, message));
    }
    if (matches.size() > 1) {
        return Result<LocalArtifact>::err(build_error(ErrorCode::BUILD_FAILURE, target,
            "multiple wheels for '" + target.name + "' in " + dir));
    }

    LocalArtifact artifact;
    artifact.name = target.name;
    artifact.version = matches.front().second.version;
    artifact.path = join_path(dir, matches.front().first);
    artifact.role = target.role;
    artifact.dependency_routed = target.dependency_routed;
    artifact.deps_mode = target.deps_mode;
    return Result<LocalArtifact>::ok(std::move(artifact));
}

// A target built into its temporary directory, not yet published
struct StagedBuild {
    const BuildTarget* target;
    std::string temp_dir;
    std::string final_dir;
};

Result<StagedBuild> stage_one(const BuildRequest& request, const BuildTarget& target) {
    if (!is_directory(target.source_dir)) {
        return Result<StagedBuild>::err(build_error(ErrorCode::BUILD_FAILURE, target,
            "source tree not found: " + target.source_dir));
    }
    if (!has_project_manifest(target.source_dir)) {
        return Result<StagedBuild>::err(build_error(ErrorCode::BUILD_FAILURE, target,
            "no pyproject.toml or setup.py in " + target.source_dir));
    }

    StagedBuild staged{&target, {}, artifact_directory(request, target)};
    staged.temp_dir = make_temp_path(staged.final_dir);
    if (!create_directories(staged.temp_dir)) {
        return Result<StagedBuild>::err(build_error(ErrorCode::IO_ERROR, target,
            "cannot create " + staged.temp_dir));
    }

    auto command = expand_command(request.build_command,
                                  {{"source", target.source_dir}, {"outdir", staged.temp_dir}});
    if (command.isErr()) {
        discard_directory(staged.temp_dir);
        return Result<StagedBuild>::err(command.error().withStage(STAGE).withSubject(target.name));
    }

    ProcessSpec spec;
    spec.argv = command.value();
    spec.cwd = target.source_dir;
    spec.env = request.environment;
    spec.timeout_seconds = request.timeout_seconds;

    spdlog::info("Building {} from {}", target.name, target.source_dir);
    spdlog::debug("  $ {}", format_command(spec.argv));

    auto run = run_process(spec);
    if (!run.ok || run.timed_out || run.exit_code != 0 || !run.error.empty()) {
        discard_directory(staged.temp_dir);

        ErrorCode code = run.timed_out ? ErrorCode::TIMEOUT : ErrorCode::BUILD_FAILURE;
        std::string message = run.error.empty()
            ? "build tool exited with status " + std::to_string(run.exit_code)
            : run.error;
        Error error = build_error(code, target, message);
        // An exec failure has no tool status of its own
        if (run.ok && run.error.empty()) error.withStatus(run.exit_code);
        return Result<StagedBuild>::err(error);
    }

    auto wheel = find_wheel(staged.temp_dir, target);
    if (wheel.isErr()) {
        discard_directory(staged.temp_dir);
        return Result<StagedBuild>::err(wheel.error());
    }
    return Result<StagedBuild>::ok(std::move(staged));
}

// Drop staged temp directories and every target's published output, so a
// failed run leaves nothing scan_artifacts() would accept
void abandon(const BuildRequest& request, const std::vector<StagedBuild>& staged) {
    for (const auto& build : staged) {
        discard_directory(build.temp_dir);
    }
    for (const auto& target : request.targets) {
        discard_directory(artifact_directory(request, target));
    }
}

BuildTarget target_for(const Package& package, ArtifactRole role) {
    BuildTarget target;
    target.name = package.name;
    target.source_dir = package.path;
    target.role = role;
    target.dependency_routed = package.dependency_routed;
    target.deps_mode = package.deps_mode;
    return target;
}

} // namespace

BuildRequest make_build_request(const Recipe& recipe) {
    BuildRequest request;
    request.targets.push_back(target_for(recipe.package, ArtifactRole::Primary));
    if (recipe.subproject) {
        request.targets.push_back(target_for(*recipe.subproject, ArtifactRole::Subproject));
    }
    request.output_dir = recipe.output_dir;
    request.build_command = recipe.tools.build;
    request.environment = recipe.environment;
    request.timeout_seconds = recipe.tools.build_timeout;
    return request;
}

bool has_project_manifest(const std::string& dir) {
    return is_regular_file(join_path(dir, "pyproject.toml")) ||
           is_regular_file(join_path(dir, "setup.py"));
}

std::optional<WheelName> parse_wheel_filename(const std::string& filename) {
    if (!ends_with(filename, ".whl")) return std::nullopt;

    auto parts = split(filename.substr(0, filename.size() - 4), '-');
    if (parts.size() != 5 && parts.size() != 6) return std::nullopt;
    for (const auto& part : parts) {
        if (part.empty()) return std::nullopt;
    }

    WheelName wheel;
    wheel.distribution = parts[0];
    wheel.version = parts[1];
    size_t i = 2;
    if (parts.size() == 6) {
        wheel.build = parts[i++];
    }
    wheel.python = parts[i++];
    wheel.abi = parts[i++];
    wheel.platform = parts[i];
    return wheel;
}

std::string artifact_directory(const BuildRequest& request, const BuildTarget& target) {
    return join_path(request.output_dir, normalize_name(target.name));
}

Result<std::vector<LocalArtifact>> build_artifacts(const BuildRequest& request) {
    if (!create_directories(request.output_dir)) {
        return Result<std::vector<LocalArtifact>>::err(
            Error(ErrorCode::IO_ERROR, "cannot create output directory " + request.output_dir)
                .withStage(STAGE));
    }

    std::vector<StagedBuild> staged;
    for (const auto& target : request.targets) {
        auto built = stage_one(request, target);
        if (built.isErr()) {
            abandon(request, staged);
            return Result<std::vector<LocalArtifact>>::err(built.error());
        }
        staged.push_back(std::move(built.value()));
    }

    // Publish only once every target has built
    for (size_t i = 0; i < staged.size(); ++i) {
        auto published = replace_directory(staged[i].temp_dir, staged[i].final_dir);
        if (!published.ok) {
            abandon(request, staged);
            return Result<std::vector<LocalArtifact>>::err(
                build_error(ErrorCode::IO_ERROR, *staged[i].target, published.error));
        }
    }

    std::vector<LocalArtifact> artifacts;
    for (const auto& build : staged) {
        auto found = find_wheel(build.final_dir, *build.target);
        if (found.isErr()) {
            return Result<std::vector<LocalArtifact>>::err(found.error());
        }
        spdlog::info("Built {} {} -> {}", found.value().name, found.value().version,
                     found.value().path);
        artifacts.push_back(std::move(found.value()));
    }

    return Result<std::vector<LocalArtifact>>::ok(std::move(artifacts));
}

Result<std::vector<LocalArtifact>> scan_artifacts(const BuildRequest& request) {
    std::vector<LocalArtifact> artifacts;
    for (const auto& target : request.targets) {
        std::string dir = artifact_directory(request, target);
        if (!is_directory(dir)) {
            return Result<std::vector<LocalArtifact>>::err(
                Error(ErrorCode::FILE_NOT_FOUND, "no build output at " + dir + "; run build first")
                    .withStage(STAGE).withSubject(target.name));
        }
        auto found = find_wheel(dir, target);
        if (found.isErr()) {
            return Result<std::vector<LocalArtifact>>::err(found.error());
        }
        artifacts.push_back(std::move(found.value()));
    }
    return Result<std::vector<LocalArtifact>>::ok(std::move(artifacts));
}

std::vector<LocalArtifact> predict_artifacts(const Recipe& recipe) {
    std::vector<LocalArtifact> artifacts;
    for (const auto& target : make_build_request(recipe).targets) {
        LocalArtifact artifact;
        artifact.name = target.name;
        artifact.role = target.role;
        artifact.dependency_routed = target.dependency_routed;
        artifact.deps_mode = target.deps_mode;
        artifacts.push_back(std::move(artifact));
    }
    return artifacts;
}

} // namespace pkgstage
