#include "pkgstage/recipe.hpp"
#include "pkgstage/platform.hpp"
#include "pkgstage/semver.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace pkgstage {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Helper to safely get a string array from JSON
std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& elem : j[key]) {
            if (elem.is_string()) {
                result.push_back(elem.get<std::string>());
            }
        }
    }
    return result;
}

std::string resolve_path(const std::string& base_dir, const std::string& path) {
    if (path.empty()) return path;
    if (path[0] == '/') return absolute_path(path);
    return absolute_path(join_path(base_dir, path));
}

// A dependency entry is either a specifier string or an object:
//   "httpx>=0.27"
//   {"name": "httpx", "min_version": "0.27", "channel": "index"}
bool parse_dependency_entry(const nlohmann::json& entry,
                            const std::string& origin,
                            DependencyRef& out,
                            std::string& error) {
    if (entry.is_string()) {
        auto parsed = parse_dependency_specifier(entry.get<std::string>());
        if (!parsed) {
            error = "invalid dependency specifier '" + entry.get<std::string>() + "'";
            return false;
        }
        out = *parsed;
        out.origin = origin;
        return true;
    }

    if (!entry.is_object()) {
        error = "dependency entries must be strings or objects";
        return false;
    }

    auto name = get_string(entry, "name");
    if (!name || trim(*name).empty()) {
        error = "dependency object missing name";
        return false;
    }
    out.name = trim(*name);
    out.origin = origin;

    if (auto min = get_string(entry, "min_version")) {
        out.min_version = trim(*min);
    }

    if (auto channel = get_string(entry, "channel")) {
        auto parsed = parse_preferred_channel(*channel);
        if (!parsed) {
            error = "dependency '" + out.name + "' has unknown channel '" + *channel + "'";
            return false;
        }
        out.preferred = *parsed;
    }

    return true;
}

bool parse_package(const nlohmann::json& j,
                   const std::string& base_dir,
                   Package& out,
                   std::string& error) {
    if (!j.is_object()) {
        error = "package section must be an object";
        return false;
    }

    auto name = get_string(j, "name");
    if (!name || trim(*name).empty()) {
        error = "package name missing";
        return false;
    }
    out.name = trim(*name);
    out.version = trim(get_string(j, "version").value_or(""));

    if (auto source = get_string(j, "source")) {
        auto parsed = parse_package_source(*source);
        if (!parsed) {
            error = "package '" + out.name + "' has unknown source '" + *source + "'";
            return false;
        }
        out.source = *parsed;
    }

    out.path = resolve_path(base_dir, get_string(j, "path").value_or("."));

    if (auto mode = get_string(j, "deps_mode")) {
        auto parsed = parse_deps_mode(*mode);
        if (!parsed) {
            error = "package '" + out.name + "' has unknown deps_mode '" + *mode + "'";
            return false;
        }
        out.deps_mode = *parsed;
    }

    // Presence of the list (even empty) hands the dependencies to the classifier
    if (j.contains("dependencies")) {
        if (!j["dependencies"].is_array()) {
            error = "package '" + out.name + "' dependencies must be an array";
            return false;
        }
        out.dependency_routed = true;
        for (const auto& entry : j["dependencies"]) {
            DependencyRef dep;
            if (!parse_dependency_entry(entry, out.name, dep, error)) {
                error = "package '" + out.name + "': " + error;
                return false;
            }
            out.dependencies.push_back(std::move(dep));
        }
    }

    return true;
}

bool get_timeout(const nlohmann::json& j, const std::string& key, int& out, std::string& error) {
    if (!j.contains(key)) return true;
    const auto& value = j[key];
    // Negative integers parse as signed, so only unsigned values can be valid
    if (!value.is_number_unsigned() ||
        value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        error = "tools." + key + " must be an integer from 0 to " +
                std::to_string(std::numeric_limits<int>::max());
        return false;
    }
    out = static_cast<int>(value.get<std::uint64_t>());
    return true;
}

} // namespace

std::vector<DependencyRef> Recipe::declared_dependencies() const {
    std::vector<DependencyRef> deps = package.dependencies;
    if (subproject) {
        deps.insert(deps.end(), subproject->dependencies.begin(), subproject->dependencies.end());
    }
    return deps;
}

std::optional<DependencyRef> parse_dependency_specifier(const std::string& spec) {
    std::string s = trim(spec);
    if (s.empty()) return std::nullopt;

    DependencyRef dep;
    auto pos = s.find(">=");
    if (pos == std::string::npos) {
        // Other comparison operators would need a solver
        if (s.find_first_of("<>=!~,; ") != std::string::npos) return std::nullopt;
        dep.name = s;
        return dep;
    }

    dep.name = trim(s.substr(0, pos));
    dep.min_version = trim(s.substr(pos + 2));
    if (dep.name.empty() || dep.min_version.empty()) return std::nullopt;
    if (dep.name.find_first_of("<>=!~,; ") != std::string::npos) return std::nullopt;
    return dep;
}

RecipeParseResult parse_recipe(const std::string& json_str,
                               const std::string& source_path,
                               const std::string& base_dir) {
    RecipeParseResult result;
    Recipe& recipe = result.recipe;
    recipe.source_path = source_path;
    recipe.base_dir = absolute_path(base_dir.empty() ? "." : base_dir);

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        if (auto schema = get_string(j, "$schema")) {
            recipe.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (recipe.schema != RECIPE_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + RECIPE_SCHEMA;
            return result;
        }

        // "package" section (REQUIRED)
        if (!j.contains("package")) {
            result.error = "package section missing";
            return result;
        }
        if (!parse_package(j["package"], recipe.base_dir, recipe.package, result.error)) {
            return result;
        }

        // "subproject" section
        if (j.contains("subproject") && !j["subproject"].is_null()) {
            Package sub;
            if (!parse_package(j["subproject"], recipe.base_dir, sub, result.error)) {
                result.error = "subproject: " + result.error;
                return result;
            }
            recipe.subproject = std::move(sub);
        }

        recipe.host_packages = get_string_array(j, "host_packages");

        // "install" section
        if (j.contains("install") && j["install"].is_object()) {
            const auto& install = j["install"];
            if (auto prefix = get_string(install, "prefix")) {
                recipe.install.prefix = trim(*prefix);
            }
            if (install.contains("dedupe_by_name")) {
                if (install["dedupe_by_name"].is_boolean()) {
                    recipe.install.dedupe_by_name = install["dedupe_by_name"].get<bool>();
                } else {
                    result.warnings.push_back("invalid_configuration:dedupe_by_name_not_boolean");
                }
            }
        }

        // "tools" section
        if (j.contains("tools") && j["tools"].is_object()) {
            const auto& tools = j["tools"];
            if (tools.contains("build")) {
                recipe.tools.build = get_string_array(tools, "build");
            }
            if (tools.contains("install")) {
                recipe.tools.install = get_string_array(tools, "install");
            }
            if (auto flag = get_string(tools, "no_deps_flag")) {
                recipe.tools.no_deps_flag = trim(*flag);
            }
            if (!get_timeout(tools, "build_timeout", recipe.tools.build_timeout, result.error) ||
                !get_timeout(tools, "install_timeout", recipe.tools.install_timeout, result.error)) {
                return result;
            }
        }

        // "assets" section
        if (j.contains("assets") && j["assets"].is_object()) {
            const auto& assets = j["assets"];
            recipe.assets.desktop = resolve_path(recipe.base_dir, get_string(assets, "desktop").value_or(""));
            recipe.assets.icon = resolve_path(recipe.base_dir, get_string(assets, "icon").value_or(""));
            if (auto ref = get_string(assets, "icon_reference")) {
                recipe.assets.icon_reference = trim(*ref);
            }
        }

        // "environment" section
        if (j.contains("environment") && j["environment"].is_object()) {
            for (auto& [key, val] : j["environment"].items()) {
                if (val.is_string()) {
                    recipe.environment[key] = val.get<std::string>();
                } else {
                    result.warnings.push_back("invalid_configuration:environment_not_string:" + key);
                }
            }
        }

        // "warnings" section
        if (j.contains("warnings") && j["warnings"].is_object()) {
            for (auto& [key, val] : j["warnings"].items()) {
                std::string key_str = to_lower(key);
                if (!parse_warning_key(key_str)) {
                    result.warnings.push_back("invalid_configuration:unknown_warning_key:" + key_str);
                    continue;
                }
                auto action = val.is_string() ? parse_warning_action(val.get<std::string>())
                                              : std::nullopt;
                if (action) {
                    recipe.warnings[key_str] = *action;
                } else {
                    result.warnings.push_back("invalid_configuration:invalid_warning_action:" + key_str);
                }
            }
        }

        recipe.output_dir = resolve_path(recipe.base_dir, get_string(j, "output_dir").value_or("dist"));

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

Result<void> validate_recipe(const Recipe& recipe) {
    auto fail = [&](const std::string& msg) {
        return Result<void>::err(
            Error(ErrorCode::CONFIGURATION_ERROR, msg).withStage("recipe").withSubject(recipe.source_path));
    };

    if (recipe.package.source != PackageSource::LocalBuild) {
        return fail("package '" + recipe.package.name + "' must have source local-build");
    }
    if (recipe.subproject) {
        if (recipe.subproject->source != PackageSource::LocalBuild) {
            return fail("subproject '" + recipe.subproject->name + "' must have source local-build");
        }
        if (normalize_name(recipe.subproject->name) == normalize_name(recipe.package.name)) {
            return fail("subproject and package share the name '" + recipe.package.name + "'");
        }
    }

    for (const auto& dep : recipe.declared_dependencies()) {
        if (!dep.min_version.empty() && !is_valid_min_version(dep.min_version)) {
            return fail("dependency '" + dep.name + "' has invalid min_version '" + dep.min_version + "'");
        }
        if (normalize_name(dep.name) == normalize_name(dep.origin)) {
            return fail("package '" + dep.origin + "' declares itself as a dependency");
        }
    }

    for (const auto& name : recipe.host_packages) {
        if (trim(name).empty()) {
            return fail("host_packages contains an empty name");
        }
    }

    if (recipe.install.prefix.empty() || recipe.install.prefix[0] != '/') {
        return fail("install.prefix must be an absolute path");
    }
    if (recipe.tools.build.empty()) {
        return fail("tools.build must not be empty");
    }
    if (recipe.tools.install.empty()) {
        return fail("tools.install must not be empty");
    }
    if (recipe.tools.no_deps_flag.empty()) {
        return fail("tools.no_deps_flag must not be empty");
    }
    if (recipe.assets.enabled() && (recipe.assets.desktop.empty() || recipe.assets.icon.empty())) {
        return fail("assets needs both desktop and icon");
    }

    return Result<void>::ok();
}

Result<Recipe> load_recipe(const std::string& path, WarningCollector& warnings) {
    auto content = read_file(path);
    if (!content) {
        return Result<Recipe>::err(
            Error(ErrorCode::FILE_NOT_FOUND, "cannot read recipe").withStage("recipe").withSubject(path));
    }

    auto parsed = parse_recipe(*content, path, get_parent_directory(absolute_path(path)));
    if (!parsed.ok) {
        return Result<Recipe>::err(
            Error(ErrorCode::CONFIGURATION_ERROR, parsed.error).withStage("recipe").withSubject(path));
    }

    warnings.set_policy(parsed.recipe.warnings);
    for (const auto& warning : parsed.warnings) {
        // "invalid_configuration:<reason>"
        auto colon = warning.find(':');
        std::string reason = colon == std::string::npos ? warning : warning.substr(colon + 1);
        warnings.emit(Warning::invalid_configuration, warnings::invalid_configuration(reason, path));
    }

    auto valid = validate_recipe(parsed.recipe);
    if (valid.isErr()) {
        return Result<Recipe>::err(valid.error());
    }

    spdlog::debug("loaded recipe {} for {}", path, parsed.recipe.package.name);
    return Result<Recipe>::ok(std::move(parsed.recipe));
}

Result<std::vector<std::string>> expand_command(
    const std::vector<std::string>& argv,
    const std::unordered_map<std::string, std::string>& vars) {
    std::vector<std::string> out;
    out.reserve(argv.size());

    for (const auto& arg : argv) {
        std::string expanded;
        size_t i = 0;
        while (i < arg.size()) {
            if (arg[i] != '{') {
                expanded += arg[i++];
                continue;
            }
            size_t close = arg.find('}', i + 1);
            if (close == std::string::npos) {
                // No closing brace, copy literally
                expanded += arg.substr(i);
                break;
            }
            std::string name = arg.substr(i + 1, close - i - 1);
            auto it = vars.find(name);
            if (it == vars.end()) {
                return Result<std::vector<std::string>>::err(
                    Error(ErrorCode::CONFIGURATION_ERROR,
                          "unknown placeholder {" + name + "} in '" + arg + "'"));
            }
            expanded += it->second;
            i = close + 1;
        }
        out.push_back(std::move(expanded));
    }

    return Result<std::vector<std::string>>::ok(std::move(out));
}

} // namespace pkgstage
