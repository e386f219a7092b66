#include <doctest/doctest.h>
#include <pkgstage/pipeline.hpp>
#include <pkgstage/platform.hpp>

#include <nlohmann/json.hpp>

#include "../support/test_support.hpp"

using namespace pkgstage;
using pkgstage::testing::TempDir;
using pkgstage::testing::list_tree;
using pkgstage::testing::make_project;
using pkgstage::testing::read_lines;
using pkgstage::testing::slurp;
using pkgstage::testing::write_fake_builder;
using pkgstage::testing::write_fake_installer;
using pkgstage::testing::write_file;

#ifndef PKGSTAGE_EXAMPLES_DIR
#error "PKGSTAGE_EXAMPLES_DIR must name the sample recipe directory"
#endif

namespace {

// An application with one bundled subproject, staged by the fake tools:
//
//   app     textual>=0.47, keyring (host), helper (bundled)
//   helper  httpx>=0.27, rich
struct Project {
    TempDir dir;
    std::string build_log = dir.sub("build.log");
    std::string install_log = dir.sub("install.log");
    std::string builder = write_fake_builder(dir.path(), build_log);
    std::string installer = write_fake_installer(dir.path(), install_log);
    nlohmann::json recipe;

    Project() {
        make_project(dir.sub("app"), "app-1.0.0-py3-none-any.whl");
        make_project(dir.sub("app/helper"), "helper-0.2.0-py3-none-any.whl");
        write_file(dir.sub("assets/app.desktop"),
                   "[Desktop Entry]\nName=App\nExec=app\nIcon=/usr/share/pixmaps/app.png\n");
        write_file(dir.sub("assets/app.png"), "png");

        recipe = {
            {"$schema", "pkgstage.recipe.v1"},
            {"package", {
                {"name", "app"},
                {"version", "1.0.0"},
                {"path", "app"},
                {"dependencies", {
                    "textual>=0.47",
                    {{"name", "keyring"}, {"channel", "host"}},
                    {{"name", "helper"}, {"channel", "bundled"}},
                }},
            }},
            {"subproject", {
                {"name", "helper"},
                {"path", "app/helper"},
                {"dependencies", {"httpx>=0.27", "rich"}},
            }},
            {"host_packages", nlohmann::json::array({"python-yaml"})},
            {"tools", {
                {"build", {"/bin/sh", builder, "{outdir}", "{source}"}},
                {"install", {"/bin/sh", installer, "{root}", "{prefix}"}},
            }},
            {"assets", {
                {"desktop", "assets/app.desktop"},
                {"icon", "assets/app.png"},
                {"icon_reference", "/usr/share/pixmaps/app.png"},
            }},
            {"output_dir", "dist"},
        };
    }

    std::string write_recipe() const {
        std::string path = dir.sub("recipe.json");
        write_file(path, recipe.dump(2));
        return path;
    }

    Result<StageResult> stage(const std::string& root, WarningCollector& warnings,
                              StageOptions options = {}) const {
        auto loaded = load_recipe(write_recipe(), warnings);
        REQUIRE(loaded.isOk());
        options.staging_root = root;
        return run_stage(loaded.value(), options, warnings);
    }
};

const std::vector<std::string> STAGED_FILES = {
    "usr/lib/site/app/SPEC",
    "usr/lib/site/helper/SPEC",
    "usr/lib/site/httpx/SPEC",
    "usr/lib/site/rich/SPEC",
    "usr/lib/site/textual/SPEC",
    "usr/share/applications/app.desktop",
    "usr/share/pixmaps/app.png",
};

} // namespace

TEST_CASE("stage builds, installs and places assets in order") {
    Project p;
    WarningCollector warnings;
    std::string root = p.dir.sub("stage");

    auto r = p.stage(root, warnings);
    REQUIRE(r.isOk());

    CHECK(list_tree(root) == STAGED_FILES);
    CHECK(read_lines(p.build_log).size() == 2);

    auto lines = read_lines(p.install_log);
    REQUIRE(lines.size() == 5);
    CHECK(lines[0] == "--no-deps " + p.dir.sub("dist/app/app-1.0.0-py3-none-any.whl"));
    CHECK(lines[1] == "textual>=0.47");
    CHECK(lines[2] == "httpx>=0.27");
    CHECK(lines[3] == "rich");
    CHECK(lines[4] == "--no-deps " + p.dir.sub("dist/helper/helper-0.2.0-py3-none-any.whl"));

    // Host-satisfied names never reach the installer
    CHECK(r.value().plan->channel_of("keyring") == Channel::HostManaged);
    CHECK(r.value().install->host_managed == std::vector<std::string>{"keyring"});

    CHECK(slurp(p.dir.sub("stage/usr/share/applications/app.desktop")) ==
          "[Desktop Entry]\nName=App\nExec=app\nIcon=app\n");
    CHECK(warnings.get_warnings().empty());
}

TEST_CASE("staging twice into fresh roots yields identical trees") {
    Project p;
    WarningCollector first_warnings;
    WarningCollector second_warnings;

    REQUIRE(p.stage(p.dir.sub("one"), first_warnings).isOk());
    REQUIRE(p.stage(p.dir.sub("two"), second_warnings).isOk());

    auto a = snapshot_tree(p.dir.sub("one"));
    auto b = snapshot_tree(p.dir.sub("two"));
    REQUIRE(a.ok);
    REQUIRE(b.ok);
    REQUIRE(a.files.size() == b.files.size());
    for (size_t i = 0; i < a.files.size(); ++i) {
        CHECK(a.files[i].path == b.files[i].path);
        CHECK(a.files[i].sha256 == b.files[i].sha256);
    }
}

TEST_CASE("a failed build stops the run before anything is staged") {
    Project p;
    write_file(p.dir.sub("app/FAIL"), "");
    WarningCollector warnings;
    std::string root = p.dir.sub("stage");

    auto r = p.stage(root, warnings);
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::BUILD_FAILURE);
    CHECK(r.error().subject() == "app");
    CHECK(exit_code_for(r.error()) == 7);

    CHECK_FALSE(path_exists(root));
    CHECK_FALSE(path_exists(p.install_log));
    // The subproject build never started
    CHECK(read_lines(p.build_log).size() == 1);
}

TEST_CASE("a name both host-provided and bundled fails classification") {
    Project p;
    p.recipe["host_packages"] = nlohmann::json::array({"helper"});
    WarningCollector warnings;
    std::string root = p.dir.sub("stage");

    auto r = p.stage(root, warnings);
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::CLASSIFICATION_CONFLICT);
    CHECK(r.error().stage() == "classify");
    CHECK(exit_code_for(r.error()) == 3);
    CHECK_FALSE(path_exists(root));
}

TEST_CASE("a failed install keeps the installer status and earlier installs") {
    Project p;
    p.recipe["environment"] = {{"FAIL_NAME", "httpx"}};
    WarningCollector warnings;
    std::string root = p.dir.sub("stage");

    auto r = p.stage(root, warnings);
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::INSTALL_FAILURE);
    CHECK(exit_code_for(r.error()) == 9);
    CHECK(list_tree(root) == std::vector<std::string>{
        "usr/lib/site/app/SPEC",
        "usr/lib/site/textual/SPEC",
    });
}

TEST_CASE("a descriptor without the icon reference warns and still stages") {
    Project p;
    write_file(p.dir.sub("assets/app.desktop"), "[Desktop Entry]\nName=App\nIcon=app\n");
    WarningCollector warnings;
    std::string root = p.dir.sub("stage");

    auto r = p.stage(root, warnings);
    REQUIRE(r.isOk());
    CHECK(list_tree(root) == STAGED_FILES);

    auto w = warnings.get_warnings();
    REQUIRE(w.size() == 1);
    CHECK(w[0].key == "asset_substitution_miss");
}

TEST_CASE("the warning policy can make a substitution miss fatal") {
    Project p;
    write_file(p.dir.sub("assets/app.desktop"), "[Desktop Entry]\nIcon=app\n");
    p.recipe["warnings"] = {{"asset_substitution_miss", "error"}};
    WarningCollector warnings;

    auto r = p.stage(p.dir.sub("stage"), warnings);
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::WARNING_AS_ERROR);
    CHECK(r.error().stage() == "assets");
    CHECK(exit_code_for(r.error()) == 2);
}

TEST_CASE("duplicate declarations are refused when dedupe is off") {
    Project p;
    p.recipe["package"]["dependencies"].push_back("httpx");
    p.recipe["install"] = {{"dedupe_by_name", false}};
    WarningCollector warnings;
    std::string root = p.dir.sub("stage");

    auto r = p.stage(root, warnings);
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::DUPLICATE_INSTALL);
    CHECK(exit_code_for(r.error()) == 4);
    CHECK_FALSE(path_exists(root));

    auto w = warnings.get_warnings();
    REQUIRE(w.size() == 1);
    CHECK(w[0].key == "duplicate_dependency");
}

TEST_CASE("duplicate declarations install once when dedupe is on") {
    Project p;
    p.recipe["package"]["dependencies"].push_back("httpx>=0.20");
    WarningCollector warnings;

    auto r = p.stage(p.dir.sub("stage"), warnings);
    REQUIRE(r.isOk());
    auto lines = read_lines(p.install_log);
    CHECK(std::count(lines.begin(), lines.end(), "httpx>=0.27") == 1);
    CHECK(r.value().plan->occurrences("httpx") == 1);
}

TEST_CASE("dry run plans without touching the staging root") {
    Project p;
    WarningCollector warnings;
    std::string root = p.dir.sub("stage");
    StageOptions options;
    options.dry_run = true;
    options.record_path = p.dir.sub("record.json");

    auto r = p.stage(root, warnings, options);
    REQUIRE(r.isOk());
    CHECK(r.value().install->dry_run);
    CHECK(r.value().install->invocations.size() == 5);
    CHECK_FALSE(r.value().assets.has_value());
    CHECK_FALSE(path_exists(root));
    CHECK_FALSE(path_exists(p.install_log));

    auto record = nlohmann::json::parse(slurp(options.record_path));
    CHECK(record["dry_run"] == true);
    CHECK_FALSE(record.contains("staged_files"));
}

TEST_CASE("skip_build reuses wheels from an earlier build") {
    Project p;

    SUBCASE("without an earlier build") {
        WarningCollector warnings;
        StageOptions options;
        options.skip_build = true;
        auto r = p.stage(p.dir.sub("stage"), warnings, options);
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::FILE_NOT_FOUND);
    }

    SUBCASE("after a build") {
        WarningCollector first;
        REQUIRE(p.stage(p.dir.sub("one"), first).isOk());
        REQUIRE(read_lines(p.build_log).size() == 2);

        WarningCollector second;
        StageOptions options;
        options.skip_build = true;
        REQUIRE(p.stage(p.dir.sub("two"), second, options).isOk());
        CHECK(read_lines(p.build_log).size() == 2);
        CHECK(list_tree(p.dir.sub("two")) == STAGED_FILES);
    }
}

TEST_CASE("a prefix override moves the installed image") {
    Project p;
    WarningCollector warnings;
    StageOptions options;
    options.prefix = "/opt/app";
    std::string root = p.dir.sub("stage");

    REQUIRE(p.stage(root, warnings, options).isOk());
    CHECK(path_exists(p.dir.sub("stage/opt/app/lib/site/app/SPEC")));
    CHECK(path_exists(p.dir.sub("stage/opt/app/share/applications/app.desktop")));
}

TEST_CASE("the run record describes the staged tree") {
    Project p;
    WarningCollector warnings;
    StageOptions options;
    options.record_path = p.dir.sub("records/run.json");

    REQUIRE(p.stage(p.dir.sub("stage"), warnings, options).isOk());

    auto record = nlohmann::json::parse(slurp(options.record_path));
    CHECK(record["$schema"] == "pkgstage.record.v1");
    CHECK(record["package"]["name"] == "app");
    CHECK(record["artifacts"].size() == 2);
    CHECK(record["plan"]["actions"].size() == 3);
    CHECK(record["invocations"].size() == 5);
    CHECK(record["assets"]["icon_substituted"] == true);
    REQUIRE(record["staged_files"].size() == STAGED_FILES.size());
    for (size_t i = 0; i < STAGED_FILES.size(); ++i) {
        CHECK(record["staged_files"][i]["path"] == STAGED_FILES[i]);
    }
}

TEST_CASE("run_place_assets works on its own") {
    Project p;
    WarningCollector warnings;
    auto recipe = load_recipe(p.write_recipe(), warnings);
    REQUIRE(recipe.isOk());

    auto r = run_place_assets(recipe.value(), p.dir.sub("stage"), warnings);
    REQUIRE(r.isOk());
    CHECK(list_tree(p.dir.sub("stage")) == std::vector<std::string>{
        "usr/share/applications/app.desktop",
        "usr/share/pixmaps/app.png",
    });

    recipe.value().assets = AssetConfig{};
    auto none = run_place_assets(recipe.value(), p.dir.sub("stage"), warnings);
    REQUIRE(none.isErr());
    CHECK(none.error().code() == ErrorCode::CONFIGURATION_ERROR);
}

TEST_CASE("run_place_assets honours an upgraded recipe warning before writing") {
    Project p;
    p.recipe["environment"] = {{"RETRIES", 3}};
    p.recipe["warnings"] = {{"invalid_configuration", "error"}};

    WarningCollector warnings;
    auto recipe = load_recipe(p.write_recipe(), warnings);
    REQUIRE(recipe.isOk());

    auto r = run_place_assets(recipe.value(), p.dir.sub("stage"), warnings);
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::WARNING_AS_ERROR);
    CHECK(r.error().stage() == "recipe");
    CHECK(r.error().subject() == "invalid_configuration");
    CHECK_FALSE(path_exists(p.dir.sub("stage")));
}

TEST_CASE("the sample recipe leaves host packages to the host") {
    WarningCollector warnings;
    auto recipe = load_recipe(std::string(PKGSTAGE_EXAMPLES_DIR) + "/mcp-central/recipe.json",
                              warnings);
    REQUIRE(recipe.isOk());

    auto plan = plan_recipe(recipe.value(), predict_artifacts(recipe.value()), warnings);
    REQUIRE(plan.isOk());

    for (const char* name : {"keyring", "PyQt6", "rich", "prompt_toolkit"}) {
        CHECK(plan.value().channel_of(name) == Channel::HostManaged);
    }
    CHECK(plan.value().channel_of("httpx") == Channel::IndexInstall);
    CHECK(plan.value().occurrences("httpx") == 1);
    CHECK(plan.value().channel_of("mcp-client-for-ollama") == Channel::LocalArtifactInstall);

    // The index preference of rich is overridden, and the sample ignores that warning
    CHECK(warnings.get_warnings().empty());
}

TEST_CASE("a missing build tool fails the stage with exit status 1") {
    Project p;
    p.recipe["tools"]["build"] = {p.dir.sub("no-such-python"), "-m", "build", "{outdir}", "{source}"};
    WarningCollector warnings;
    std::string root = p.dir.sub("stage");

    auto r = p.stage(root, warnings);
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::BUILD_FAILURE);
    CHECK(r.error().stage() == "build");
    CHECK(exit_code_for(r.error()) == 1);
    CHECK_FALSE(path_exists(root));
    CHECK_FALSE(path_exists(p.install_log));
}
