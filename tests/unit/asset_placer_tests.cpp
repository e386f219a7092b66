#include <doctest/doctest.h>
#include <pkgstage/asset_placer.hpp>
#include <pkgstage/platform.hpp>

#include "../support/test_support.hpp"

using namespace pkgstage;
using pkgstage::testing::TempDir;
using pkgstage::testing::list_tree;
using pkgstage::testing::slurp;
using pkgstage::testing::write_file;

namespace {

const char* DESCRIPTOR =
    "[Desktop Entry]\n"
    "Name=MCP Central\n"
    "Exec=mcp-central\n"
    "Icon=/usr/share/pixmaps/mcp-central.png\n"
    "Type=Application\n";

struct AssetFixture {
    TempDir dir;
    std::string root = dir.sub("stage");

    AssetSpec spec(const std::string& descriptor = DESCRIPTOR) {
        write_file(dir.sub("assets/app.desktop"), descriptor);
        write_file(dir.sub("assets/icon.png"), std::string("\x89PNG\r\n\x1a\n", 8));
        AssetSpec s;
        s.package_name = "mcp-central";
        s.desktop_source = dir.sub("assets/app.desktop");
        s.icon_source = dir.sub("assets/icon.png");
        return s;
    }

    StagingRoot staging() {
        auto r = StagingRoot::make(root, "/usr");
        REQUIRE(r.isOk());
        return r.value();
    }
};

} // namespace

TEST_CASE("rewrite_icon_reference replaces the exact line") {
    auto r = rewrite_icon_reference(DESCRIPTOR, "/usr/share/pixmaps/mcp-central.png", "mcp-central");
    CHECK(r.replaced);
    CHECK(r.content ==
          "[Desktop Entry]\n"
          "Name=MCP Central\n"
          "Exec=mcp-central\n"
          "Icon=mcp-central\n"
          "Type=Application\n");
}

TEST_CASE("rewrite_icon_reference leaves near misses alone") {
    SUBCASE("different path") {
        auto r = rewrite_icon_reference("Icon=/opt/icon.png\n", "/usr/share/pixmaps/x.png", "x");
        CHECK_FALSE(r.replaced);
        CHECK(r.content == "Icon=/opt/icon.png\n");
    }
    SUBCASE("prefix only") {
        auto r = rewrite_icon_reference("Icon=/a.png.bak\n", "/a.png", "x");
        CHECK_FALSE(r.replaced);
    }
    SUBCASE("leading whitespace") {
        auto r = rewrite_icon_reference(" Icon=/a.png\n", "/a.png", "x");
        CHECK_FALSE(r.replaced);
    }
    SUBCASE("empty descriptor") {
        auto r = rewrite_icon_reference("", "/a.png", "x");
        CHECK_FALSE(r.replaced);
        CHECK(r.content.empty());
    }
}

TEST_CASE("rewrite_icon_reference keeps CRLF endings and a missing final newline") {
    auto crlf = rewrite_icon_reference("Name=A\r\nIcon=/a.png\r\nType=Application\r\n", "/a.png", "a");
    CHECK(crlf.replaced);
    CHECK(crlf.content == "Name=A\r\nIcon=a\r\nType=Application\r\n");

    auto last = rewrite_icon_reference("Name=A\nIcon=/a.png", "/a.png", "a");
    CHECK(last.replaced);
    CHECK(last.content == "Name=A\nIcon=a");
}

TEST_CASE("rewrite_icon_reference replaces only the first occurrence") {
    auto r = rewrite_icon_reference("Icon=/a.png\n[Desktop Action x]\nIcon=/a.png\n", "/a.png", "a");
    CHECK(r.replaced);
    CHECK(r.content == "Icon=a\n[Desktop Action x]\nIcon=/a.png\n");
}

TEST_CASE("place_assets installs the descriptor and icon under the prefix") {
    AssetFixture f;
    WarningCollector warnings;

    auto r = place_assets(f.spec(), f.staging(), warnings);
    REQUIRE(r.isOk());
    CHECK(r.value().icon_substituted);
    CHECK(r.value().desktop_path == f.dir.sub("stage/usr/share/applications/mcp-central.desktop"));
    CHECK(r.value().icon_path == f.dir.sub("stage/usr/share/pixmaps/mcp-central.png"));

    CHECK(list_tree(f.root) == std::vector<std::string>{
        "usr/share/applications/mcp-central.desktop",
        "usr/share/pixmaps/mcp-central.png",
    });
    CHECK(slurp(r.value().desktop_path).find("\nIcon=mcp-central\n") != std::string::npos);
    CHECK(slurp(r.value().icon_path) == slurp(f.dir.sub("assets/icon.png")));
    CHECK(warnings.get_warnings().empty());
}

TEST_CASE("a descriptor without the icon reference is copied unchanged with one warning") {
    AssetFixture f;
    WarningCollector warnings;
    const std::string descriptor = "[Desktop Entry]\nName=X\nIcon=something-else\n";

    auto r = place_assets(f.spec(descriptor), f.staging(), warnings);
    REQUIRE(r.isOk());
    CHECK_FALSE(r.value().icon_substituted);
    CHECK(slurp(r.value().desktop_path) == descriptor);
    CHECK(path_exists(r.value().icon_path));

    auto w = warnings.get_warnings();
    REQUIRE(w.size() == 1);
    CHECK(w[0].key == "asset_substitution_miss");
    CHECK(w[0].action == "warn");
    CHECK(w[0].fields.at("expected") == "Icon=/usr/share/pixmaps/mcp-central.png");
}

TEST_CASE("a custom icon reference is honored") {
    AssetFixture f;
    WarningCollector warnings;
    auto spec = f.spec("Icon=@ICON@\n");
    spec.icon_reference = "@ICON@";

    auto r = place_assets(spec, f.staging(), warnings);
    REQUIRE(r.isOk());
    CHECK(slurp(r.value().desktop_path) == "Icon=mcp-central\n");
}

TEST_CASE("a missing source is ASSET_MISSING and writes nothing") {
    AssetFixture f;
    WarningCollector warnings;

    SUBCASE("descriptor") {
        auto spec = f.spec();
        spec.desktop_source = f.dir.sub("assets/missing.desktop");
        auto r = place_assets(spec, f.staging(), warnings);
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::ASSET_MISSING);
        CHECK(r.error().stage() == "assets");
        CHECK(r.error().subject() == spec.desktop_source);
        CHECK(exit_code_for(r.error()) == 5);
    }
    SUBCASE("icon") {
        auto spec = f.spec();
        spec.icon_source = f.dir.sub("assets/missing.png");
        auto r = place_assets(spec, f.staging(), warnings);
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::ASSET_MISSING);
    }

    CHECK(list_tree(f.root).empty());
}

TEST_CASE("place_assets overwrites earlier placements") {
    AssetFixture f;
    WarningCollector warnings;
    write_file(f.dir.sub("stage/usr/share/applications/mcp-central.desktop"), "old");

    auto r = place_assets(f.spec(), f.staging(), warnings);
    REQUIRE(r.isOk());
    CHECK(slurp(r.value().desktop_path) != "old");
}

TEST_CASE("make_asset_spec reads the recipe") {
    Recipe recipe;
    recipe.package.name = "mcp-central";
    recipe.assets.desktop = "/src/mcp-central.desktop";
    recipe.assets.icon = "/src/icon.png";

    auto spec = make_asset_spec(recipe);
    CHECK(spec.package_name == "mcp-central");
    CHECK(spec.desktop_source == "/src/mcp-central.desktop");
    CHECK(spec.icon_reference == DEFAULT_ICON_REFERENCE);
}
