#include <doctest/doctest.h>
#include <pkgstage/platform.hpp>

#include "../support/test_support.hpp"

using namespace pkgstage;
using pkgstage::testing::TempDir;
using pkgstage::testing::slurp;
using pkgstage::testing::write_file;

TEST_CASE("atomic_write_file writes and replaces content") {
    TempDir dir;
    std::string path = dir.sub("record.json");

    auto first = atomic_write_file(path, "one");
    REQUIRE(first.ok);
    CHECK(slurp(path) == "one");

    auto second = atomic_write_file(path, "two");
    REQUIRE(second.ok);
    CHECK(slurp(path) == "two");

    // No temp files left behind
    CHECK(list_directory(dir.path()) == std::vector<std::string>{"record.json"});
}

TEST_CASE("atomic_write_file fails for a missing directory") {
    TempDir dir;
    auto r = atomic_write_file(dir.sub("missing/record.json"), "x");
    CHECK_FALSE(r.ok);
    CHECK_FALSE(r.error.empty());
}

TEST_CASE("replace_directory swaps in a finished directory") {
    TempDir dir;
    write_file(dir.sub("old/stale.whl"), "old");
    write_file(dir.sub("new/fresh.whl"), "new");

    auto r = replace_directory(dir.sub("new"), dir.sub("old"));
    REQUIRE(r.ok);
    CHECK(list_directory(dir.sub("old")) == std::vector<std::string>{"fresh.whl"});
    CHECK_FALSE(path_exists(dir.sub("new")));
}

TEST_CASE("make_temp_path produces distinct siblings") {
    std::string a = make_temp_path("/out/app");
    std::string b = make_temp_path("/out/app");
    CHECK(a.rfind("/out/app.tmp.", 0) == 0);
    CHECK(a != b);
}

TEST_CASE("absolute_path normalizes lexically") {
    CHECK(absolute_path("/a/b/../c/") == "/a/c");
    CHECK(absolute_path("/a/./b") == "/a/b");
}

TEST_CASE("read_file returns nullopt for missing files") {
    TempDir dir;
    CHECK_FALSE(read_file(dir.sub("nope")).has_value());
    write_file(dir.sub("yes"), "content");
    CHECK(read_file(dir.sub("yes")) == std::optional<std::string>("content"));
}

TEST_CASE("compute_sha256 of known content") {
    TempDir dir;
    write_file(dir.sub("abc"), "abc");
    auto h = compute_sha256(dir.sub("abc"));
    REQUIRE(h.ok);
    CHECK(h.hex_digest == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    auto missing = compute_sha256(dir.sub("missing"));
    CHECK_FALSE(missing.ok);
}

TEST_CASE("snapshot_tree lists files sorted with digests") {
    TempDir dir;
    write_file(dir.sub("usr/share/b.txt"), "b");
    write_file(dir.sub("usr/lib/a.txt"), "a");

    auto snap = snapshot_tree(dir.path());
    REQUIRE(snap.ok);
    REQUIRE(snap.files.size() == 2);
    CHECK(snap.files[0].path == "usr/lib/a.txt");
    CHECK(snap.files[1].path == "usr/share/b.txt");
    CHECK(snap.files[0].sha256.size() == 64);
    CHECK_FALSE(snap.files[0].executable);
}

TEST_CASE("snapshot_tree equal for identical trees") {
    TempDir one;
    TempDir two;
    for (const auto* root : {&one, &two}) {
        write_file(root->sub("usr/share/applications/app.desktop"), "[Desktop Entry]\n");
        write_file(root->sub("usr/lib/site/app/SPEC"), "app\n");
    }

    auto a = snapshot_tree(one.path());
    auto b = snapshot_tree(two.path());
    REQUIRE(a.ok);
    REQUIRE(b.ok);
    REQUIRE(a.files.size() == b.files.size());
    for (size_t i = 0; i < a.files.size(); ++i) {
        CHECK(a.files[i].path == b.files[i].path);
        CHECK(a.files[i].sha256 == b.files[i].sha256);
    }

    write_file(two.sub("usr/lib/site/app/SPEC"), "changed\n");
    auto c = snapshot_tree(two.path());
    REQUIRE(c.ok);
    CHECK(c.files[0].sha256 != a.files[0].sha256);
}
