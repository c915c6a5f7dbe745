#include <catch2/catch.hpp>
#include <fnr/core/walker.hpp>
#include "temp_dir.hpp"
#include <algorithm>
#include <vector>

using namespace fnr;

static std::vector<std::string> walk_all(const WalkOptions& opts,
                                         std::vector<FnrError>* warnings = nullptr) {
    auto w = Walker::open(opts);
    REQUIRE(w.is_ok());
    std::vector<std::string> out;
    while (auto e = w.value().next()) out.push_back(e->rel_path);
    if (warnings) *warnings = w.value().warnings();
    return out;
}

static bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

TEST_CASE("walker yields directories before their contents in name order", "[walker]") {
    TempDir td;
    td.write_file("b.txt");
    td.write_file("a/z.txt");
    td.write_file("a/y.txt");

    WalkOptions opts;
    opts.root = td.path;
    auto got = walk_all(opts);
    REQUIRE(got == std::vector<std::string>{"a", "a/y.txt", "a/z.txt", "b.txt"});
}

TEST_CASE("walker never yields the root", "[walker]") {
    TempDir td;
    WalkOptions opts;
    opts.root = td.path;
    REQUIRE(walk_all(opts).empty());
}

TEST_CASE("walker entries carry depth and kind", "[walker]") {
    TempDir td;
    td.write_file("d/f.txt");
    WalkOptions opts;
    opts.root = td.path;

    auto w = Walker::open(opts).value();
    auto dir = w.next();
    REQUIRE(dir->is_dir);
    REQUIRE(dir->depth == 1);
    REQUIRE(dir->path == td.path / "d");
    auto file = w.next();
    REQUIRE_FALSE(file->is_dir);
    REQUIRE(file->depth == 2);
    REQUIRE_FALSE(w.next().has_value());
}

TEST_CASE("non-recursive walk stays at depth one", "[walker]") {
    TempDir td;
    td.write_file("top.txt");
    td.write_file("sub/inner.txt");
    WalkOptions opts;
    opts.root = td.path;
    opts.recursive = false;
    auto got = walk_all(opts);
    REQUIRE(got == std::vector<std::string>{"sub", "top.txt"});
}

TEST_CASE("max and min depth bound the walk", "[walker]") {
    TempDir td;
    td.write_file("l1/l2/l3/deep.txt");
    WalkOptions opts;
    opts.root = td.path;
    opts.min_depth = 2;
    opts.max_depth = 3;
    auto got = walk_all(opts);
    REQUIRE(got == std::vector<std::string>{"l1/l2", "l1/l2/l3"});
}

TEST_CASE("max depth zero yields nothing", "[walker]") {
    TempDir td;
    td.write_file("a.txt");
    WalkOptions opts;
    opts.root = td.path;
    opts.max_depth = 0;
    REQUIRE(walk_all(opts).empty());
}

TEST_CASE("hidden entries are skipped unless requested", "[walker]") {
    TempDir td;
    td.write_file(".secret/key.txt");
    td.write_file(".env");
    td.write_file("visible.txt");

    WalkOptions opts;
    opts.root = td.path;
    opts.honor_ignore = false;
    REQUIRE(walk_all(opts) == std::vector<std::string>{"visible.txt"});

    opts.include_hidden = true;
    auto got = walk_all(opts);
    REQUIRE(contains(got, ".env"));
    REQUIRE(contains(got, ".secret/key.txt"));
}

TEST_CASE("gitignore rules prune files and directories", "[walker]") {
    TempDir td;
    td.write_file(".gitignore", "build/\n*.o\n");
    td.write_file("build/out.bin");
    td.write_file("src/main.o");
    td.write_file("src/main.c");

    WalkOptions opts;
    opts.root = td.path;
    auto got = walk_all(opts);
    REQUIRE(got == std::vector<std::string>{"src", "src/main.c"});

    opts.honor_ignore = false;
    got = walk_all(opts);
    REQUIRE(contains(got, "build/out.bin"));
    REQUIRE(contains(got, "src/main.o"));
}

TEST_CASE("nested ignore file overrides its parent", "[walker]") {
    TempDir td;
    td.write_file(".gitignore", "*.log\n");
    td.write_file("logs/.ignore", "!keep.log\n");
    td.write_file("logs/keep.log");
    td.write_file("logs/drop.log");
    td.write_file("other.log");

    WalkOptions opts;
    opts.root = td.path;
    auto got = walk_all(opts);
    REQUIRE(contains(got, "logs/keep.log"));
    REQUIRE_FALSE(contains(got, "logs/drop.log"));
    REQUIRE_FALSE(contains(got, "other.log"));
}

TEST_CASE(".git is skipped when ignore files are honored", "[walker]") {
    TempDir td;
    td.write_file(".git/HEAD", "ref: refs/heads/main\n");
    td.write_file("a.txt");
    WalkOptions opts;
    opts.root = td.path;
    opts.include_hidden = true;
    REQUIRE(walk_all(opts) == std::vector<std::string>{"a.txt"});
}

TEST_CASE("broken symlink is a warning when following links", "[walker]") {
    TempDir td;
    td.write_file("real.txt");
    fs::create_symlink(td.path / "missing", td.path / "dangling");

    WalkOptions opts;
    opts.root = td.path;
    std::vector<FnrError> warnings;
    auto got = walk_all(opts, &warnings);
    REQUIRE(got == std::vector<std::string>{"real.txt"});
    REQUIRE(warnings.size() == 1);
    REQUIRE(warnings[0].code == FnrError::WalkWarning);

    opts.follow_symlinks = false;
    got = walk_all(opts, &warnings);
    REQUIRE(contains(got, "dangling"));
    REQUIRE(warnings.empty());
}

TEST_CASE("symlinked directory is descended only when following", "[walker]") {
    TempDir td;
    td.write_file("target/inside.txt");
    fs::create_directory_symlink(td.path / "target", td.path / "link");

    WalkOptions opts;
    opts.root = td.path;
    auto got = walk_all(opts);
    REQUIRE(contains(got, "link/inside.txt"));

    opts.follow_symlinks = false;
    got = walk_all(opts);
    REQUIRE(contains(got, "link"));
    REQUIRE_FALSE(contains(got, "link/inside.txt"));
}

TEST_CASE("symlink loop is reported, not followed forever", "[walker]") {
    TempDir td;
    td.make_dir("loop");
    fs::create_directory_symlink(td.path / "loop", td.path / "loop" / "again");

    WalkOptions opts;
    opts.root = td.path;
    std::vector<FnrError> warnings;
    auto got = walk_all(opts, &warnings);
    REQUIRE(got == std::vector<std::string>{"loop"});
    REQUIRE(warnings.size() == 1);
    REQUIRE(warnings[0].message.find("loop") != std::string::npos);
}

TEST_CASE("missing root is an IO error", "[walker]") {
    WalkOptions opts;
    opts.root = "/nonexistent_fnr_dir_xyz";
    auto w = Walker::open(opts);
    REQUIRE(w.failed_with(FnrError::IO));
}

TEST_CASE("file root is an IO error", "[walker]") {
    TempDir td;
    td.write_file("plain.txt");
    WalkOptions opts;
    opts.root = td.path / "plain.txt";
    REQUIRE(Walker::open(opts).failed_with(FnrError::IO));
}

TEST_CASE("repository exclude file applies below the root's ignore files", "[walker]") {
    TempDir td;
    td.write_file(".git/info/exclude", "*.tmp\nkeep.bak\n");
    td.write_file(".gitignore", "*.bak\n!keep.bak\n");
    td.write_file("scratch.tmp");
    td.write_file("keep.bak");
    td.write_file("drop.bak");
    td.write_file("main.c");

    WalkOptions opts;
    opts.root = td.path;
    auto got = walk_all(opts);
    REQUIRE(got == std::vector<std::string>{"keep.bak", "main.c"});

    opts.honor_ignore = false;
    got = walk_all(opts);
    REQUIRE(contains(got, "scratch.tmp"));
}
