#include <catch2/catch.hpp>
#include <fnr/config.hpp>
#include "temp_dir.hpp"

using namespace fnr;

TEST_CASE("parse reads every section", "[config]") {
    auto cfg = Config::parse(R"(
[search]
regex = true
case-sensitive = true
hidden = true
follow-symlinks = false
respect-ignore = false
recursive = false
max-depth = 4
min-depth = 2
type = "dir"
globs = ["*.txt", "!tmp/**"]

[rename]
interactive = false

[output]
color = false
log-level = "debug"
)");
    REQUIRE(cfg.is_ok());
    auto& c = cfg.value();
    REQUIRE(c.regex == true);
    REQUIRE(c.case_sensitive == true);
    REQUIRE(c.hidden == true);
    REQUIRE(c.follow_symlinks == false);
    REQUIRE(c.respect_ignore == false);
    REQUIRE(c.recursive == false);
    REQUIRE(c.max_depth == size_t(4));
    REQUIRE(c.min_depth == size_t(2));
    REQUIRE(c.type == EntryType::Dir);
    REQUIRE(c.globs.value() == std::vector<std::string>{"*.txt", "!tmp/**"});
    REQUIRE(c.interactive == false);
    REQUIRE(c.color == false);
    REQUIRE(c.log_level.value() == "debug");
}

TEST_CASE("empty document sets nothing", "[config]") {
    auto cfg = Config::parse("");
    REQUIRE(cfg.is_ok());
    REQUIRE_FALSE(cfg.value().regex.has_value());
    REQUIRE_FALSE(cfg.value().globs.has_value());
    REQUIRE_FALSE(cfg.value().log_level.has_value());
}

TEST_CASE("unknown keys are tolerated", "[config]") {
    auto cfg = Config::parse("[search]\nfrobnicate = 1\nregex = true\n");
    REQUIRE(cfg.is_ok());
    REQUIRE(cfg.value().regex == true);
}

TEST_CASE("wrong value types are config errors", "[config]") {
    REQUIRE(Config::parse("[search]\nregex = \"yes\"\n").failed_with(FnrError::Config));
    REQUIRE(Config::parse("[search]\nmax-depth = \"3\"\n").failed_with(FnrError::Config));
    REQUIRE(Config::parse("[search]\nmax-depth = -1\n").failed_with(FnrError::Config));
    REQUIRE(Config::parse("[search]\nglobs = \"*.txt\"\n").failed_with(FnrError::Config));
    REQUIRE(Config::parse("[search]\nglobs = [1, 2]\n").failed_with(FnrError::Config));
    REQUIRE(Config::parse("[search]\ntype = \"socket\"\n").failed_with(FnrError::Config));
    REQUIRE(Config::parse("[output]\nlog-level = \"loud\"\n").failed_with(FnrError::Config));
    REQUIRE(Config::parse("search = 3\n").failed_with(FnrError::Config));
}

TEST_CASE("malformed TOML is a parse error", "[config]") {
    auto cfg = Config::parse("[search\nregex = true\n");
    REQUIRE(cfg.failed_with(FnrError::Parse));
}

TEST_CASE("load attaches the file path to errors", "[config]") {
    TempDir td;
    td.write_file("bad.toml", "[search]\nhidden = 7\n");
    auto path = (td.path / "bad.toml").string();
    auto cfg = Config::load(path);
    REQUIRE(cfg.failed_with(FnrError::Config));
    REQUIRE(cfg.error().path == path);

    REQUIRE(Config::load((td.path / "absent.toml").string()).failed_with(FnrError::IO));
}

TEST_CASE("load_if_present treats a missing file as unset", "[config]") {
    TempDir td;
    auto missing = Config::load_if_present((td.path / "nope.toml").string());
    REQUIRE(missing.is_ok());
    REQUIRE_FALSE(missing.value().has_value());

    REQUIRE(Config::load_if_present("").value() == std::nullopt);

    td.write_file("here.toml", "[rename]\ninteractive = false\n");
    auto present = Config::load_if_present((td.path / "here.toml").string());
    REQUIRE(present.is_ok());
    REQUIRE(present.value()->interactive == false);
}

TEST_CASE("later layers override earlier ones key by key", "[config]") {
    Config global;
    global.regex = true;
    global.hidden = true;
    global.max_depth = 5;

    Config project;
    project.hidden = false;
    project.type = EntryType::File;

    Config cli;
    cli.max_depth = 1;

    auto eff = Config::effective(global, project, cli);
    REQUIRE(eff.regex == true);
    REQUIRE(eff.hidden == false);
    REQUIRE(eff.type == EntryType::File);
    REQUIRE(eff.max_depth == size_t(1));

    auto no_files = Config::effective(std::nullopt, std::nullopt, cli);
    REQUIRE_FALSE(no_files.regex.has_value());
    REQUIRE(no_files.max_depth == size_t(1));
}

TEST_CASE("apply copies only the set values", "[config]") {
    Config cfg;
    cfg.regex = true;
    cfg.respect_ignore = false;
    cfg.min_depth = 2;
    cfg.globs = std::vector<std::string>{"*.md"};

    WalkOptions walk;
    FilterConfig filter;
    PatternConfig pattern;
    cfg.apply(walk, filter, pattern);

    REQUIRE(pattern.regex);
    REQUIRE_FALSE(pattern.case_sensitive);
    REQUIRE_FALSE(walk.honor_ignore);
    REQUIRE(walk.follow_symlinks);
    REQUIRE(walk.min_depth == size_t(2));
    REQUIRE_FALSE(walk.max_depth.has_value());
    REQUIRE(filter.globs == std::vector<std::string>{"*.md"});
    REQUIRE(filter.type == EntryType::Both);
}

TEST_CASE("config paths", "[config]") {
    REQUIRE(project_config_path("/work/tree") == "/work/tree/.fnr.toml");
    auto global = global_config_path();
    if (!global.empty()) {
        REQUIRE(global.size() > std::string("/.fnr/config.toml").size());
        REQUIRE(global.substr(global.size() - 17) == "/.fnr/config.toml");
    }
}
