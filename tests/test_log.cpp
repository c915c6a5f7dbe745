#include <catch2/catch.hpp>
#include <fnr/log.hpp>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string>

#include <unistd.h>

using namespace fnr::log;

// Helper: capture stderr output from a callable
static std::string capture_stderr(std::function<void()> fn) {
    std::fflush(stderr);
    int saved_stderr = dup(fileno(stderr));

    int pipefd[2];
    REQUIRE(pipe(pipefd) == 0);
    dup2(pipefd[1], fileno(stderr));
    close(pipefd[1]);

    fn();

    std::fflush(stderr);
    dup2(saved_stderr, fileno(stderr));
    close(saved_stderr);

    std::string output;
    char buf[1024];
    ssize_t n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0) {
        output.append(buf, n);
    }
    close(pipefd[0]);
    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    Level saved = get_level();
    for (Level lvl : {Trace, Debug, Info, Warn, Error, Off}) {
        set_level(lvl);
        REQUIRE(get_level() == lvl);
    }
    set_level(saved);
}

TEST_CASE("parse_level accepts names in any case", "[log]") {
    REQUIRE(parse_level("trace").value() == Trace);
    REQUIRE(parse_level("DEBUG").value() == Debug);
    REQUIRE(parse_level("Info").value() == Info);
    REQUIRE(parse_level("warning").value() == Warn);
    REQUIRE(parse_level("warn").value() == Warn);
    REQUIRE(parse_level("error").value() == Error);
    REQUIRE(parse_level("off").value() == Off);
}

TEST_CASE("parse_level rejects unknown names", "[log]") {
    auto r = parse_level("chatty");
    REQUIRE(r.failed_with(fnr::FnrError::InvalidArg));
    REQUIRE(r.error().hint.find("debug") != std::string::npos);
}

TEST_CASE("level_name() returns correct strings", "[log]") {
    REQUIRE(std::string(level_name(Trace)) == "trace");
    REQUIRE(std::string(level_name(Warn)) == "warn");
    REQUIRE(std::string(level_name(Off)) == "off");
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);
    auto output = capture_stderr([] { info("should not appear"); });
    REQUIRE(output.empty());
}

TEST_CASE("Messages at threshold are emitted with format args", "[log]") {
    set_level(Warn);
    set_color_enabled(false);
    auto output = capture_stderr([] { warn("skipped %d entries under %s", 3, "docs"); });
    REQUIRE(output == "warn: skipped 3 entries under docs\n");
}

TEST_CASE("Off silences errors too", "[log]") {
    set_level(Off);
    set_color_enabled(false);
    auto output = capture_stderr([] { error("nothing to see"); });
    REQUIRE(output.empty());
    set_level(Warn);
}

TEST_CASE("Colored prefix when color is enabled", "[log]") {
    set_level(Warn);
    set_color_enabled(true);
    auto output = capture_stderr([] { error("boom"); });
    REQUIRE(output.find("\033[31merror\033[0m: boom") != std::string::npos);
    set_color_enabled(false);
}

TEST_CASE("init_from_env reads FNR_LOG", "[log]") {
    set_level(Warn);
    setenv("FNR_LOG", "debug", 1);
    init_from_env();
    REQUIRE(get_level() == Debug);

    setenv("FNR_LOG", "bogus", 1);
    set_color_enabled(false);
    auto output = capture_stderr([] { init_from_env(); });
    REQUIRE(get_level() == Debug);
    REQUIRE(output.find("ignoring FNR_LOG") != std::string::npos);

    unsetenv("FNR_LOG");
    set_level(Warn);
}
