#include <catch2/catch.hpp>
#include <kiln/log.hpp>
#include <cstdio>
#include <functional>
#include <string>
#include <unistd.h>

using namespace kiln::log;

// Capture what fn() writes to stderr
static std::string capture_stderr(const std::function<void()>& fn) {
    std::fflush(stderr);
    int saved = dup(fileno(stderr));
    int pipefd[2];
    REQUIRE(pipe(pipefd) == 0);
    dup2(pipefd[1], fileno(stderr));
    close(pipefd[1]);

    fn();

    std::fflush(stderr);
    dup2(saved, fileno(stderr));
    close(saved);

    std::string output;
    char buf[1024];
    ssize_t n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0) {
        output.append(buf, static_cast<size_t>(n));
    }
    close(pipefd[0]);
    return output;
}

TEST_CASE("set_level / get_level", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        set_level(lvl);
        REQUIRE(get_level() == lvl);
    }
    set_level(Info);
}

TEST_CASE("parse_level accepts level names", "[log]") {
    REQUIRE(parse_level("trace").value() == Trace);
    REQUIRE(parse_level("debug").value() == Debug);
    REQUIRE(parse_level("info").value() == Info);
    REQUIRE(parse_level("warn").value() == Warn);
    REQUIRE(parse_level("error").value() == Error);

    auto bad = parse_level("loud");
    REQUIRE(bad.is_err());
    CHECK(bad.error().code == kiln::KilnError::Config);
    CHECK(bad.error().hint.find("trace") != std::string::npos);
}

TEST_CASE("level_name round-trips through parse_level", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        REQUIRE(parse_level(level_name(lvl)).value() == lvl);
    }
}

TEST_CASE("Messages below the level are dropped", "[log]") {
    set_level(Warn);
    set_color_enabled(false);
    auto output = capture_stderr([] { info("staged %d file(s)", 3); });
    REQUIRE(output.empty());
    set_level(Info);
}

TEST_CASE("Messages at or above the level are printed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);
    auto output = capture_stderr([] {
        warn("ignoring unknown key '%s'", "colour");
        error("[%s/%s] failed", "worker", "dev");
    });
    CHECK(output.find("warn: ignoring unknown key 'colour'\n") != std::string::npos);
    CHECK(output.find("error: [worker/dev] failed\n") != std::string::npos);
    set_level(Info);
}

TEST_CASE("Color codes wrap the level name", "[log]") {
    set_level(Info);
    set_color_enabled(true);
    auto output = capture_stderr([] { info("hello"); });
    CHECK(output.find("\033[32minfo\033[0m: hello") != std::string::npos);
    set_color_enabled(false);
}
