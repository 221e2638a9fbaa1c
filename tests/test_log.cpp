#include <catch2/catch.hpp>
#include <upid/log.hpp>
#include <functional>
#include <cstdio>
#include <cstring>
#include <string>

#ifdef _WIN32
#include <io.h>
#define dup _dup
#define dup2 _dup2
#define fileno _fileno
#define read _read
#define write _write
#define close _close
#define pipe _pipe
#else
#include <unistd.h>
#endif

using namespace upid::log;

// Helper: capture stderr output from a callable
static std::string capture_stderr(std::function<void()> fn) {
    // Flush before redirect
    std::fflush(stderr);

    // Save original stderr
    int saved_stderr = dup(fileno(stderr));

    // Create a pipe
    int pipefd[2];
    pipe(pipefd);

    // Redirect stderr to the write end of the pipe
    dup2(pipefd[1], fileno(stderr));
    close(pipefd[1]);

    // Run the function
    fn();

    // Flush and restore stderr
    std::fflush(stderr);
    dup2(saved_stderr, fileno(stderr));
    close(saved_stderr);

    // Read from the pipe
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
    set_level(Trace);
    REQUIRE(get_level() == Trace);

    set_level(Debug);
    REQUIRE(get_level() == Debug);

    set_level(Info);
    REQUIRE(get_level() == Info);

    set_level(Warn);
    REQUIRE(get_level() == Warn);

    set_level(Error);
    REQUIRE(get_level() == Error);
}

TEST_CASE("level_name() returns correct strings", "[log]") {
    REQUIRE(std::string(level_name(Trace)) == "trace");
    REQUIRE(std::string(level_name(Debug)) == "debug");
    REQUIRE(std::string(level_name(Info)) == "info");
    REQUIRE(std::string(level_name(Warn)) == "warn");
    REQUIRE(std::string(level_name(Error)) == "error");
}

TEST_CASE("set_color_enabled / is_color_enabled", "[log]") {
    set_color_enabled(true);
    REQUIRE(is_color_enabled() == true);

    set_color_enabled(false);
    REQUIRE(is_color_enabled() == false);
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        debug("prefix 'ab' normalized to 'abzz'");
        info("generated 3 identifiers");
    });
    REQUIRE(output.empty());

    // Reset for other tests
    set_level(Info);
}

TEST_CASE("Messages at threshold are emitted", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        warn("/dev/urandom unavailable");
    });
    REQUIRE(output.find("upid warn:") != std::string::npos);
    REQUIRE(output.find("/dev/urandom unavailable") != std::string::npos);

    set_level(Info);
}

TEST_CASE("Messages above threshold are emitted", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        error("cannot open config file: %s", "/nonexistent.toml");
    });
    REQUIRE(output.find("upid error:") != std::string::npos);
    REQUIRE(output.find("cannot open config file: /nonexistent.toml") != std::string::npos);

    set_level(Info);
}

TEST_CASE("Each level function emits its own tag", "[log]") {
    set_level(Trace);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        trace("t=%d", 1);
        debug("d=%d", 2);
        info("i=%d", 3);
        warn("w=%d", 4);
        error("e=%d", 5);
    });
    REQUIRE(output.find("upid trace: t=1") != std::string::npos);
    REQUIRE(output.find("upid debug: d=2") != std::string::npos);
    REQUIRE(output.find("upid info: i=3") != std::string::npos);
    REQUIRE(output.find("upid warn: w=4") != std::string::npos);
    REQUIRE(output.find("upid error: e=5") != std::string::npos);

    set_level(Info);
}

TEST_CASE("Format string substitution", "[log]") {
    set_level(Info);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        info("prefix: %s, bits: %d", "user", 64);
    });
    REQUIRE(output.find("upid info:") != std::string::npos);
    REQUIRE(output.find("prefix: user") != std::string::npos);
    REQUIRE(output.find("bits: 64") != std::string::npos);
}

TEST_CASE("parse_level() accepts every level name", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        auto r = parse_level(level_name(lvl));
        REQUIRE(r.is_ok());
        REQUIRE(r.value() == lvl);
    }
    REQUIRE(parse_level("warning").value() == Warn);
}

TEST_CASE("parse_level() rejects unknown names", "[log]") {
    auto r = parse_level("verbose");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == upid::UpidError::Config);
}

TEST_CASE("Colored output wraps the level tag", "[log]") {
    set_level(Info);
    set_color_enabled(true);

    auto output = capture_stderr([] {
        error("boom");
    });
    REQUIRE(output.find("\033[31m") != std::string::npos);
    REQUIRE(output.find("boom") != std::string::npos);

    set_color_enabled(false);
}
