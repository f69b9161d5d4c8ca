#include <catch2/catch.hpp>
#include <depwatch/log.hpp>
#include <cstdio>
#include <functional>
#include <string>

using namespace depwatch::log;

// Helper: run `fn` with log output redirected to a temporary file
static std::string capture_log(const std::function<void()>& fn) {
    std::FILE* tmp = std::tmpfile();
    REQUIRE(tmp != nullptr);
    set_sink(tmp);
    fn();
    set_sink(nullptr);

    std::string output;
    std::rewind(tmp);
    char buf[512];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), tmp)) > 0) {
        output.append(buf, n);
    }
    std::fclose(tmp);
    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    set_level(Trace);
    REQUIRE(get_level() == Trace);
    set_level(Error);
    REQUIRE(get_level() == Error);
    set_level(Info);
    REQUIRE(get_level() == Info);
}

TEST_CASE("level_name() returns correct strings", "[log]") {
    REQUIRE(std::string(level_name(Trace)) == "trace");
    REQUIRE(std::string(level_name(Debug)) == "debug");
    REQUIRE(std::string(level_name(Info)) == "info");
    REQUIRE(std::string(level_name(Warn)) == "warn");
    REQUIRE(std::string(level_name(Error)) == "error");
}

TEST_CASE("parse_level accepts known names only", "[log]") {
    Level lvl = Info;
    REQUIRE(parse_level("debug", lvl));
    REQUIRE(lvl == Debug);
    REQUIRE(parse_level("warning", lvl));
    REQUIRE(lvl == Warn);

    REQUIRE_FALSE(parse_level("loud", lvl));
    REQUIRE(lvl == Warn);
}

TEST_CASE("set_color_enabled / is_color_enabled", "[log]") {
    set_color_enabled(true);
    REQUIRE(is_color_enabled());
    set_color_enabled(false);
    REQUIRE_FALSE(is_color_enabled());
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_log([] { info("should not appear"); });
    REQUIRE(output.empty());

    set_level(Info);
}

TEST_CASE("Messages at or above threshold are emitted", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_log([] {
        warn("this is a warning");
        error("this is an error");
    });
    REQUIRE(output.find("depwatch warn: this is a warning\n") != std::string::npos);
    REQUIRE(output.find("depwatch error: this is an error\n") != std::string::npos);

    set_level(Info);
}

TEST_CASE("Format string substitution", "[log]") {
    set_level(Info);
    set_color_enabled(false);

    auto output = capture_log([] { info("indexed %d units under %s", 4, "/src"); });
    REQUIRE(output == "depwatch info: indexed 4 units under /src\n");
}
