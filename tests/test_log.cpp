#include <catch2/catch.hpp>
#include <ruleguard/log.hpp>
#include <cstdio>
#include <functional>
#include <string>

using namespace ruleguard::log;

// Run `fn` with log output redirected to a temporary file, return what it wrote
static std::string capture_log(const std::function<void()>& fn) {
    std::FILE* tmp = std::tmpfile();
    REQUIRE(tmp != nullptr);
    set_stream(tmp);
    fn();
    set_stream(nullptr);

    std::fflush(tmp);
    std::rewind(tmp);
    std::string output;
    char buf[512];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), tmp)) > 0) {
        output.append(buf, n);
    }
    std::fclose(tmp);
    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error, Silent}) {
        set_level(lvl);
        REQUIRE(get_level() == lvl);
    }
    set_level(Info);
}

TEST_CASE("level_name and parse_level agree", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error, Silent}) {
        REQUIRE(parse_level(level_name(lvl)) == lvl);
    }
    REQUIRE(parse_level("nonsense") == Info);
}

TEST_CASE("enabled() follows the threshold", "[log]") {
    set_level(Warn);
    REQUIRE_FALSE(enabled(Debug));
    REQUIRE(enabled(Warn));
    REQUIRE(enabled(Error));
    REQUIRE_FALSE(enabled(Silent));
    set_level(Info);
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);
    auto output = capture_log([] { info("should not appear"); });
    REQUIRE(output.empty());
    set_level(Info);
}

TEST_CASE("Silent level suppresses errors", "[log]") {
    set_level(Silent);
    set_color_enabled(false);
    auto output = capture_log([] { error("hidden"); });
    REQUIRE(output.empty());
    set_level(Info);
}

TEST_CASE("Messages at or above threshold are emitted with a level prefix", "[log]") {
    set_level(Warn);
    set_color_enabled(false);
    auto output = capture_log([] {
        warn("first %s", "warning");
        error("code %d", 7);
    });
    REQUIRE(output == "warn: first warning\nerror: code 7\n");
    set_level(Info);
}

TEST_CASE("Colored output wraps the level name", "[log]") {
    set_level(Info);
    set_color_enabled(true);
    auto output = capture_log([] { info("hello"); });
    REQUIRE(output.find("\033[32minfo\033[0m: hello") != std::string::npos);
    set_color_enabled(false);
}
