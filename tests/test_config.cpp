#include <catch2/catch.hpp>
#include <ruleguard/config.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace ruleguard;
namespace fs = std::filesystem;

static std::string fixture_dir() {
    const char* src = std::getenv("RULEGUARD_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures";
    return "../tests/fixtures";
}

// RAII temp directory
struct TempDir {
    fs::path path;

    TempDir() {
        path = fs::temp_directory_path() / ("ruleguard_test_" + std::to_string(
            std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    void write_file(const std::string& rel, const std::string& content) {
        fs::path full = path / rel;
        fs::create_directories(full.parent_path());
        std::ofstream f(full);
        f << content;
    }
};

static Config parse_ok(const std::string& toml) {
    auto r = Config::parse(toml);
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

// ===== Rule entry forms =====

TEST_CASE("severity-only entries", "[config]") {
    auto cfg = parse_ok(R"(
[rules]
max-lines = "warn"
internal-no-invalid-meta = "error"
)");
    REQUIRE(cfg.rules.size() == 2);
    CHECK(cfg.rules.at("max-lines").severity == Severity::Warn);
    CHECK(cfg.rules.at("max-lines").options.empty());
    CHECK(cfg.rules.at("internal-no-invalid-meta").severity == Severity::Error);
}

TEST_CASE("severity names", "[config]") {
    CHECK(parse_ok("[rules]\nmax-lines = \"off\"").rules.at("max-lines").severity == Severity::Off);
    CHECK(parse_ok("[rules]\nmax-lines = \"warning\"").rules.at("max-lines").severity == Severity::Warn);
}

TEST_CASE("bare integer entry is an error with that option", "[config]") {
    auto cfg = parse_ok("[rules]\nmax-lines = 200\n");
    const auto& s = cfg.rules.at("max-lines");
    CHECK(s.severity == Severity::Error);
    REQUIRE(s.options.bare.has_value());
    CHECK(*s.options.bare == 200);
}

TEST_CASE("array entries", "[config]") {
    auto cfg = parse_ok(R"(
[rules]
max-lines = ["warn", { max = 100, skipComments = true }]
internal-no-invalid-meta = ["error"]
)");
    const auto& ml = cfg.rules.at("max-lines");
    CHECK(ml.severity == Severity::Warn);
    CHECK(std::get<int64_t>(ml.options.fields.at("max")) == 100);
    CHECK(std::get<bool>(ml.options.fields.at("skipComments")));
    CHECK(cfg.rules.at("internal-no-invalid-meta").options.empty());

    auto bare = parse_ok("[rules]\nmax-lines = [\"error\", 50]\n");
    CHECK(*bare.rules.at("max-lines").options.bare == 50);
}

TEST_CASE("table entry", "[config]") {
    auto cfg = parse_ok(R"(
[rules.max-lines]
severity = "warn"
max = 20
skipBlankLines = true
)");
    const auto& ml = cfg.rules.at("max-lines");
    CHECK(ml.severity == Severity::Warn);
    CHECK(ml.options.fields.size() == 2);
    CHECK(std::get<int64_t>(ml.options.fields.at("max")) == 20);
    CHECK(std::get<bool>(ml.options.fields.at("skipBlankLines")));
}

TEST_CASE("table entry without severity defaults to error", "[config]") {
    auto cfg = parse_ok("[rules.max-lines]\nmax = 10\n");
    CHECK(cfg.rules.at("max-lines").severity == Severity::Error);
}

TEST_CASE("parse empty config", "[config]") {
    CHECK(parse_ok("").rules.empty());
    CHECK(parse_ok("[rules]\n").rules.empty());
}

// ===== Errors =====

TEST_CASE("unknown severity is a Config error", "[config]") {
    auto r = Config::parse("[rules]\nmax-lines = \"fatal\"\n", "proj.toml");
    REQUIRE(r.is_err());
    CHECK(r.error().code == RuleguardError::Config);
    CHECK(r.error().message == "rule 'max-lines': unknown severity 'fatal'");
    CHECK(r.error().hint == "use one of: off, warn, error");
    CHECK(r.error().file == "proj.toml");
}

TEST_CASE("malformed rule entries are Config errors", "[config]") {
    CHECK(Config::parse("[rules]\nmax-lines = []\n").error().code == RuleguardError::Config);
    CHECK(Config::parse("[rules]\nmax-lines = [\"warn\", 1, 2]\n").error().code == RuleguardError::Config);
    CHECK(Config::parse("[rules]\nmax-lines = [1]\n").error().code == RuleguardError::Config);
    CHECK(Config::parse("[rules]\nmax-lines = 1.5\n").error().code == RuleguardError::Config);
    CHECK(Config::parse("[rules]\nmax-lines = [\"warn\", \"x\"]\n").error().code == RuleguardError::Config);
    CHECK(Config::parse("[rules.max-lines]\nmax = [1]\n").error().code == RuleguardError::Config);
    CHECK(Config::parse("rules = 3\n").error().code == RuleguardError::Config);
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    CHECK(r.error().code == RuleguardError::Parse);
    CHECK(r.error().line == 1);
}

TEST_CASE("load missing config file", "[config]") {
    auto r = Config::load("/nonexistent/ruleguard/config.toml");
    REQUIRE(r.is_err());
    CHECK(r.error().code == RuleguardError::IO);
}

TEST_CASE("load config from fixture file", "[config]") {
    auto r = Config::load(fixture_dir() + "/ruleguard.toml");
    REQUIRE(r.is_ok());
    const auto& cfg = r.value();
    CHECK(cfg.rules.at("internal-no-invalid-meta").severity == Severity::Error);
    CHECK(cfg.rules.at("max-lines").severity == Severity::Warn);
    CHECK(cfg.rules.at("max-lines").options.fields.size() == 3);
}

// ===== Layering =====

TEST_CASE("merge replaces a rule's setting wholesale", "[config]") {
    auto base = parse_ok(R"(
[rules]
max-lines = ["warn", { max = 100, skipComments = true }]
internal-no-invalid-meta = "error"
)");
    auto overlay = parse_ok("[rules]\nmax-lines = 50\n");

    base.merge(overlay);
    const auto& ml = base.rules.at("max-lines");
    CHECK(ml.severity == Severity::Error);
    CHECK(*ml.options.bare == 50);
    CHECK(ml.options.fields.empty());
    CHECK(base.rules.at("internal-no-invalid-meta").severity == Severity::Error);
}

TEST_CASE("effective config layers project over global", "[config]") {
    auto global = parse_ok("[rules]\nmax-lines = \"warn\"\ninternal-no-invalid-meta = \"warn\"\n");
    auto project = parse_ok("[rules]\ninternal-no-invalid-meta = \"off\"\n");

    auto both = Config::effective(global, project);
    CHECK(both.rules.at("max-lines").severity == Severity::Warn);
    CHECK(both.rules.at("internal-no-invalid-meta").severity == Severity::Off);

    auto global_only = Config::effective(global, std::nullopt);
    CHECK(global_only.rules.at("internal-no-invalid-meta").severity == Severity::Warn);

    CHECK(Config::effective(std::nullopt, std::nullopt).rules.empty());
}

// ===== Discovery =====

TEST_CASE("find_project_config walks up to the nearest file", "[config]") {
    TempDir td;
    td.write_file(kProjectConfigName, "[rules]\n");
    td.write_file("lib/rules/keep.txt", "");

    auto found = find_project_config((td.path / "lib" / "rules").string());
    REQUIRE(found.has_value());
    CHECK(fs::equivalent(*found, td.path / kProjectConfigName));

    td.write_file(std::string("lib/") + kProjectConfigName, "[rules]\n");
    auto nearer = find_project_config((td.path / "lib" / "rules").string());
    REQUIRE(nearer.has_value());
    CHECK(fs::equivalent(*nearer, td.path / "lib" / kProjectConfigName));
}

TEST_CASE("global config path is under the home directory", "[config]") {
    if (std::getenv("HOME")) {
        auto path = global_config_path();
        CHECK(path.find("/.ruleguard/config.toml") != std::string::npos);
    }
}
