#include <catch2/catch.hpp>
#include <ruleguard/report.hpp>

using namespace ruleguard;

TEST_CASE("format_violation uses a 1-based column", "[report]") {
    Violation v;
    v.rule_id = "max-lines";
    v.severity = Severity::Warn;
    v.line = 1;
    v.column = 0;
    v.message = "File must be at most 2 lines long";
    CHECK(format_violation("lib/a.js", v) ==
          "lib/a.js:1:1: warning: File must be at most 2 lines long [max-lines]");

    v.rule_id = "internal-no-invalid-meta";
    v.severity = Severity::Error;
    v.line = 7;
    v.column = 17;
    v.message = "Rule is missing a meta property.";
    CHECK(format_violation("b.js", v) ==
          "b.js:7:18: error: Rule is missing a meta property. [internal-no-invalid-meta]");
}

TEST_CASE("format_summary", "[report]") {
    CHECK(format_summary(0, 0) == "no problems");
    CHECK(format_summary(1, 0) == "1 problem (1 error, 0 warnings)");
    CHECK(format_summary(1, 2) == "3 problems (1 error, 2 warnings)");
    CHECK(format_summary(0, 1) == "1 problem (0 errors, 1 warning)");
}

TEST_CASE("severity_name and parse_severity", "[report]") {
    CHECK(std::string(severity_name(Severity::Off)) == "off");
    CHECK(std::string(severity_name(Severity::Warn)) == "warning");
    CHECK(std::string(severity_name(Severity::Error)) == "error");
    CHECK(parse_severity("warn") == Severity::Warn);
    CHECK_FALSE(parse_severity("fatal").has_value());
}

TEST_CASE("builtin rule registry", "[report]") {
    REQUIRE(builtin_rules().size() == 2);
    CHECK(find_rule("max-lines") != nullptr);
    CHECK(find_rule("internal-no-invalid-meta")->meta.category == "Internal");
    CHECK(find_rule("no-such-rule") == nullptr);
}
