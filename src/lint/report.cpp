#include <ruleguard/report.hpp>

namespace ruleguard {

std::string format_violation(const std::string& filename, const Violation& v) {
    std::string out = filename;
    out += ":";
    out += std::to_string(v.line);
    out += ":";
    out += std::to_string(v.column + 1);
    out += ": ";
    out += severity_name(v.severity);
    out += ": ";
    out += v.message;
    out += " [";
    out += v.rule_id;
    out += "]";
    return out;
}

static std::string plural(size_t n, const char* word) {
    std::string out = std::to_string(n) + " " + word;
    if (n != 1) out += "s";
    return out;
}

std::string format_summary(size_t errors, size_t warnings) {
    size_t total = errors + warnings;
    if (total == 0) return "no problems";
    return plural(total, "problem") + " (" + plural(errors, "error") + ", " +
           plural(warnings, "warning") + ")";
}

} // namespace ruleguard
