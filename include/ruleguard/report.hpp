#pragma once

#include <ruleguard/linter.hpp>
#include <string>

namespace ruleguard {

// "file:line:col: severity: message [rule-id]" with a 1-based column
std::string format_violation(const std::string& filename, const Violation& v);

// "N problems (E errors, W warnings)", or "no problems"
std::string format_summary(size_t errors, size_t warnings);

} // namespace ruleguard
