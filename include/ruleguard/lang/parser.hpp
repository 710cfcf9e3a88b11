#pragma once

#include <ruleguard/lang/ast.hpp>
#include <ruleguard/lang/lexer.hpp>
#include <ruleguard/result.hpp>
#include <string>

namespace ruleguard {

// Parse a lexed unit into a Program node. Covers the JavaScript subset rule
// modules are written in (no classes, generators or async).
// Stops at the first syntax error.
Result<NodePtr> parse(const LexResult& lex_result,
                      const std::string& filename = "<input>");

} // namespace ruleguard
