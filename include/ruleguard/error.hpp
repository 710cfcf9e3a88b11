#pragma once

#include <string>

namespace ruleguard {

struct RuleguardError {
    enum Code {
        IO,
        Lex,
        Parse,
        Config,
        UnknownRule,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;
    int col = 0;

    RuleguardError() = default;
    RuleguardError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    RuleguardError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    RuleguardError(Code c, std::string msg, std::string h, std::string f, int l, int cl = 0)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l), col(cl) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace ruleguard
