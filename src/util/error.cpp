#include <ruleguard/error.hpp>

namespace ruleguard {

const char* RuleguardError::code_name(Code c) {
    switch (c) {
        case IO:          return "IO";
        case Lex:         return "Lex";
        case Parse:       return "Parse";
        case Config:      return "Config";
        case UnknownRule: return "UnknownRule";
        case InvalidArg:  return "InvalidArg";
    }
    return "Unknown";
}

std::string RuleguardError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
            if (col > 0) {
                result += ":";
                result += std::to_string(col);
            }
        }
    }

    return result;
}

} // namespace ruleguard
