#include <flatlock/error.hpp>

namespace flatlock {

const char* FlatlockError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Detection:  return "Detection";
        case Parse:      return "Parse";
        case Traversal:  return "Traversal";
        case Manifest:   return "Manifest";
        case Config:     return "Config";
        case InvalidArg: return "InvalidArg";
        case NotFound:   return "NotFound";
    }
    return "Unknown";
}

const char* FlatlockError::stage_name(Code c) {
    switch (c) {
        case IO:
        case NotFound:   return "read";
        case Detection:  return "detect";
        case Parse:      return "parse";
        case Traversal:  return "resolve";
        case Manifest:   return "manifest";
        case Config:     return "config";
        case InvalidArg: return "input";
    }
    return "unknown";
}

std::string FlatlockError::format() const {
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
        }
    }

    return result;
}

} // namespace flatlock
