#include <fnr/error.hpp>

namespace fnr {

const char* FnrError::code_name(Code c) {
    switch (c) {
        case IO:             return "IO";
        case Parse:          return "Parse";
        case Config:         return "Config";
        case InvalidArg:     return "InvalidArg";
        case InvalidPattern: return "InvalidPattern";
        case WalkWarning:    return "WalkWarning";
        case InvalidName:    return "InvalidName";
        case Collision:      return "Collision";
        case RenameFailed:   return "RenameFailed";
    }
    return "Unknown";
}

FnrError FnrError::rename_failed(const std::string& source,
                                 const std::string& dest,
                                 const std::string& cause) {
    FnrError e(RenameFailed,
        "failed to rename " + source + " to " + dest + ": " + cause);
    e.path = source;
    e.destination = dest;
    return e;
}

std::string FnrError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!path.empty()) {
        result += "\n  --> ";
        result += path;
        if (!destination.empty()) {
            result += " -> ";
            result += destination;
        }
    }

    return result;
}

} // namespace fnr
