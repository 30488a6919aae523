#include <ferry/error.hpp>

namespace ferry {

const char* FerryError::code_name(Code c) {
    switch (c) {
        case IO:                  return "IO";
        case Parse:               return "Parse";
        case Config:              return "Config";
        case InvalidArg:          return "InvalidArg";
        case NotFound:            return "NotFound";
        case UnresolvedSpecifier: return "UnresolvedSpecifier";
        case UnmappedSpecifier:   return "UnmappedSpecifier";
        case VersionNotFound:     return "VersionNotFound";
        case NotCached:           return "NotCached";
        case IntegrityMismatch:   return "IntegrityMismatch";
        case UntrackedDependency: return "UntrackedDependency";
        case FetchTimeout:        return "FetchTimeout";
        case Network:             return "Network";
        case Cancelled:           return "Cancelled";
    }
    return "Unknown";
}

std::string FerryError::format() const {
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

} // namespace ferry
