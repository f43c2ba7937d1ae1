#include <kiln/error.hpp>

namespace kiln {

const char* KilnError::code_name(Code c) {
    switch (c) {
        case IO:            return "IO";
        case Parse:         return "Parse";
        case Config:        return "Config";
        case KeyGeneration: return "KeyGeneration";
        case Database:      return "Database";
        case NotFound:      return "NotFound";
        case Duplicate:     return "Duplicate";
        case InvalidArg:    return "InvalidArg";
    }
    return "Unknown";
}

std::string KilnError::format() const {
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

} // namespace kiln
