#include <kspver/error.hpp>

namespace kspver {

const char* KspVerError::code_name(Code c) {
    switch (c) {
        case BadVersion:   return "BadVersion";
        case Incomparable: return "Incomparable";
        case Parse:        return "Parse";
        case IO:           return "IO";
        case Config:       return "Config";
        case InvalidArg:   return "InvalidArg";
    }
    return "Unknown";
}

std::string KspVerError::format() const {
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

} // namespace kspver
