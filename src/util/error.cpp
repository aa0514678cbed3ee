#include <ulidkit/error.hpp>

namespace ulidkit {

const char* UlidError::code_name(Code c) {
    switch (c) {
        case TimeRange:        return "TimeRange";
        case InvalidLength:    return "InvalidLength";
        case InvalidCharacter: return "InvalidCharacter";
        case Range:            return "Range";
        case IO:               return "IO";
        case Parse:            return "Parse";
        case Config:           return "Config";
        case InvalidArg:       return "InvalidArg";
    }
    return "Unknown";
}

std::string UlidError::format() const {
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

} // namespace ulidkit
