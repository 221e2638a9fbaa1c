#include <upid/error.hpp>

namespace upid {

const char* UpidError::code_name(Code c) {
    switch (c) {
        case InvalidInput: return "InvalidInput";
        case Parse:        return "Parse";
        case Config:       return "Config";
        case IO:           return "IO";
        case Database:     return "Database";
    }
    return "Unknown";
}

std::string UpidError::format() const {
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

} // namespace upid
