#include <lockscan/error.hpp>

namespace lockscan {

const char* ScanError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Format:     return "Format";
        case Config:     return "Config";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

std::string ScanError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty() || line > 0) {
        result += "\n  --> ";
        result += file.empty() ? "<input>" : file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace lockscan
