#include <scribe/error.hpp>

namespace scribe {

const char* ScribeError::code_name(Code c) {
    switch (c) {
        case InvalidArg: return "InvalidArg";
        case Parse:      return "Parse";
        case Config:     return "Config";
        case IO:         return "IO";
    }
    return "Unknown";
}

std::string ScribeError::format() const {
    std::string out = "error[";
    out += code_name(code);
    out += "]: ";
    out += message;

    if (!hint.empty()) {
        out += "\n  hint: ";
        out += hint;
    }

    if (!file.empty()) {
        out += "\n  --> ";
        out += file;
        if (line > 0) {
            out += ":";
            out += std::to_string(line);
        }
    }

    return out;
}

} // namespace scribe
