#include <confbind/error.hpp>

namespace confbind {

const char* BindError::code_name(Code c) {
    switch (c) {
        case IO:               return "IO";
        case Parse:            return "Parse";
        case InvalidArg:       return "InvalidArg";
        case Coercion:         return "Coercion";
        case SourceRead:       return "SourceRead";
        case NotFound:         return "NotFound";
        case MandatoryMissing: return "MandatoryMissing";
        case Help:             return "Help";
    }
    return "Unknown";
}

std::string BindError::format() const {
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

} // namespace confbind
