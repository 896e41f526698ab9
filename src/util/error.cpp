#include <moo/error.hpp>

namespace moo {

const char* MooError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Config:     return "Config";
        case Manifest:   return "Manifest";
        case NotFound:   return "NotFound";
        case InvalidArg: return "InvalidArg";
        case Command:    return "Command";
        case Process:    return "Process";
    }
    return "Unknown";
}

std::string MooError::format() const {
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

MooError io_error(const std::string& action, const std::string& path,
                  const std::error_code& ec) {
    std::string msg = "cannot " + action + " " + path;
    if (ec) {
        msg += ": ";
        msg += ec.message();
    }
    return MooError{MooError::IO, std::move(msg)};
}

} // namespace moo
