#include <kiln/error.hpp>

namespace kiln {

const char* KilnError::code_name(Code c) {
    switch (c) {
        case IO:                return "IO";
        case Parse:             return "Parse";
        case Version:           return "Version";
        case Config:            return "Config";
        case NotFound:          return "NotFound";
        case InvalidArg:        return "InvalidArg";
        case Staging:           return "StagingError";
        case DependencyInstall: return "DependencyInstallError";
        case LockMismatch:      return "LockMismatchError";
        case Compile:           return "CompileError";
        case Assembly:          return "AssemblyError";
        case Timeout:           return "TimeoutError";
    }
    return "Unknown";
}

KilnError& KilnError::at_stage(const std::string& s) {
    if (stage.empty()) stage = s;
    return *this;
}

KilnError& KilnError::with_cause(std::string c) {
    cause = std::move(c);
    return *this;
}

std::string KilnError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!stage.empty()) {
        result += "\n  stage: ";
        result += stage;
    }

    if (!cause.empty()) {
        result += "\n  cause: ";
        result += cause;
    }

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

int exit_code_for(const KilnError& err) {
    switch (err.code) {
        case KilnError::InvalidArg: return 2;
        case KilnError::Timeout:    return 3;
        default:                    return 1;
    }
}

} // namespace kiln
