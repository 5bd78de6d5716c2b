#pragma once

#include <string>

namespace kiln {

struct KilnError {
    enum Code {
        IO,
        Parse,
        Version,
        Config,
        NotFound,
        InvalidArg,
        Staging,
        DependencyInstall,
        LockMismatch,
        Compile,
        Assembly,
        Timeout
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;
    std::string stage;   // pipeline stage that reported the error
    std::string cause;   // underlying child error or command output

    KilnError() = default;
    KilnError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    KilnError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    KilnError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Attach the failing stage; an already-set stage is kept so the
    // innermost stage wins.
    KilnError& at_stage(const std::string& s);
    KilnError& with_cause(std::string c);

    std::string format() const;
    static const char* code_name(Code c);
};

// Process exit status for the CLI: 0 ok, 1 build failure,
// 2 invalid service/environment name, 3 timeout.
int exit_code_for(const KilnError& err);

} // namespace kiln
