#pragma once

#include <kiln/result.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kiln {

// Ordered so that rendering and hashing are deterministic
using EnvMap = std::map<std::string, std::string>;

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command, capturing stdout and stderr.
// When `env` is set the child sees exactly those variables and nothing
// inherited from the caller. Returns a Timeout error (after killing the
// child's process group) when the command runs longer than
// timeout_seconds, and IO on fork/exec failure.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60,
                                  const std::optional<EnvMap>& env = std::nullopt);

// Render argv for log lines and error messages
std::string format_command(const std::vector<std::string>& args);

// Last `max_lines` non-empty lines of a command's output
std::string output_tail(const std::string& output, size_t max_lines = 10);

} // namespace kiln
