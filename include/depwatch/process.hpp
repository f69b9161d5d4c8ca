#pragma once

#include <depwatch/result.hpp>
#include <string>
#include <vector>

namespace depwatch {

// Captured output of an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command synchronously, capturing stdout and stderr.
// timeout_seconds <= 0 waits for the child however long it takes.
// Returns an IO error on pipe/fork/exec failure or on timeout; a non-zero
// exit status is not an error here, callers inspect exit_code.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 0);

} // namespace depwatch
