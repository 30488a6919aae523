#pragma once

#include <ferry/result.hpp>

#include <string>
#include <vector>

namespace ferry {

struct CommandResult {
    int exit_code = 0;
    std::string stdout_str;   // empty unless captured
    std::string stderr_str;
};

struct CommandOptions {
    std::string working_dir;
    int timeout_seconds = 0;   // 0: no limit
    bool capture = true;       // false: child inherits stdin/stdout/stderr
};

// Run an external command. Errors on fork/exec failure (NotFound when the
// program cannot be executed) or timeout; a non-zero exit is a result.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const CommandOptions& options = {});

} // namespace ferry
