#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Run a program to completion with stdout and stderr captured.
// The program is exec'd directly (no shell), so arguments need no quoting.
// exit_code is 127 if the program could not be executed, -1 if it was
// killed by a signal or the pipes could not be created.
ProcessResult run_process(const std::string& program,
                          const std::vector<std::string>& args);

// Render program + args for log lines.
std::string describe_command(const std::string& program,
                             const std::vector<std::string>& args);

} // namespace platform
