#pragma once

/**
 * @file subprocess.hpp
 * @brief Run a child process and capture its standard output (POSIX)
 */

#include "engwall/common.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace engwall::oracle {

struct CommandOutput
{
    int exit_code = -1;
    std::string stdout_text;
};

/**
 * Run `argv` (argv[0] looked up on PATH) with stdin and stderr redirected to
 * /dev/null, collecting stdout until the child exits.
 *
 * The child is killed once `timeout` elapses.
 * @return Output and exit status, or "SpawnFailed" / "Timeout" / "WaitFailed"
 */
[[nodiscard]] engwall::Result<CommandOutput> run_command(const std::vector<std::string>& argv,
                                                         std::chrono::milliseconds timeout);

}  // namespace engwall::oracle
