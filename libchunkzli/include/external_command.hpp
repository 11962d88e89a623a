/**
 * @file external_command.hpp
 * @brief Synchronous execution of an external program.
 */

#ifndef CHUNKZLI_EXTERNAL_COMMAND_HPP
#define CHUNKZLI_EXTERNAL_COMMAND_HPP

#include <string>
#include <vector>

namespace chunkzli {

/// Exit status reported when the program could not be executed.
inline constexpr int kExecFailedStatus = 127;

struct CommandResult {
    int exit_status = 0; ///< Exit code, or 128 + signal number if the child was killed
    std::string output;  ///< Tail of the merged stdout/stderr, never interpreted
};

/**
 * @brief Runs a program and blocks until it exits.
 *
 * argv[0] is resolved through PATH when it contains no slash. Standard
 * output and standard error are merged and captured.
 *
 * @param argv Program and arguments, must not be empty.
 * @return Exit status and captured output.
 * @throws CommandError if the process cannot be created or waited for.
 */
CommandResult run_command(const std::vector<std::string>& argv);

} // namespace chunkzli

#endif // CHUNKZLI_EXTERNAL_COMMAND_HPP
