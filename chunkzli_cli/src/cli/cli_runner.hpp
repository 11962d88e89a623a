#ifndef CHUNKZLI_CLI_RUNNER_HPP
#define CHUNKZLI_CLI_RUNNER_HPP

#include "cli_parser.hpp"

namespace chunkzli {
class Logger;
class EventBus;
}

/**
 * @brief Runs the compression described by @p settings.
 *
 * A missing input file is a no-op that succeeds without touching the
 * filesystem.
 *
 * @return Process exit code: 0 on success or when no file was given,
 * 1 if the configuration was rejected or a chunk could not be compressed.
 */
int run_with_settings(const Settings& settings, chunkzli::Logger& logger, chunkzli::EventBus& bus);

#endif // CHUNKZLI_CLI_RUNNER_HPP
