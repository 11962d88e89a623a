#ifndef CHUNKZLI_CLI_PARSER_HPP
#define CHUNKZLI_CLI_PARSER_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "../../../libchunkzli/include/run_config.hpp"

// forward declaration
namespace CLI { class App; }

struct Settings {
    std::filesystem::path fname;
    std::string bin = "zli";
    unsigned processes = chunkzli::kDefaultWorkers;
    uintmax_t chunk_size = chunkzli::kDefaultChunkSize;
    std::filesystem::path output_dir = ".";
    std::vector<std::string> profiles;
    chunkzli::FailureMode failure_mode = chunkzli::FailureMode::ABORT;

    bool quiet = false;
    std::string log_level = "INFO";
    std::filesystem::path log_file;

    /**
     * @brief Builds the run configuration from the parsed options.
     * @throws chunkzli::ConfigurationError for an unknown profile name.
     */
    [[nodiscard]] chunkzli::RunConfig to_run_config() const;
};

/**
 * @brief Configures the CLI11 parser with all options and flags.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif //CHUNKZLI_CLI_PARSER_HPP
