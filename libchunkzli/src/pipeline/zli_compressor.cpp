#include "../../include/zli_compressor.hpp"
#include "../../include/errors.hpp"
#include "../../include/external_command.hpp"
#include "../../include/logger.hpp"

#include <format>
#include <vector>

namespace chunkzli {

ZliCompressor::ZliCompressor(std::string tool, Logger& logger)
    : tool_(std::move(tool)), logger_(logger) {}

void ZliCompressor::compress(const std::filesystem::path& input,
                             const CodecProfile& profile,
                             const std::filesystem::path& output) {
    const std::vector<std::string> argv{
        tool_,
        "compress",
        "--profile",
        std::string(profile.id),
        input.string(),
        "--output",
        output.string(),
    };

    logger_.log(LogLevel::Debug,
                std::format("{} compress --profile {} {} --output {}", tool_, profile.id, input.string(), output.string()),
                "compressor");

    const auto result = run_command(argv);
    if (result.exit_status != 0) {
        if (result.exit_status == kExecFailedStatus) {
            logger_.log(LogLevel::Debug, std::format("{} exited with {}, is it on PATH?", tool_, kExecFailedStatus),
                        "compressor");
        }
        throw CompressionAttemptFailed(std::string(profile.id), result.exit_status, result.output);
    }
}

} // namespace chunkzli
