#include "../../include/chunk_worker.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"

#include <chrono>
#include <format>
#include <system_error>

namespace fs = std::filesystem;

namespace chunkzli {

ChunkWorker::ChunkWorker(const RunConfig& config, ICompressor& compressor, Logger& logger, EventBus& bus)
    : config_(config),
      policy_(compressor, config.profiles, config.compressed_extension, logger),
      logger_(logger),
      bus_(bus) {}

ChunkOutcome ChunkWorker::process(const ChunkDescriptor& chunk) const {
    ChunkOutcome outcome;
    outcome.index = chunk.index;

    const fs::path temp = config_.temp_path_for(chunk.index);
    const auto start = std::chrono::steady_clock::now();
    bus_.publish(ChunkStartEvent{chunk.index, chunk.offset, chunk.length});

    try {
        copy_file_range_to(config_.source, chunk.offset, chunk.length, temp);
        logger_.log(LogLevel::Debug,
                    std::format("Wrote {} ({} bytes at offset {})", temp.string(), chunk.length, chunk.offset),
                    "worker");

        const auto result = policy_.compress(chunk.index, temp);
        outcome.success = true;
        outcome.profile = std::string(result.profile.id);
        outcome.artifact = result.artifact;
        outcome.attempts = result.attempts;
    } catch (const ChunkCompressionExhausted& e) {
        outcome.error = e.what();
        outcome.attempts = static_cast<unsigned>(e.attempt_errors().size());
    } catch (const std::exception& e) {
        outcome.error = e.what();
        logger_.log(LogLevel::Error, std::format("Chunk {} failed: {}", chunk.index, e.what()), "worker");
    } catch (...) {
        outcome.error = "unknown exception";
        logger_.log(LogLevel::Error, std::format("Chunk {} failed with an unknown exception", chunk.index), "worker");
    }

    std::error_code ec;
    fs::remove(temp, ec);
    if (ec) {
        outcome.cleanup_error = std::format("cannot remove {}: {}", temp.string(), ec.message());
        logger_.log(LogLevel::Warning, *outcome.cleanup_error, "worker");
    }

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    if (outcome.success) {
        logger_.log(LogLevel::Info,
                    std::format("Chunk {} -> {} ({} ms)", chunk.index, outcome.artifact.string(), duration.count()),
                    "worker");
        bus_.publish(ChunkCompleteEvent{chunk.index, *outcome.profile, outcome.artifact, outcome.attempts, duration});
    } else {
        bus_.publish(ChunkErrorEvent{chunk.index, outcome.error});
    }
    return outcome;
}

} // namespace chunkzli
