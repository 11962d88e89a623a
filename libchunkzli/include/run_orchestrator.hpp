/**
 * @file run_orchestrator.hpp
 * @brief Drives one compression run from configuration to aggregated result.
 */

#ifndef CHUNKZLI_RUN_ORCHESTRATOR_HPP
#define CHUNKZLI_RUN_ORCHESTRATOR_HPP

#include "chunk_outcome.hpp"
#include "compressor.hpp"
#include "event_bus.hpp"
#include "run_config.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace chunkzli {

class Logger;

/**
 * @brief Aggregated result of a successful run.
 */
struct RunSummary {
    uintmax_t file_size = 0;
    size_t chunk_count = 0;
    unsigned workers = 0;                     ///< Effective concurrency
    std::chrono::duration<double> elapsed{0}; ///< Wall-clock time of the pool
    std::vector<ChunkOutcome> outcomes;       ///< Sorted by chunk index
};

/**
 * @brief Validates a RunConfig, plans the chunks and runs the WorkerPool.
 *
 * @details The run fails with RunFailed as soon as the pool reports a
 * failed chunk, after the pool has been joined. Successfully compressed
 * chunks of a failed run are left on disk; nothing records which ones.
 */
class RunOrchestrator {
public:
    /**
     * @brief Construct an orchestrator compressing with the zli command line tool.
     */
    RunOrchestrator(RunConfig config, Logger& logger, EventBus& bus);

    /**
     * @brief Construct an orchestrator using a caller-provided compressor.
     * @param compressor Must outlive the orchestrator.
     */
    RunOrchestrator(RunConfig config, ICompressor& compressor, Logger& logger, EventBus& bus);

    /**
     * @brief Execute the run.
     * @return Summary of the run when every chunk succeeded.
     * @throws ConfigurationError before any chunk is processed.
     * @throws RunFailed if at least one chunk exhausted every profile.
     */
    RunSummary run();

    [[nodiscard]] const RunConfig& config() const noexcept { return config_; }

private:
    RunConfig config_;
    std::unique_ptr<ICompressor> owned_compressor_;
    ICompressor* compressor_;
    Logger& logger_;
    EventBus& bus_;
};

} // namespace chunkzli

#endif // CHUNKZLI_RUN_ORCHESTRATOR_HPP
