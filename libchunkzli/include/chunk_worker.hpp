/**
 * @file chunk_worker.hpp
 * @brief End-to-end processing of a single chunk.
 */

#ifndef CHUNKZLI_CHUNK_WORKER_HPP
#define CHUNKZLI_CHUNK_WORKER_HPP

#include "chunk_outcome.hpp"
#include "chunk_planner.hpp"
#include "compressor.hpp"
#include "event_bus.hpp"
#include "fallback_policy.hpp"
#include "run_config.hpp"

namespace chunkzli {

class Logger;

/**
 * @brief Extracts, compresses and cleans up one chunk.
 *
 * @details For a descriptor the worker:
 * - copies the descriptor's byte range of the source into `<index>.<ext>`,
 * - runs the FallbackPolicy on that temporary file,
 * - removes the temporary file whatever the compression result.
 *
 * Failures never escape process(); they are reported in the returned
 * ChunkOutcome. A failure to remove the temporary file is recorded in
 * ChunkOutcome::cleanup_error and does not change the chunk's result.
 *
 * One ChunkWorker is shared by all pool threads; process() is const and
 * only touches files named after the descriptor's index.
 */
class ChunkWorker {
public:
    ChunkWorker(const RunConfig& config, ICompressor& compressor, Logger& logger, EventBus& bus);

    /**
     * @brief Process one chunk.
     * @param chunk Descriptor produced by plan_chunks().
     * @return Outcome of the chunk.
     */
    ChunkOutcome process(const ChunkDescriptor& chunk) const;

private:
    const RunConfig& config_;
    FallbackPolicy policy_;
    Logger& logger_;
    EventBus& bus_;
};

} // namespace chunkzli

#endif // CHUNKZLI_CHUNK_WORKER_HPP
