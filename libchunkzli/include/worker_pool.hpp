/**
 * @file worker_pool.hpp
 * @brief Runs the per-chunk routine over a whole chunk plan with bounded concurrency.
 */

#ifndef CHUNKZLI_WORKER_POOL_HPP
#define CHUNKZLI_WORKER_POOL_HPP

#include "chunk_outcome.hpp"
#include "chunk_planner.hpp"
#include "event_bus.hpp"
#include "run_config.hpp"
#include <functional>
#include <vector>

namespace chunkzli {

class Logger;

/**
 * @brief Dispatches chunks to a ThreadPool and collects their outcomes.
 *
 * @details The pool never uses more threads than there are chunks. Chunks
 * start in plan order but complete in any order. With FailureMode::ABORT
 * the first failed chunk discards every chunk not yet started; chunks
 * already running are awaited. With FailureMode::CONTINUE every chunk is
 * attempted.
 */
class WorkerPool {
public:
    using ChunkRoutine = std::function<ChunkOutcome(const ChunkDescriptor&)>;

    struct Result {
        std::vector<ChunkOutcome> outcomes; ///< One per attempted chunk, sorted by index
        size_t skipped = 0;                 ///< Chunks never started because of an abort
        unsigned workers = 0;               ///< Threads actually used
    };

    WorkerPool(unsigned concurrency, FailureMode mode, Logger& logger, EventBus& bus);

    /**
     * @brief Effective worker count: min(configured, chunk_count).
     */
    [[nodiscard]] static unsigned effective_workers(unsigned configured, size_t chunk_count) noexcept;

    /**
     * @brief Run @p routine for the chunks of @p plan and wait for all of them.
     * @param plan Descriptors to process.
     * @param routine Per-chunk routine, normally ChunkWorker::process.
     */
    Result run(const std::vector<ChunkDescriptor>& plan, const ChunkRoutine& routine);

private:
    unsigned concurrency_;
    FailureMode mode_;
    Logger& logger_;
    EventBus& bus_;
};

} // namespace chunkzli

#endif // CHUNKZLI_WORKER_POOL_HPP
