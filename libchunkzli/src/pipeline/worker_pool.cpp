#include "../../include/worker_pool.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include "../../include/thread_pool.hpp"

#include <algorithm>
#include <atomic>
#include <format>
#include <mutex>
#include <stdexcept>
#include <unordered_set>

namespace chunkzli {

WorkerPool::WorkerPool(const unsigned concurrency, const FailureMode mode, Logger& logger, EventBus& bus)
    : concurrency_(concurrency), mode_(mode), logger_(logger), bus_(bus) {}

unsigned WorkerPool::effective_workers(const unsigned configured, const size_t chunk_count) noexcept {
    return static_cast<unsigned>(std::min<size_t>(configured, chunk_count));
}

WorkerPool::Result WorkerPool::run(const std::vector<ChunkDescriptor>& plan, const ChunkRoutine& routine) {
    Result result;
    result.workers = effective_workers(concurrency_, plan.size());
    if (plan.empty() || result.workers == 0) {
        return result;
    }

    logger_.log(LogLevel::Info,
                std::format("Dispatching {} chunk(s) to {} worker(s)", plan.size(), result.workers), "pool");

    result.outcomes.reserve(plan.size());
    std::mutex outcomes_mtx;
    std::atomic<bool> aborting{false};
    {
        ThreadPool pool(result.workers, logger_);

        for (const auto& chunk : plan) {
            if (aborting.load(std::memory_order_acquire)) {
                break;
            }
            try {
                pool.enqueue([&, chunk](const std::stop_token& st) {
                    if (st.stop_requested()) {
                        return;
                    }

                    ChunkOutcome outcome;
                    try {
                        outcome = routine(chunk);
                    } catch (const std::exception& e) {
                        outcome.index = chunk.index;
                        outcome.success = false;
                        outcome.error = e.what();
                    } catch (...) {
                        outcome.index = chunk.index;
                        outcome.success = false;
                        outcome.error = "unknown exception";
                    }

                    const bool failed = !outcome.success;
                    {
                        std::lock_guard lock(outcomes_mtx);
                        result.outcomes.push_back(std::move(outcome));
                    }

                    if (failed && mode_ == FailureMode::ABORT && !aborting.exchange(true)) {
                        logger_.log(LogLevel::Error,
                                    std::format("Chunk {} failed, not starting remaining chunks", chunk.index),
                                    "pool");
                        pool.request_stop();
                    }
                });
            } catch (const std::runtime_error&) {
                // the pool was stopped by a failing chunk while we were still enqueueing
                break;
            }
        }

        pool.wait_idle();
    }

    std::sort(result.outcomes.begin(), result.outcomes.end(),
              [](const ChunkOutcome& a, const ChunkOutcome& b) { return a.index < b.index; });

    if (result.outcomes.size() < plan.size()) {
        std::unordered_set<size_t> seen;
        for (const auto& o : result.outcomes) {
            seen.insert(o.index);
        }
        for (const auto& chunk : plan) {
            if (!seen.contains(chunk.index)) {
                ++result.skipped;
                bus_.publish(ChunkSkippedEvent{chunk.index, "Run aborted"});
            }
        }
        logger_.log(LogLevel::Warning, std::format("{} chunk(s) were never started", result.skipped), "pool");
    }
    return result;
}

} // namespace chunkzli
