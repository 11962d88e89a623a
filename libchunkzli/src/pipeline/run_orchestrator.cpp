#include "../../include/run_orchestrator.hpp"
#include "../../include/chunk_planner.hpp"
#include "../../include/chunk_worker.hpp"
#include "../../include/codec_profile.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include "../../include/worker_pool.hpp"
#include "../../include/zli_compressor.hpp"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <format>
#include <iterator>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace chunkzli {

namespace {

// logs "<label> took elapsed = <s> s" when leaving scope, also on unwinding
class ScopedTimer {
public:
    ScopedTimer(std::string label, Logger& logger)
        : label_(std::move(label)), logger_(logger), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        logger_.log(LogLevel::Info, std::format("{} took elapsed = {:.3f} s", label_, elapsed().count()),
                    "orchestrator");
    }

    [[nodiscard]] std::chrono::duration<double> elapsed() const {
        return std::chrono::steady_clock::now() - start_;
    }

private:
    std::string label_;
    Logger& logger_;
    std::chrono::steady_clock::time_point start_;
};

// true when the run would write over its own source: a temp chunk file or an artifact of one
bool source_is_run_file(const RunConfig& config, const size_t chunk_count) {
    std::error_code ec;
    const fs::path dir = fs::weakly_canonical(config.work_dir, ec);
    if (ec) {
        return false;
    }
    const fs::path file = fs::weakly_canonical(config.source, ec);
    if (ec || file.parent_path() != dir) {
        return false;
    }

    const std::string name = file.filename().string();
    const size_t digits = std::min(name.find_first_not_of("0123456789"), name.size());
    size_t index = 0;
    const auto [ptr, err] = std::from_chars(name.data(), name.data() + digits, index);
    if (digits == 0 || err != std::errc() || ptr != name.data() + digits || index >= chunk_count) {
        return false;
    }

    const fs::path temp = config.temp_path_for(index);
    if (temp.filename() == file.filename()) {
        return true;
    }
    return std::any_of(config.profiles.begin(), config.profiles.end(), [&](const CodecProfile& profile) {
        return compressed_path_for(temp, profile, config.compressed_extension).filename() == file.filename();
    });
}

} // namespace

RunOrchestrator::RunOrchestrator(RunConfig config, Logger& logger, EventBus& bus)
    : config_(std::move(config)),
      owned_compressor_(std::make_unique<ZliCompressor>(config_.tool, logger)),
      compressor_(owned_compressor_.get()),
      logger_(logger),
      bus_(bus) {}

RunOrchestrator::RunOrchestrator(RunConfig config, ICompressor& compressor, Logger& logger, EventBus& bus)
    : config_(std::move(config)),
      compressor_(&compressor),
      logger_(logger),
      bus_(bus) {}

RunSummary RunOrchestrator::run() {
    try {
        config_.validate();
    } catch (const ConfigurationError& e) {
        logger_.log(LogLevel::Error, std::string("Invalid configuration: ") + e.what(), "orchestrator");
        throw;
    }

    std::error_code ec;
    if (!fs::is_regular_file(config_.source, ec)) {
        throw ConfigurationError("not a regular file: " + config_.source.string());
    }
    const uintmax_t file_size = fs::file_size(config_.source, ec);
    if (ec) {
        throw ConfigurationError(std::format("cannot stat {}: {}", config_.source.string(), ec.message()));
    }
    if (!fs::exists(config_.work_dir, ec)) {
        fs::create_directories(config_.work_dir, ec);
        if (ec) {
            throw ConfigurationError(std::format("cannot create output directory {}: {}",
                                                 config_.work_dir.string(), ec.message()));
        }
    }

    const auto plan = plan_chunks(file_size, config_.chunk_size);
    if (source_is_run_file(config_, plan.size())) {
        const std::string msg = std::format("{} would be overwritten by the chunk files written to {}",
                                            config_.source.string(), config_.work_dir.string());
        logger_.log(LogLevel::Error, "Invalid configuration: " + msg, "orchestrator");
        throw ConfigurationError(msg);
    }

    RunSummary summary;
    summary.file_size = file_size;
    summary.chunk_count = plan.size();
    summary.workers = WorkerPool::effective_workers(config_.workers, plan.size());

    logger_.log(LogLevel::Info,
                std::format("{}: {} bytes in {} chunk(s) of {} bytes using {}",
                            config_.source.string(), file_size, plan.size(), config_.chunk_size,
                            compressor_->get_name()),
                "orchestrator");
    bus_.publish(RunPlannedEvent{file_size, plan.size(), summary.workers});

    const ChunkWorker worker(config_, *compressor_, logger_, bus_);
    WorkerPool pool(config_.workers, config_.failure_mode, logger_, bus_);

    WorkerPool::Result pool_result;
    {
        const ScopedTimer timer("main", logger_);
        pool_result = pool.run(plan, [&worker](const ChunkDescriptor& chunk) {
            return worker.process(chunk);
        });
        summary.elapsed = timer.elapsed();
    }

    std::vector<ChunkOutcome> failures;
    std::copy_if(pool_result.outcomes.begin(), pool_result.outcomes.end(), std::back_inserter(failures),
                 [](const ChunkOutcome& o) { return !o.success; });
    if (failures.empty() && pool_result.outcomes.size() != plan.size()) {
        // a chunk ended without any outcome: the run is incomplete
        size_t next = 0;
        for (const auto& chunk : plan) {
            if (next < pool_result.outcomes.size() && pool_result.outcomes[next].index == chunk.index) {
                ++next;
                continue;
            }
            ChunkOutcome lost;
            lost.index = chunk.index;
            lost.error = "chunk was not processed";
            failures.push_back(std::move(lost));
        }
    }
    if (!failures.empty()) {
        for (const auto& f : failures) {
            logger_.log(LogLevel::Error, std::format("Chunk {} failed: {}", f.index, f.error), "orchestrator");
        }
        throw RunFailed(std::move(failures));
    }

    summary.outcomes = std::move(pool_result.outcomes);
    return summary;
}

} // namespace chunkzli
