#include "cli_runner.hpp"
#include "../../../libchunkzli/include/errors.hpp"
#include "../../../libchunkzli/include/event_bus.hpp"
#include "../../../libchunkzli/include/logger.hpp"
#include "../../../libchunkzli/include/run_orchestrator.hpp"
#include <format>

using namespace chunkzli;

int run_with_settings(const Settings& settings, Logger& logger, EventBus& bus) {
    if (settings.fname.empty()) {
        logger.log(LogLevel::Info, "No file provided, exiting.", "main");
        return 0;
    }

    try {
        RunOrchestrator orchestrator(settings.to_run_config(), logger, bus);
        const auto summary = orchestrator.run();
        logger.log(LogLevel::Info,
                   std::format("Compressed {} chunk(s) of {} with {} worker(s) in {:.3f} s",
                               summary.chunk_count, settings.fname.string(), summary.workers,
                               summary.elapsed.count()),
                   "main");
        return 0;
    } catch (const ConfigurationError& e) {
        logger.log(LogLevel::Error, std::string("Configuration rejected: ") + e.what(), "main");
        return 1;
    } catch (const RunFailed& e) {
        logger.log(LogLevel::Error, std::string("Run failed: ") + e.what(), "main");
        return 1;
    }
}
