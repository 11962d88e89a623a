#include <algorithm>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"
#include "cli/cli_runner.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "utils/terminal.hpp"
#include "../../libchunkzli/include/event_bus.hpp"
#include "../../libchunkzli/include/events.hpp"
#include "../../libchunkzli/include/logger.hpp"

using namespace chunkzli;

// simple progress bar printer
inline void print_progress_bar(const size_t done, const size_t total, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned int bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);

    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : 1.0;
    const unsigned pos = static_cast<unsigned>(bar_width * progress);

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && done < total) std::cerr << ">";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << progress * 100.0 << "%"
              << " (" << done << "/" << total << ")"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

int main(int argc, char* argv[]) {
    CLI::App app{"chunkzli: compress huge numpy-like files chunk by chunk with OpenZL's zli."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    Logger logger;
    if (!settings.log_file.empty()) {
        auto file_sink = std::make_unique<FileLogSink>(settings.log_file, false);
        if (!file_sink->is_open()) {
            std::cerr << RED << "Cannot open log file: " << settings.log_file.string() << RESET << std::endl;
            return 1;
        }
        logger.add_sink(std::move(file_sink));
    }
    if (settings.log_level != "NONE") {
        auto console_sink = std::make_unique<ConsoleLogSink>();
        console_sink->log_level = settings.quiet ? LogLevel::Error : Logger::string_to_level(settings.log_level);
        logger.add_sink(std::move(console_sink));
    }

    EventBus bus;
    std::atomic<size_t> total{0};
    std::atomic<size_t> done{0};
    const auto start_total = std::chrono::steady_clock::now();

    if (!settings.quiet) {
        auto on_finish = [&](auto&&) {
            const size_t current = ++done;
            const double elapsed = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - start_total).count();
            print_progress_bar(current, total.load(), elapsed);
            if (current == total.load()) {
                std::cerr << std::endl;
            }
        };

        bus.subscribe<RunPlannedEvent>([&](const RunPlannedEvent& e) {
            total = e.chunk_count;
        });
        bus.subscribe<ChunkCompleteEvent>([on_finish](const ChunkCompleteEvent& e) {
            if (e.attempts > 1) {
                std::cerr << YELLOW << "\n[FALLBACK] chunk " << e.index << " compressed with " << e.profile
                          << RESET << std::endl;
            }
            on_finish(e);
        });
        bus.subscribe<ChunkErrorEvent>([on_finish](const ChunkErrorEvent& e) {
            std::cerr << RED << "\n[FAILED] chunk " << e.index << ": " << e.error_message << RESET << std::endl;
            on_finish(e);
        });
        bus.subscribe<ChunkSkippedEvent>(on_finish);
    }

    return run_with_settings(settings, logger, bus);
}
