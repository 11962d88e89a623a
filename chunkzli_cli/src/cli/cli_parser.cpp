#include "cli_parser.hpp"
#include "../../../libchunkzli/include/codec_profile.hpp"
#include "../../../libchunkzli/include/errors.hpp"
#include <CLI/CLI.hpp>
#include <map>

chunkzli::RunConfig Settings::to_run_config() const {
    chunkzli::RunConfig config;
    config.source = fname;
    config.tool = bin;
    config.workers = processes;
    config.chunk_size = chunk_size;
    config.work_dir = output_dir;
    config.failure_mode = failure_mode;
    if (!profiles.empty()) {
        config.profiles.clear();
        for (const auto& name : profiles) {
            const auto profile = chunkzli::find_profile(name);
            if (!profile) {
                throw chunkzli::ConfigurationError("unknown profile: " + name);
            }
            config.profiles.push_back(*profile);
        }
    }
    return config;
}

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");
    app.footer("This is alpha software, since OpenZL is too.");

    app.add_option("-f,--fname", settings.fname,
                   "Name of the file to compress. Without it chunkzli exits without doing anything.");

    app.add_option("-b,--bin", settings.bin,
                   "Location of the zli binary.")
                   ->default_val(settings.bin);

    app.add_option("-p,--process", settings.processes,
                   "Number of chunks compressed concurrently (at most 1024).")
                   ->default_val(settings.processes);

    app.add_option("-c,--chunk-size", settings.chunk_size,
                   "Chunk size in bytes before compression.")
                   ->default_val(settings.chunk_size)
                   ->check(CLI::PositiveNumber);

    app.add_option("-o,--output-dir", settings.output_dir,
                   "Directory receiving temporary chunks and compressed files.")
                   ->default_val(settings.output_dir.string());

    app.add_option("--profiles", settings.profiles,
                   "Codec profiles to try, in order (default: le-i64 le-i32).")
                   ->delimiter(',')
                   ->check(CLI::IsMember({"le-i64", "le-i32"}));

    app.add_option("--on-failure", settings.failure_mode,
                   "What to do when a chunk cannot be compressed: 'abort' (default) or 'continue'.")
        ->default_val(chunkzli::FailureMode::ABORT)
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, chunkzli::FailureMode>{
                {"abort", chunkzli::FailureMode::ABORT},
                {"continue", chunkzli::FailureMode::CONTINUE}
            }, CLI::ignore_case));

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, results).");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("INFO")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    app.callback([&settings]() {
        if (!settings.fname.empty() && !std::filesystem::exists(settings.fname)) {
            throw CLI::ValidationError("Input file '" + settings.fname.string() + "' not found.");
        }
    });
}
