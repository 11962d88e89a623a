#include "../../include/errors.hpp"

#include <format>

namespace chunkzli {

CompressionAttemptFailed::CompressionAttemptFailed(std::string profile, const int exit_status, std::string output)
    : ChunkZliError(std::format("compression with profile {} exited with status {}", profile, exit_status)),
      profile_(std::move(profile)),
      exit_status_(exit_status),
      output_(std::move(output)) {}

ChunkCompressionExhausted::ChunkCompressionExhausted(const size_t chunk_index,
                                                     std::vector<std::string> attempt_errors)
    : ChunkZliError(std::format("could not compress chunk {} ({} profiles tried)",
                                chunk_index, attempt_errors.size())),
      chunk_index_(chunk_index),
      attempt_errors_(std::move(attempt_errors)) {}

namespace {
std::string describe_failures(const std::vector<ChunkOutcome>& failures) {
    if (failures.empty()) {
        return "run failed";
    }
    std::string msg = std::format("{} chunk(s) failed, first: chunk {}: {}",
                                  failures.size(), failures.front().index, failures.front().error);
    return msg;
}
} // namespace

RunFailed::RunFailed(std::vector<ChunkOutcome> failures)
    : ChunkZliError(describe_failures(failures)),
      failures_(std::move(failures)) {}

} // namespace chunkzli
