/**
 * @file errors.hpp
 * @brief Exception taxonomy of chunkzli.
 */

#ifndef CHUNKZLI_ERRORS_HPP
#define CHUNKZLI_ERRORS_HPP

#include "chunk_outcome.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace chunkzli {

/**
 * @brief Base class of every error raised by the library.
 */
class ChunkZliError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A RunConfig was rejected before any work started.
 */
class ConfigurationError : public ChunkZliError {
public:
    using ChunkZliError::ChunkZliError;
};

/**
 * @brief Reading the source range or writing the temporary chunk file failed.
 */
class IoError : public ChunkZliError {
public:
    using ChunkZliError::ChunkZliError;
};

/**
 * @brief The external command could not be started or waited for.
 */
class CommandError : public ChunkZliError {
public:
    using ChunkZliError::ChunkZliError;
};

/**
 * @brief One codec attempt on one chunk failed.
 *
 * Raised when the external tool exits with a non-zero status. The captured
 * output is kept verbatim for diagnostics only.
 */
class CompressionAttemptFailed : public ChunkZliError {
public:
    CompressionAttemptFailed(std::string profile, int exit_status, std::string output);

    [[nodiscard]] const std::string& profile() const noexcept { return profile_; }
    [[nodiscard]] int exit_status() const noexcept { return exit_status_; }
    [[nodiscard]] const std::string& output() const noexcept { return output_; }

private:
    std::string profile_;
    int exit_status_;
    std::string output_;
};

/**
 * @brief Every codec profile failed for a chunk.
 */
class ChunkCompressionExhausted : public ChunkZliError {
public:
    ChunkCompressionExhausted(size_t chunk_index, std::vector<std::string> attempt_errors);

    [[nodiscard]] size_t chunk_index() const noexcept { return chunk_index_; }
    /// @return One message per failed attempt, in attempt order.
    [[nodiscard]] const std::vector<std::string>& attempt_errors() const noexcept { return attempt_errors_; }

private:
    size_t chunk_index_;
    std::vector<std::string> attempt_errors_;
};

/**
 * @brief Fatal run failure: at least one chunk could not be compressed.
 */
class RunFailed : public ChunkZliError {
public:
    explicit RunFailed(std::vector<ChunkOutcome> failures);

    [[nodiscard]] const std::vector<ChunkOutcome>& failures() const noexcept { return failures_; }

private:
    std::vector<ChunkOutcome> failures_;
};

} // namespace chunkzli

#endif // CHUNKZLI_ERRORS_HPP
