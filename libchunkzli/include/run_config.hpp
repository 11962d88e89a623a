/**
 * @file run_config.hpp
 * @brief Read-only configuration of one compression run.
 */

#ifndef CHUNKZLI_RUN_CONFIG_HPP
#define CHUNKZLI_RUN_CONFIG_HPP

#include "codec_profile.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace chunkzli {

/// Upper bound on the worker count; anything above is almost certainly a typo.
inline constexpr unsigned kMaxWorkers = 1024;
inline constexpr unsigned kDefaultWorkers = 4;
inline constexpr uintmax_t kDefaultChunkSize = uintmax_t{1} << 30;

/**
 * @brief What the run does once a chunk has exhausted every profile.
 */
enum class FailureMode {
    /**
     * @brief Stop scheduling new chunks, wait for in-flight ones, then fail the run.
     */
    ABORT,
    /**
     * @brief Attempt every chunk, then fail the run listing all failed chunks.
     */
    CONTINUE
};

struct RunConfig {
    std::filesystem::path source;                  ///< File to compress
    std::string tool = "zli";                      ///< Tool location, bare names go through PATH
    unsigned workers = kDefaultWorkers;            ///< Requested concurrency
    uintmax_t chunk_size = kDefaultChunkSize;      ///< Bytes per chunk
    std::filesystem::path work_dir = ".";          ///< Where temp and compressed files are written
    std::vector<CodecProfile> profiles = std::vector<CodecProfile>(default_profiles().begin(), default_profiles().end());
    std::string array_extension = "npy";           ///< Extension of temporary chunk files
    std::string compressed_extension = "zli";      ///< Extension of compressed artifacts
    FailureMode failure_mode = FailureMode::ABORT;

    /**
     * @brief Rejects configurations that must not start a run.
     * @throws ConfigurationError describing the first invalid field.
     */
    void validate() const;

    /// @return `<work_dir>/<index>.<array_extension>`
    [[nodiscard]] std::filesystem::path temp_path_for(size_t index) const;
};

} // namespace chunkzli

#endif // CHUNKZLI_RUN_CONFIG_HPP
