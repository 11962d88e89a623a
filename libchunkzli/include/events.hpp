#ifndef CHUNKZLI_EVENTS_HPP
#define CHUNKZLI_EVENTS_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace chunkzli {

/**
 * @brief Events published while a run is in progress.
 *
 * Plain data carriers delivered through EventBus.
 */

/**
 * @brief Emitted once the chunk plan is known, before any chunk starts.
 */
struct RunPlannedEvent {
    uintmax_t file_size = 0;  ///< Source file size in bytes
    size_t chunk_count = 0;   ///< Number of chunks
    unsigned workers = 0;     ///< Effective concurrency
};

/**
 * @brief Emitted when a worker picks up a chunk.
 */
struct ChunkStartEvent {
    size_t index = 0;
    uintmax_t offset = 0;
    uintmax_t length = 0;
};

/**
 * @brief Emitted when a chunk has been compressed.
 */
struct ChunkCompleteEvent {
    size_t index = 0;
    std::string profile;                   ///< Profile that succeeded
    std::filesystem::path artifact;        ///< Compressed artifact
    unsigned attempts = 0;                 ///< Attempts needed
    std::chrono::milliseconds duration{0}; ///< Extract + compress + cleanup time
};

/**
 * @brief Emitted when a chunk could not be compressed.
 */
struct ChunkErrorEvent {
    size_t index = 0;
    std::string error_message;
};

/**
 * @brief Emitted for chunks dropped because the run is aborting.
 */
struct ChunkSkippedEvent {
    size_t index = 0;
    std::string reason;
};

} // namespace chunkzli

#endif // CHUNKZLI_EVENTS_HPP
