#ifndef CHUNKZLI_CHUNK_OUTCOME_HPP
#define CHUNKZLI_CHUNK_OUTCOME_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace chunkzli {

/**
 * @brief Result of processing one chunk, produced by ChunkWorker.
 */
struct ChunkOutcome {
    size_t index = 0;                        ///< Chunk index
    bool success = false;                    ///< True if one codec attempt succeeded
    std::string error;                       ///< Failure detail (empty on success)
    std::optional<std::string> profile;      ///< Profile that succeeded
    std::filesystem::path artifact;          ///< Compressed artifact (empty on failure)
    std::optional<std::string> cleanup_error;///< Set if the temp file could not be removed
    unsigned attempts = 0;                   ///< Number of codec attempts made
};

} // namespace chunkzli

#endif // CHUNKZLI_CHUNK_OUTCOME_HPP
