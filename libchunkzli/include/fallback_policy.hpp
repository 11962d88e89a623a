/**
 * @file fallback_policy.hpp
 * @brief Ordered codec attempts for one chunk.
 */

#ifndef CHUNKZLI_FALLBACK_POLICY_HPP
#define CHUNKZLI_FALLBACK_POLICY_HPP

#include "codec_profile.hpp"
#include "compressor.hpp"
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace chunkzli {

class Logger;

/**
 * @brief Tries each codec profile in order until one succeeds.
 *
 * @details No attempt is skipped and no inspection of the chunk data takes
 * place: profiles are simply tried in the configured order. A failed
 * attempt is logged and its partial output removed before the next
 * profile runs. An attempt fails when the tool exits non-zero
 * (CompressionAttemptFailed) or cannot be started at all (CommandError).
 */
class FallbackPolicy {
public:
    struct Result {
        CodecProfile profile;            ///< Profile that succeeded
        std::filesystem::path artifact;  ///< Compressed file it produced
        unsigned attempts = 0;           ///< Attempts made, including the successful one
    };

    FallbackPolicy(ICompressor& compressor,
                   std::vector<CodecProfile> profiles,
                   std::string compressed_extension,
                   Logger& logger);

    /**
     * @brief Compress one materialized chunk.
     * @param chunk_index Index of the chunk, used for reporting.
     * @param chunk_file Path of the temporary chunk file.
     * @return The successful attempt.
     * @throws ChunkCompressionExhausted if every profile failed.
     */
    Result compress(size_t chunk_index, const std::filesystem::path& chunk_file) const;

    [[nodiscard]] const std::vector<CodecProfile>& profiles() const noexcept { return profiles_; }

private:
    ICompressor& compressor_;
    std::vector<CodecProfile> profiles_;
    std::string compressed_extension_;
    Logger& logger_;
};

} // namespace chunkzli

#endif // CHUNKZLI_FALLBACK_POLICY_HPP
