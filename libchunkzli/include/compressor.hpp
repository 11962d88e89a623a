#ifndef CHUNKZLI_COMPRESSOR_HPP
#define CHUNKZLI_COMPRESSOR_HPP

#include "codec_profile.hpp"
#include <filesystem>
#include <string_view>

namespace chunkzli {

/**
 * @brief Interface to the capability that compresses one materialized chunk.
 *
 * Implementations run a single attempt with a single profile and report
 * failure by throwing CompressionAttemptFailed. They are shared by all
 * workers of a run and must be safe to call concurrently.
 */
class ICompressor {
public:
    virtual ~ICompressor() = default;

    /// @return Human-readable name of the compressor (e.g. "zli").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /**
     * @brief Compress @p input into @p output using @p profile.
     * @throws CompressionAttemptFailed if the attempt did not succeed.
     * @throws CommandError if the compressor could not be run at all.
     */
    virtual void compress(const std::filesystem::path& input,
                          const CodecProfile& profile,
                          const std::filesystem::path& output) = 0;
};

} // namespace chunkzli

#endif // CHUNKZLI_COMPRESSOR_HPP
