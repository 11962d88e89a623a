/**
 * @file codec_profile.hpp
 * @brief Codec profiles understood by the external compression tool.
 */

#ifndef CHUNKZLI_CODEC_PROFILE_HPP
#define CHUNKZLI_CODEC_PROFILE_HPP

#include <filesystem>
#include <optional>
#include <span>
#include <string_view>

namespace chunkzli {

/**
 * @brief A named external tool profile tuned for one numeric element width.
 */
struct CodecProfile {
    std::string_view id;         ///< Profile identifier passed to `--profile`
    unsigned element_width = 0;  ///< Element width in bytes, recorded in the artifact name

    friend bool operator==(const CodecProfile&, const CodecProfile&) = default;
};

/// Little-endian 64-bit integers.
inline constexpr CodecProfile kWideProfile{"le-i64", 8};
/// Little-endian 32-bit integers.
inline constexpr CodecProfile kNarrowProfile{"le-i32", 4};

/**
 * @brief Default attempt order: wide first, then narrow.
 */
std::span<const CodecProfile> default_profiles() noexcept;

/**
 * @brief Looks up one of the known profiles by identifier.
 * @return The profile, or std::nullopt for an unknown identifier.
 */
std::optional<CodecProfile> find_profile(std::string_view id) noexcept;

/**
 * @brief Name of the compressed artifact written for @p input with @p profile.
 *
 * `<input>.<element_width>.<compressed_extension>`, e.g. `3.npy.8.zli`.
 */
std::filesystem::path compressed_path_for(const std::filesystem::path& input,
                                          const CodecProfile& profile,
                                          std::string_view compressed_extension);

} // namespace chunkzli

#endif // CHUNKZLI_CODEC_PROFILE_HPP
