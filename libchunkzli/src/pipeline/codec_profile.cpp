#include "../../include/codec_profile.hpp"

#include <array>
#include <string>

namespace chunkzli {

namespace {
constexpr std::array kKnownProfiles{kWideProfile, kNarrowProfile};
} // namespace

std::span<const CodecProfile> default_profiles() noexcept {
    return kKnownProfiles;
}

std::optional<CodecProfile> find_profile(const std::string_view id) noexcept {
    for (const auto& profile : kKnownProfiles) {
        if (profile.id == id) {
            return profile;
        }
    }
    return std::nullopt;
}

std::filesystem::path compressed_path_for(const std::filesystem::path& input,
                                          const CodecProfile& profile,
                                          const std::string_view compressed_extension) {
    std::filesystem::path out = input;
    out += "." + std::to_string(profile.element_width) + "." + std::string(compressed_extension);
    return out;
}

} // namespace chunkzli
