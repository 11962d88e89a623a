#include "../../include/fallback_policy.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"

#include <format>
#include <system_error>

namespace chunkzli {

FallbackPolicy::FallbackPolicy(ICompressor& compressor,
                               std::vector<CodecProfile> profiles,
                               std::string compressed_extension,
                               Logger& logger)
    : compressor_(compressor),
      profiles_(std::move(profiles)),
      compressed_extension_(std::move(compressed_extension)),
      logger_(logger) {}

FallbackPolicy::Result FallbackPolicy::compress(const size_t chunk_index,
                                                const std::filesystem::path& chunk_file) const {
    std::vector<std::string> errors;
    errors.reserve(profiles_.size());

    const auto record_failure = [&](const CodecProfile& profile, const std::filesystem::path& artifact,
                                    const std::string& what, const std::string& output) {
        logger_.log(LogLevel::Warning,
                    std::format("Failed {} using {}: {}", chunk_file.string(), profile.id, what),
                    "fallback");
        if (!output.empty()) {
            logger_.log(LogLevel::Debug, output, "fallback");
        }
        errors.push_back(std::format("{}: {}", profile.id, what));

        std::error_code ec;
        if (std::filesystem::remove(artifact, ec)) {
            logger_.log(LogLevel::Debug, "Removed partial output " + artifact.string(), "fallback");
        }
    };

    for (const auto& profile : profiles_) {
        const auto artifact = compressed_path_for(chunk_file, profile, compressed_extension_);
        try {
            compressor_.compress(chunk_file, profile, artifact);
            return {profile, artifact, static_cast<unsigned>(errors.size() + 1)};
        } catch (const CompressionAttemptFailed& e) {
            record_failure(profile, artifact, e.what(), e.output());
        } catch (const CommandError& e) {
            // the tool never ran for this profile; same as a missing binary (status 127)
            record_failure(profile, artifact, e.what(), {});
        }
    }

    logger_.log(LogLevel::Error,
                std::format("Could not compress chunk {} with any of {} profile(s)", chunk_index, profiles_.size()),
                "fallback");
    throw ChunkCompressionExhausted(chunk_index, std::move(errors));
}

} // namespace chunkzli
