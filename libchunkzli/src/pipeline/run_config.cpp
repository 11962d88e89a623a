#include "../../include/run_config.hpp"
#include "../../include/errors.hpp"

#include <format>

namespace chunkzli {

void RunConfig::validate() const {
    if (source.empty()) {
        throw ConfigurationError("no source file given");
    }
    if (workers == 0) {
        throw ConfigurationError("worker count must be at least 1");
    }
    if (workers > kMaxWorkers) {
        throw ConfigurationError(std::format("worker count likely too high: {} (max {})", workers, kMaxWorkers));
    }
    if (chunk_size == 0) {
        throw ConfigurationError("chunk size must be positive");
    }
    if (tool.empty()) {
        throw ConfigurationError("compression tool location is empty");
    }
    if (profiles.empty()) {
        throw ConfigurationError("at least one codec profile is required");
    }
    if (array_extension.empty() || compressed_extension.empty()) {
        throw ConfigurationError("file extensions must not be empty");
    }
}

std::filesystem::path RunConfig::temp_path_for(const size_t index) const {
    return work_dir / (std::to_string(index) + "." + array_extension);
}

} // namespace chunkzli
