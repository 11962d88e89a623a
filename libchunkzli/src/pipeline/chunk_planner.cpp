#include "../../include/chunk_planner.hpp"
#include "../../include/errors.hpp"

#include <algorithm>

namespace chunkzli {

std::vector<ChunkDescriptor> plan_chunks(const uintmax_t file_size, const uintmax_t chunk_size) {
    if (chunk_size == 0) {
        throw ConfigurationError("chunk size must be positive");
    }

    std::vector<ChunkDescriptor> chunks;
    chunks.reserve(static_cast<size_t>(file_size / chunk_size + (file_size % chunk_size ? 1 : 0)));
    size_t index = 0;
    for (uintmax_t offset = 0; offset < file_size;) {
        const uintmax_t length = std::min(chunk_size, file_size - offset);
        chunks.push_back({index++, offset, length});
        offset += length;
    }
    return chunks;
}

} // namespace chunkzli
