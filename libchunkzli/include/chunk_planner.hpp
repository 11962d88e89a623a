/**
 * @file chunk_planner.hpp
 * @brief Splits a file into fixed-size, contiguous chunk descriptors.
 */

#ifndef CHUNKZLI_CHUNK_PLANNER_HPP
#define CHUNKZLI_CHUNK_PLANNER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace chunkzli {

/**
 * @brief One contiguous byte range of the source file.
 */
struct ChunkDescriptor {
    size_t index = 0;     ///< Dense index starting at 0
    uintmax_t offset = 0; ///< index * chunk_size
    uintmax_t length = 0; ///< chunk_size, except possibly the last chunk

    friend bool operator==(const ChunkDescriptor&, const ChunkDescriptor&) = default;
};

/**
 * @brief Plans the chunks covering [0, file_size).
 *
 * The descriptors tile the file with no gap and no overlap; there are
 * ceil(file_size / chunk_size) of them and an empty file yields none.
 *
 * @param file_size Size of the source file in bytes.
 * @param chunk_size Requested chunk size, must be > 0.
 * @throws ConfigurationError if chunk_size is 0.
 */
[[nodiscard]] std::vector<ChunkDescriptor> plan_chunks(uintmax_t file_size, uintmax_t chunk_size);

} // namespace chunkzli

#endif // CHUNKZLI_CHUNK_PLANNER_HPP
