#ifndef CHUNKZLI_FILE_UTILS_HPP
#define CHUNKZLI_FILE_UTILS_HPP

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>

namespace chunkzli {

struct FileCloser {
    void operator()(FILE* f) const noexcept {
        if (f) std::fclose(f);
    }
};

using FilePtr = std::unique_ptr<FILE, FileCloser>;

/**
 * @brief Opens a file using a filesystem path.
 * @param path The path to the file.
 * @param mode The standard C fopen mode string (e.g., "rb", "wb").
 * @return Owning FILE pointer, empty if open failed.
 */
FilePtr open_file(const std::filesystem::path& path, const char* mode);

/**
 * @brief Copies exactly @p length bytes starting at @p offset of @p source into a new file.
 *
 * @p destination is created or truncated. Large offsets are supported.
 *
 * @throws IoError if the source cannot be read in full or the destination
 * cannot be written.
 */
void copy_file_range_to(const std::filesystem::path& source,
                        uintmax_t offset,
                        uintmax_t length,
                        const std::filesystem::path& destination);

} // namespace chunkzli

#endif // CHUNKZLI_FILE_UTILS_HPP
