#include "../../include/file_utils.hpp"
#include "../../include/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <string>
#include <sys/types.h>
#include <vector>

namespace chunkzli {

namespace {
constexpr size_t kCopyBufferSize = 8 * 1024 * 1024;

std::string describe_errno() {
    return errno ? std::strerror(errno) : "unknown error";
}
} // namespace

FilePtr open_file(const std::filesystem::path& path, const char* mode) {
    return FilePtr(std::fopen(path.c_str(), mode));
}

void copy_file_range_to(const std::filesystem::path& source,
                        const uintmax_t offset,
                        const uintmax_t length,
                        const std::filesystem::path& destination) {
    errno = 0;
    const auto in = open_file(source, "rb");
    if (!in) {
        throw IoError(std::format("cannot open {}: {}", source.string(), describe_errno()));
    }
    if (::fseeko(in.get(), static_cast<off_t>(offset), SEEK_SET) != 0) {
        throw IoError(std::format("cannot seek {} to {}: {}", source.string(), offset, describe_errno()));
    }

    errno = 0;
    auto out = open_file(destination, "wb");
    if (!out) {
        throw IoError(std::format("cannot create {}: {}", destination.string(), describe_errno()));
    }

    std::vector<char> buffer(static_cast<size_t>(std::min<uintmax_t>(kCopyBufferSize, std::max<uintmax_t>(length, 1))));
    uintmax_t remaining = length;
    while (remaining > 0) {
        const size_t want = static_cast<size_t>(std::min<uintmax_t>(buffer.size(), remaining));
        const size_t got = std::fread(buffer.data(), 1, want, in.get());
        if (got > 0 && std::fwrite(buffer.data(), 1, got, out.get()) != got) {
            throw IoError(std::format("short write to {}: {}", destination.string(), describe_errno()));
        }
        remaining -= got;
        if (got < want) {
            if (std::ferror(in.get())) {
                throw IoError(std::format("read error on {}: {}", source.string(), describe_errno()));
            }
            throw IoError(std::format("short read on {}: expected {} bytes at offset {}, got {}",
                                      source.string(), length, offset, length - remaining));
        }
    }

    if (std::fclose(out.release()) != 0) {
        throw IoError(std::format("cannot close {}: {}", destination.string(), describe_errno()));
    }
}

} // namespace chunkzli
