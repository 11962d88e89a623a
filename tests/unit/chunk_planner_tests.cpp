#include <cstdint>
#include <format>
#include <iostream>

#include "../../libchunkzli/include/chunk_planner.hpp"
#include "../../libchunkzli/include/errors.hpp"

namespace {

constexpr uintmax_t kGiB = uintmax_t{1} << 30;

bool check_tiling(const uintmax_t file_size, const uintmax_t chunk_size) {
    const auto chunks = chunkzli::plan_chunks(file_size, chunk_size);

    const uintmax_t expected_count = file_size / chunk_size + (file_size % chunk_size ? 1 : 0);
    if (chunks.size() != expected_count) {
        std::cerr << std::format("size={} chunk={}: expected {} chunks, got {}\n",
                                 file_size, chunk_size, expected_count, chunks.size());
        return false;
    }

    uintmax_t covered = 0;
    for (size_t i = 0; i < chunks.size(); ++i) {
        const auto& c = chunks[i];
        if (c.index != i || c.offset != i * chunk_size || c.offset != covered) {
            std::cerr << std::format("size={} chunk={}: descriptor {} has index {} offset {}\n",
                                     file_size, chunk_size, i, c.index, c.offset);
            return false;
        }
        const bool last = i + 1 == chunks.size();
        if (c.length == 0 || c.length > chunk_size || (!last && c.length != chunk_size)) {
            std::cerr << std::format("size={} chunk={}: descriptor {} has length {}\n",
                                     file_size, chunk_size, i, c.length);
            return false;
        }
        covered += c.length;
    }
    if (covered != file_size) {
        std::cerr << std::format("size={} chunk={}: lengths sum to {}\n", file_size, chunk_size, covered);
        return false;
    }
    return true;
}

bool test_tiling_property() {
    const uintmax_t sizes[] = {0, 1, 2, 7, 8, 9, 63, 64, 65, 1000, 4096, 4097};
    const uintmax_t chunk_sizes[] = {1, 2, 3, 8, 64, 1000, 4096, 1u << 20};
    for (const auto s : sizes) {
        for (const auto c : chunk_sizes) {
            if (!check_tiling(s, c)) {
                return false;
            }
        }
    }
    return true;
}

bool test_empty_file_yields_no_chunks() {
    if (!chunkzli::plan_chunks(0, 1024).empty()) {
        std::cerr << std::format("empty file should produce no chunks\n");
        return false;
    }
    return true;
}

bool test_zero_chunk_size_rejected() {
    bool rejected = false;
    try {
        static_cast<void>(chunkzli::plan_chunks(100, 0));
    } catch (const chunkzli::ConfigurationError&) {
        rejected = true;
    }
    if (!rejected) {
        std::cerr << std::format("chunk size 0 should be rejected\n");
        return false;
    }
    return true;
}

bool test_three_gib_in_one_gib_chunks() {
    const auto chunks = chunkzli::plan_chunks(3 * kGiB, kGiB);
    const std::vector<chunkzli::ChunkDescriptor> expected{
        {0, 0, kGiB},
        {1, kGiB, kGiB},
        {2, 2 * kGiB, kGiB},
    };
    if (chunks != expected) {
        std::cerr << std::format("3 GiB plan mismatch ({} chunks)\n", chunks.size());
        return false;
    }
    return true;
}

bool test_two_and_a_half_gib_has_short_tail() {
    const auto chunks = chunkzli::plan_chunks(5 * kGiB / 2, kGiB);
    if (chunks.size() != 3) {
        std::cerr << std::format("expected 3 chunks, got {}\n", chunks.size());
        return false;
    }
    if (chunks.back().offset != 2 * kGiB || chunks.back().length != kGiB / 2) {
        std::cerr << std::format("last chunk is offset {} length {}\n", chunks.back().offset, chunks.back().length);
        return false;
    }
    return true;
}

bool test_chunk_larger_than_file() {
    const auto chunks = chunkzli::plan_chunks(10, UINTMAX_MAX);
    if (chunks.size() != 1 || chunks.front().length != 10) {
        std::cerr << std::format("oversized chunk should cover the file in one descriptor\n");
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_tiling_property()) {
        return 1;
    }
    if (!test_empty_file_yields_no_chunks()) {
        return 1;
    }
    if (!test_zero_chunk_size_rejected()) {
        return 1;
    }
    if (!test_three_gib_in_one_gib_chunks()) {
        return 1;
    }
    if (!test_two_and_a_half_gib_has_short_tail()) {
        return 1;
    }
    if (!test_chunk_larger_than_file()) {
        return 1;
    }
    return 0;
}
