#ifndef CHUNKZLI_ZLI_COMPRESSOR_HPP
#define CHUNKZLI_ZLI_COMPRESSOR_HPP

#include "compressor.hpp"
#include <string>

namespace chunkzli {

class Logger;

/**
 * @brief Compresses chunks by running the OpenZL command line tool.
 *
 * Invokes `<tool> compress --profile <id> <input> --output <output>` and
 * treats the exit status as the only success signal. Captured output is
 * carried on the error for diagnostics and otherwise discarded.
 */
class ZliCompressor final : public ICompressor {
public:
    ZliCompressor(std::string tool, Logger& logger);

    [[nodiscard]] std::string_view get_name() const noexcept override { return "zli"; }

    void compress(const std::filesystem::path& input,
                  const CodecProfile& profile,
                  const std::filesystem::path& output) override;

private:
    std::string tool_;
    Logger& logger_;
};

} // namespace chunkzli

#endif // CHUNKZLI_ZLI_COMPRESSOR_HPP
