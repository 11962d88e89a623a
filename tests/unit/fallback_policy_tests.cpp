#include <filesystem>
#include <format>
#include <iostream>
#include <memory>

#include "../../libchunkzli/include/errors.hpp"
#include "../../libchunkzli/include/fallback_policy.hpp"
#include "../../libchunkzli/include/logger.hpp"
#include "test_support.hpp"

namespace {

namespace fs = std::filesystem;
using test_support::FakeCompressor;
using test_support::TempDir;

std::vector<chunkzli::CodecProfile> default_order() {
    return std::vector<chunkzli::CodecProfile>(chunkzli::default_profiles().begin(),
                                               chunkzli::default_profiles().end());
}

bool test_wide_profile_succeeds_first() {
    TempDir dir;
    chunkzli::Logger logger;
    FakeCompressor compressor;
    const fs::path chunk = dir.path() / "0.npy";
    test_support::write_file(chunk, "W-data");

    const chunkzli::FallbackPolicy policy(compressor, default_order(), "zli", logger);
    const auto result = policy.compress(0, chunk);

    if (result.attempts != 1 || compressor.calls() != 1 || result.profile != chunkzli::kWideProfile) {
        std::cerr << std::format("expected one wide attempt, got {} attempt(s) with {}\n",
                                 compressor.calls(), result.profile.id);
        return false;
    }
    if (result.artifact != dir.path() / "0.npy.8.zli" || !fs::exists(result.artifact)) {
        std::cerr << std::format("unexpected artifact {}\n", result.artifact.string());
        return false;
    }
    if (fs::exists(dir.path() / "0.npy.4.zli")) {
        std::cerr << std::format("narrow artifact should not exist\n");
        return false;
    }
    return true;
}

bool test_falls_back_to_narrow_profile() {
    TempDir dir;
    std::vector<test_support::CaptureLogSink::Entry> logs;
    chunkzli::Logger logger;
    logger.add_sink(std::make_unique<test_support::CaptureLogSink>(logs));

    FakeCompressor compressor;
    compressor.failing["le-i64"] = "N";
    const fs::path chunk = dir.path() / "3.npy";
    test_support::write_file(chunk, "N-data");

    const chunkzli::FallbackPolicy policy(compressor, default_order(), "zli", logger);
    const auto result = policy.compress(3, chunk);

    const auto attempts = compressor.attempts();
    if (attempts.size() != 2 || attempts[0].ok || !attempts[1].ok ||
        attempts[0].profile != "le-i64" || attempts[1].profile != "le-i32") {
        std::cerr << std::format("expected failed le-i64 then successful le-i32, got {} attempts\n",
                                 attempts.size());
        return false;
    }
    if (result.attempts != 2 || result.profile != chunkzli::kNarrowProfile) {
        std::cerr << std::format("result should report the narrow profile after 2 attempts\n");
        return false;
    }
    if (!fs::exists(dir.path() / "3.npy.4.zli") || fs::exists(dir.path() / "3.npy.8.zli")) {
        std::cerr << std::format("exactly the narrow artifact should exist\n");
        return false;
    }

    bool warned = false;
    for (const auto& e : logs) {
        if (e.level == chunkzli::LogLevel::Warning && e.message.find("le-i64") != std::string::npos) {
            warned = true;
        }
    }
    if (!warned) {
        std::cerr << std::format("failed wide attempt should be logged as a warning\n");
        return false;
    }
    return true;
}

bool test_exhaustion_leaves_no_artifact() {
    TempDir dir;
    chunkzli::Logger logger;
    FakeCompressor compressor;
    compressor.failing["le-i64"] = "*";
    compressor.failing["le-i32"] = "*";
    const fs::path chunk = dir.path() / "5.npy";
    test_support::write_file(chunk, "X-data");

    const chunkzli::FallbackPolicy policy(compressor, default_order(), "zli", logger);
    bool exhausted = false;
    try {
        static_cast<void>(policy.compress(5, chunk));
    } catch (const chunkzli::ChunkCompressionExhausted& e) {
        exhausted = e.chunk_index() == 5 && e.attempt_errors().size() == 2;
    }
    if (!exhausted) {
        std::cerr << std::format("expected ChunkCompressionExhausted after two attempts\n");
        return false;
    }
    if (compressor.calls() != 2) {
        std::cerr << std::format("every profile must be tried, got {} calls\n", compressor.calls());
        return false;
    }
    if (fs::exists(dir.path() / "5.npy.8.zli") || fs::exists(dir.path() / "5.npy.4.zli")) {
        std::cerr << std::format("partial artifacts must be removed\n");
        return false;
    }
    return true;
}

bool test_custom_profile_order() {
    TempDir dir;
    chunkzli::Logger logger;
    FakeCompressor compressor;
    const fs::path chunk = dir.path() / "1.npy";
    test_support::write_file(chunk, "data");

    const chunkzli::FallbackPolicy policy(compressor, {chunkzli::kNarrowProfile}, "zz", logger);
    const auto result = policy.compress(1, chunk);
    if (result.artifact != dir.path() / "1.npy.4.zz" || compressor.attempts().front().profile != "le-i32") {
        std::cerr << std::format("custom order/extension not honoured: {}\n", result.artifact.string());
        return false;
    }
    return true;
}

// the wide profile cannot even be spawned, every other profile delegates to FakeCompressor
class SpawnFailingCompressor final : public chunkzli::ICompressor {
public:
    FakeCompressor inner;
    unsigned spawn_failures = 0;

    [[nodiscard]] std::string_view get_name() const noexcept override { return "spawn-failing"; }

    void compress(const fs::path& input, const chunkzli::CodecProfile& profile, const fs::path& output) override {
        if (profile == chunkzli::kWideProfile) {
            ++spawn_failures;
            throw chunkzli::CommandError("fork failed: Resource temporarily unavailable");
        }
        inner.compress(input, profile, output);
    }
};

bool test_spawn_failure_falls_back() {
    TempDir dir;
    chunkzli::Logger logger;
    SpawnFailingCompressor compressor;
    const fs::path chunk = dir.path() / "2.npy";
    test_support::write_file(chunk, "data");

    const chunkzli::FallbackPolicy policy(compressor, default_order(), "zli", logger);
    const auto result = policy.compress(2, chunk);
    if (compressor.spawn_failures != 1 || result.attempts != 2 || result.profile != chunkzli::kNarrowProfile) {
        std::cerr << std::format("a tool that cannot be started should fall back, got {} attempt(s)\n",
                                 result.attempts);
        return false;
    }
    if (!fs::exists(dir.path() / "2.npy.4.zli") || fs::exists(dir.path() / "2.npy.8.zli")) {
        std::cerr << std::format("only the narrow artifact should exist\n");
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_wide_profile_succeeds_first()) {
        return 1;
    }
    if (!test_falls_back_to_narrow_profile()) {
        return 1;
    }
    if (!test_exhaustion_leaves_no_artifact()) {
        return 1;
    }
    if (!test_custom_profile_order()) {
        return 1;
    }
    if (!test_spawn_failure_falls_back()) {
        return 1;
    }
    return 0;
}
