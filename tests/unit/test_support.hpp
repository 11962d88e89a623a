#ifndef CHUNKZLI_TEST_SUPPORT_HPP
#define CHUNKZLI_TEST_SUPPORT_HPP

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../../libchunkzli/include/compressor.hpp"
#include "../../libchunkzli/include/errors.hpp"
#include "../../libchunkzli/include/log_sink.hpp"

namespace test_support {

namespace fs = std::filesystem;

// unique scratch directory removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "chunkzli-test") {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        path_ = fs::temp_directory_path() / (prefix + "-" + std::to_string(gen()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

inline void write_file(const fs::path& p, const std::string& content) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

// bytes 0..n-1 with a recognisable pattern
inline std::string pattern_bytes(const size_t n) {
    std::string s(n, '\0');
    for (size_t i = 0; i < n; ++i) {
        s[i] = static_cast<char>('a' + (i % 26));
    }
    return s;
}

inline std::vector<fs::path> list_dir(const fs::path& dir) {
    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir)) {
        files.push_back(entry.path().filename());
    }
    return files;
}

struct CaptureLogSink final : chunkzli::ILogSink {
    struct Entry {
        chunkzli::LogLevel level;
        std::string message;
        std::string tag;
    };

    explicit CaptureLogSink(std::vector<Entry>& out) : entries(out) {}

    void log(const chunkzli::LogLevel level, const std::string_view message, const std::string_view tag) override {
        std::lock_guard lock(mtx);
        entries.push_back({level, std::string(message), std::string(tag)});
    }

    std::vector<Entry>& entries;
    std::mutex mtx;
};

/**
 * In-process stand-in for the zli tool.
 *
 * A profile listed in `failing` fails for every input whose first byte
 * is one of the given characters (use "*" for every input). Successful
 * attempts copy the input to the output; failing attempts leave a
 * partial output behind, like a tool aborting mid-write would.
 */
class FakeCompressor final : public chunkzli::ICompressor {
public:
    struct Attempt {
        fs::path input;
        std::string profile;
        fs::path output;
        bool ok;
    };

    std::map<std::string, std::string> failing;

    [[nodiscard]] std::string_view get_name() const noexcept override { return "fake"; }

    void compress(const fs::path& input,
                  const chunkzli::CodecProfile& profile,
                  const fs::path& output) override {
        const std::string data = read_file(input);
        bool fail = false;
        if (const auto it = failing.find(std::string(profile.id)); it != failing.end()) {
            fail = it->second == "*" || (!data.empty() && it->second.find(data.front()) != std::string::npos);
        }
        {
            std::lock_guard lock(mtx_);
            attempts_.push_back({input, std::string(profile.id), output, !fail});
        }
        calls_.fetch_add(1);
        if (fail) {
            write_file(output, "partial");
            throw chunkzli::CompressionAttemptFailed(std::string(profile.id), 1, "unsupported layout");
        }
        write_file(output, data);
    }

    [[nodiscard]] std::vector<Attempt> attempts() const {
        std::lock_guard lock(mtx_);
        return attempts_;
    }

    [[nodiscard]] unsigned calls() const { return calls_.load(); }

private:
    mutable std::mutex mtx_;
    std::vector<Attempt> attempts_;
    std::atomic<unsigned> calls_{0};
};

} // namespace test_support

#endif // CHUNKZLI_TEST_SUPPORT_HPP
