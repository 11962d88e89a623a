#ifndef CHUNKZLI_CONSOLE_LOG_SINK_HPP
#define CHUNKZLI_CONSOLE_LOG_SINK_HPP

#include "../../../libchunkzli/include/log_sink.hpp"
#include <iostream>
#include <mutex>

class ConsoleLogSink final : public chunkzli::ILogSink {
public:
    chunkzli::LogLevel log_level = chunkzli::LogLevel::Error;

    void log(const chunkzli::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) return;

        std::lock_guard lock(mtx_);
        switch (level) {
            case chunkzli::LogLevel::Debug:
                std::cout << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case chunkzli::LogLevel::Info:
                std::cout << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case chunkzli::LogLevel::Warning:
                std::cerr << "[WARN ][" << tag << "] " << message << std::endl;
                break;
            case chunkzli::LogLevel::Error:
                std::cerr << "[ERROR][" << tag << "] " << message << std::endl;
                break;
        }
    }

private:
    std::mutex mtx_;
};

#endif // CHUNKZLI_CONSOLE_LOG_SINK_HPP
