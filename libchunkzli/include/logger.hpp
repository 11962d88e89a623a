/**
 * @file logger.hpp
 * @brief Provides a thread-safe logging fan-out injected into every component.
 */

#ifndef CHUNKZLI_LOGGER_HPP
#define CHUNKZLI_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace chunkzli {

/**
 * @brief Leveled logger delegating to registered ILogSink implementations.
 *
 * @details One Logger is created by the caller (CLI or test) and passed by
 * reference to the components of a run. There is no global instance.
 */
class Logger {
public:
    Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     */
    void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional tag (default: "chunkzli").
     */
    void log(LogLevel level,
             std::string_view msg,
             std::string_view tag = "chunkzli");

    /**
     * @brief Converts a LogLevel enum to its string representation.
     */
    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Converts a string to its LogLevel enum representation.
     * Case-sensitive. Returns LogLevel::Error if not matched.
     */
    static LogLevel string_to_level(const std::string& level) {
        if (level == "DEBUG")
            return LogLevel::Debug;
        if (level == "INFO")
            return LogLevel::Info;
        if (level == "WARNING")
            return LogLevel::Warning;
        return LogLevel::Error; // default fallback
    }

private:
    std::vector<std::unique_ptr<ILogSink>> sinks_; ///< Registered sinks
    std::mutex mtx_;                               ///< Protects sinks_
};

} // namespace chunkzli

#endif // CHUNKZLI_LOGGER_HPP
