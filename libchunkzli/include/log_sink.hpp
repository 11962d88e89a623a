#ifndef CHUNKZLI_LOG_SINK_HPP
#define CHUNKZLI_LOG_SINK_HPP

#include <string_view>

namespace chunkzli {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    Debug,   ///< Detailed diagnostic information (spawned commands, temp files)
    Info,    ///< Normal progress of a run
    Warning, ///< Recoverable problems (a codec attempt failed, cleanup failed)
    Error    ///< A chunk or the whole run failed
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations of ILogSink define how log messages are delivered
 * (console, file, an in-memory buffer in tests). A Logger fans every
 * message out to the sinks it owns.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Tag identifying the source component.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace chunkzli

#endif // CHUNKZLI_LOG_SINK_HPP
