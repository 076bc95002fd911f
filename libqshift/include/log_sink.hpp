#ifndef QSHIFT_LOG_SINK_HPP
#define QSHIFT_LOG_SINK_HPP

#include <string_view>

namespace qshift {

/**
 * @brief Severity levels for log messages.
 *
 * Sinks use the level to filter and to pick the output stream.
 */
enum class LogLevel {
    Debug,   ///< Per-trial details, phase transitions, raw tool output
    Info,    ///< One line per file and per search decision
    Warning, ///< Metric fallbacks, calibration fallbacks, stalled processes
    Error    ///< Per-file failures and rejections caused by errors
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where messages go (console, file). The Logger
 * facade fans each message out to every installed sink.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that emitted the message (e.g. "Search").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace qshift

#endif // QSHIFT_LOG_SINK_HPP
