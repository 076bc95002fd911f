/**
 * @file logger.hpp
 * @brief Provides a static, thread-safe logging facade.
 *
 * Every component of qshift logs through Logger. Workers log concurrently,
 * so the facade serializes delivery to the registered ILogSink instances.
 */

#ifndef QSHIFT_LOGGER_HPP
#define QSHIFT_LOGGER_HPP

#include "log_sink.hpp"
#include <array>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace qshift {

/**
 * @brief Static logging facade.
 *
 * Delegates each message to all registered sinks. Sinks are owned by the
 * Logger once added. Messages are also counted per level, sinks or not.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership.
     * @param sink Unique pointer to a sink implementation. Null is ignored.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "qshift").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "qshift");

    /**
     * @return Messages logged at `level` since start-up or the last reset_counts().
     */
    static std::size_t count(LogLevel level);

    static void reset_counts();

    /**
     * @brief Converts a LogLevel to its display name.
     * @param level The enum value.
     * @return A constant string ("DEBUG", "INFO", "WARN", "ERROR").
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
     * @brief Parses a level name as accepted by the --log-level option.
     *
     * Matching is case-sensitive on upper-case names. "NONE" yields
     * std::nullopt, meaning the caller should not install a console sink.
     * Unknown names map to LogLevel::Error.
     *
     * @param level The string value (e.g. "DEBUG", "WARNING").
     * @return The corresponding level, or std::nullopt for "NONE".
     */
    static std::optional<LogLevel> string_to_level(const std::string& level) {
        if (level == "NONE")
            return std::nullopt;
        if (level == "DEBUG")
            return LogLevel::Debug;
        if (level == "INFO")
            return LogLevel::Info;
        if (level == "WARNING" || level == "WARN")
            return LogLevel::Warning;
        return LogLevel::Error;
    }

private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Messages per LogLevel, indexed by its value.
    static std::array<std::size_t, 4> counts_;
    ///< Protects sinks_ and counts_.
    static std::mutex mtx_;
};

} // namespace qshift

#endif // QSHIFT_LOGGER_HPP
