#ifndef QSHIFT_CONSOLE_LOG_SINK_HPP
#define QSHIFT_CONSOLE_LOG_SINK_HPP

#include "../../../libqshift/include/log_sink.hpp"
#include <iostream>

// prints messages at or above log_level; warnings and errors go to stderr
class ConsoleLogSink final : public qshift::ILogSink {
public:
    qshift::LogLevel log_level = qshift::LogLevel::Info;
    void log(const qshift::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) return;
        switch (level) {
            case qshift::LogLevel::Debug:
                std::cout << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case qshift::LogLevel::Info:
                std::cout << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case qshift::LogLevel::Warning:
                std::cerr << "[WARN ][" << tag << "] " << message << std::endl;
                break;
            case qshift::LogLevel::Error:
                std::cerr << "[ERROR][" << tag << "] " << message << std::endl;
                break;
        }
    }
};

#endif // QSHIFT_CONSOLE_LOG_SINK_HPP
