#ifndef QSHIFT_FILE_LOG_SINK_HPP
#define QSHIFT_FILE_LOG_SINK_HPP

#include "../../../libqshift/include/log_sink.hpp"
#include "../../../libqshift/include/logger.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <string>

class FileLogSink final : public qshift::ILogSink {
public:
    explicit FileLogSink(const std::string& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const qshift::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!out_.is_open()) return;

        const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
        localtime_r(&now, &tm);

        std::lock_guard lock(mtx_);
        out_ << std::put_time(&tm, "%F %T") << " [" << qshift::Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;

};

#endif // QSHIFT_FILE_LOG_SINK_HPP
