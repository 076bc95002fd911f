#include "../../include/logger.hpp"

namespace qshift {

std::vector<std::unique_ptr<ILogSink>> Logger::sinks_;
std::array<std::size_t, 4> Logger::counts_{};
std::mutex Logger::mtx_;

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    if (!sink) return;
    std::lock_guard lock(mtx_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
}

void Logger::log(const LogLevel level,
                 const std::string_view msg,
                 const std::string_view tag) {
    std::lock_guard lock(mtx_);
    ++counts_[static_cast<std::size_t>(level)];
    for (const auto& sink : sinks_) {
        sink->log(level, msg, tag);
    }
}

std::size_t Logger::count(const LogLevel level) {
    std::lock_guard lock(mtx_);
    return counts_[static_cast<std::size_t>(level)];
}

void Logger::reset_counts() {
    std::lock_guard lock(mtx_);
    counts_.fill(0);
}

} // namespace qshift
