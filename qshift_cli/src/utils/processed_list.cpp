#include "processed_list.hpp"
#include "../../../libqshift/include/logger.hpp"
#include <stdexcept>

namespace fs = std::filesystem;
using qshift::Logger;
using qshift::LogLevel;

namespace {
std::string key_of(const fs::path& path) {
    std::error_code ec;
    const auto abs = fs::absolute(path, ec);
    return (ec ? path : abs).lexically_normal().string();
}
} // namespace

ProcessedList::ProcessedList(fs::path file) : file_(std::move(file)) {
    if (fs::exists(file_)) {
        std::ifstream in(file_);
        if (!in) {
            throw std::runtime_error("Cannot read resume list: " + file_.string());
        }
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (!line.empty()) entries_.insert(line);
        }
        Logger::log(LogLevel::Info, "Resume list has " + std::to_string(entries_.size()) + " entries", "resume");
    }
    out_.open(file_, std::ios::app);
    if (!out_) {
        throw std::runtime_error("Cannot open resume list for writing: " + file_.string());
    }
}

bool ProcessedList::contains(const fs::path& path) const {
    std::lock_guard lock(mtx_);
    return entries_.contains(key_of(path));
}

void ProcessedList::append(const fs::path& path) {
    std::lock_guard lock(mtx_);
    const auto key = key_of(path);
    if (!entries_.insert(key).second) return;
    out_ << key << "\n";
    out_.flush();
}

std::vector<fs::path> ProcessedList::filter(const std::vector<fs::path>& inputs) const {
    std::vector<fs::path> remaining;
    for (const auto& p : inputs) {
        if (contains(p)) {
            Logger::log(LogLevel::Debug, "Already processed: " + p.string(), "resume");
        } else {
            remaining.push_back(p);
        }
    }
    return remaining;
}

size_t ProcessedList::size() const {
    std::lock_guard lock(mtx_);
    return entries_.size();
}
