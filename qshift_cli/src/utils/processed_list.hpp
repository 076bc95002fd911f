#ifndef QSHIFT_PROCESSED_LIST_HPP
#define QSHIFT_PROCESSED_LIST_HPP

#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Resume list: one absolute path per line.
 *
 * Loaded once at startup. Paths that reach a terminal outcome are appended
 * and flushed immediately so an interrupted batch can pick up where it
 * stopped.
 */
class ProcessedList {
public:
    /**
     * @param file List file. Created on the first append if it doesn't exist.
     * @throws std::runtime_error if the file exists but cannot be read.
     */
    explicit ProcessedList(std::filesystem::path file);

    [[nodiscard]] bool contains(const std::filesystem::path& path) const;

    /// Records a path. Thread-safe; duplicates are ignored.
    void append(const std::filesystem::path& path);

    /// @return The inputs that are not in the list yet.
    [[nodiscard]] std::vector<std::filesystem::path> filter(const std::vector<std::filesystem::path>& inputs) const;

    [[nodiscard]] size_t size() const;

private:
    std::filesystem::path file_;
    std::set<std::string> entries_;
    std::ofstream out_;
    mutable std::mutex mtx_;
};

#endif //QSHIFT_PROCESSED_LIST_HPP
