/**
 * @file file_utils.hpp
 * @brief Temporary work directories and small file helpers.
 */

#ifndef QSHIFT_FILE_UTILS_HPP
#define QSHIFT_FILE_UTILS_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace qshift {

    /**
     * @brief Creates a unique temporary directory for one file's trials.
     *
     * The directory is created under `base` (the system temp directory when
     * empty) as "qshift-{prefix}/{stem}_{random_suffix}".
     *
     * @param input_path The input file (used for its stem).
     * @param prefix Short prefix, e.g. "search" or "metric".
     * @param base Parent directory.
     * @return The created directory.
     * @throws std::filesystem::filesystem_error if it cannot be created.
     */
    std::filesystem::path make_work_dir_for(const std::filesystem::path& input_path,
                                            const std::string& prefix,
                                            const std::filesystem::path& base = {});

    /**
     * @brief Recursively removes a directory and logs any errors.
     */
    void cleanup_work_dir(const std::filesystem::path& dir, std::string_view tag = "FileUtils");

    /**
     * @brief Removes a single file if it exists, logging failures at Warning.
     */
    void remove_quietly(const std::filesystem::path& file, std::string_view tag = "FileUtils");

    /// @return Size of a regular file, or std::nullopt if it does not exist or is unreadable.
    std::optional<std::uintmax_t> file_size_if_exists(const std::filesystem::path& file);

    /**
     * @brief Reads a whole text file.
     * @throws std::runtime_error if the file cannot be opened.
     */
    std::string read_text_file(const std::filesystem::path& file);

    /**
     * @brief Owns a work directory and removes it on destruction.
     */
    class ScopedWorkDir {
    public:
        ScopedWorkDir(const std::filesystem::path& input_path, const std::string& prefix,
                      const std::filesystem::path& base = {})
            : dir_(make_work_dir_for(input_path, prefix, base)) {}
        ~ScopedWorkDir() { cleanup_work_dir(dir_); }

        ScopedWorkDir(const ScopedWorkDir&) = delete;
        ScopedWorkDir& operator=(const ScopedWorkDir&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return dir_; }

    private:
        std::filesystem::path dir_;
    };

} // namespace qshift

#endif // QSHIFT_FILE_UTILS_HPP
