#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace qshift {

    std::filesystem::path make_work_dir_for(const std::filesystem::path& input_path,
                                            const std::string& prefix,
                                            const std::filesystem::path& base) {
        const auto root = (base.empty() ? std::filesystem::temp_directory_path() : base) /
                          ("qshift-" + prefix);
        const std::string dir_name = input_path.stem().string() + "_" + RandomUtils::random_suffix();
        auto dir = root / dir_name;

        std::filesystem::create_directories(dir);
        Logger::log(LogLevel::Debug, "Created work dir: " + dir.string(), "FileUtils");
        return dir;
    }

    void cleanup_work_dir(const std::filesystem::path& dir, const std::string_view tag) {
        if (dir.empty()) return;
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove work dir: " + dir.string() + " (" + ec.message() + ")", tag);
        } else {
            Logger::log(LogLevel::Debug, "Removed work dir: " + dir.string(), tag);
        }
    }

    void remove_quietly(const std::filesystem::path& file, const std::string_view tag) {
        std::error_code ec;
        std::filesystem::remove(file, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove " + file.string() + " (" + ec.message() + ")", tag);
        }
    }

    std::optional<std::uintmax_t> file_size_if_exists(const std::filesystem::path& file) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(file, ec) || ec) return std::nullopt;
        const auto size = std::filesystem::file_size(file, ec);
        if (ec) return std::nullopt;
        return size;
    }

    std::string read_text_file(const std::filesystem::path& file) {
        std::ifstream in(file, std::ios::binary);
        if (!in) {
            throw std::runtime_error("cannot open " + file.string());
        }
        std::ostringstream oss;
        oss << in.rdbuf();
        return oss.str();
    }

} // namespace qshift
