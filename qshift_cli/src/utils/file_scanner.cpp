#include "file_scanner.hpp"
#include "../cli/cli_parser.hpp"
#include "../../../libqshift/include/logger.hpp"
#include <algorithm>
#include <regex>
#include <set>

namespace fs = std::filesystem;
using qshift::Logger;
using qshift::LogLevel;

static bool is_junk(const fs::path& p) {
    auto name = p.filename().string();
    if (name.starts_with("._")) {
        return true;
    }
    std::transform(name.begin(), name.end(), name.begin(), ::tolower);
    return name == ".ds_store" || name == "desktop.ini" || name == "thumbs.db";
}

namespace {
bool is_filtered(const fs::path& path, const Settings& settings) {
    const std::string path_str = path.string();

    for (const auto& pattern : settings.exclude_patterns) {
        try {
            if (std::regex_search(path_str, std::regex(pattern))) {
                return true;
            }
        } catch (const std::regex_error& e) {
            Logger::log(LogLevel::Warning, "Invalid exclude regex: " + pattern + " (" + e.what() + ")", "scanner");
        }
    }

    if (!settings.include_patterns.empty()) {
        for (const auto& pattern : settings.include_patterns) {
            try {
                if (std::regex_search(path_str, std::regex(pattern))) {
                    return false;
                }
            } catch (const std::regex_error& e) {
                Logger::log(LogLevel::Warning, "Invalid include regex: " + pattern + " (" + e.what() + ")", "scanner");
            }
        }
        return true;
    }

    return false;
}
} // namespace

std::vector<fs::path>
collect_input_files(const std::vector<fs::path>& inputs, const Settings& settings) {
    std::vector<fs::path> result;
    std::set<fs::path> seen;

    auto accept = [&](const fs::path& p) {
        if (!fs::is_regular_file(p) || is_junk(p) || is_filtered(p, settings)) return;
        std::error_code ec;
        auto canonical = fs::weakly_canonical(p, ec);
        if (ec) canonical = fs::absolute(p);
        if (seen.insert(canonical).second) result.push_back(canonical);
    };

    for (const auto& in : inputs) {
        if (!fs::exists(in)) {
            Logger::log(LogLevel::Error, "Input not found: " + in.string(), "scanner");
            continue;
        }
        if (fs::is_directory(in)) {
            std::error_code ec;
            if (settings.recursive) {
                for (auto it = fs::recursive_directory_iterator(in, fs::directory_options::skip_permission_denied, ec);
                     !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
                    accept(it->path());
                }
            } else {
                for (auto it = fs::directory_iterator(in, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
                    accept(it->path());
                }
            }
            if (ec) {
                Logger::log(LogLevel::Warning, "Error scanning " + in.string() + ": " + ec.message(), "scanner");
            }
        } else {
            accept(in);
        }
    }

    // stable order regardless of directory iteration order
    std::ranges::sort(result);

    Logger::log(LogLevel::Info,
                "Scanner collected " + std::to_string(result.size()) + " files",
                "scanner");
    return result;
}
