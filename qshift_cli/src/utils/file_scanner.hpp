#ifndef QSHIFT_FILE_SCANNER_HPP
#define QSHIFT_FILE_SCANNER_HPP

#include <vector>
#include <filesystem>

struct Settings; // forward declaration

/**
 * @brief Expands the command line inputs into a list of regular files.
 *
 * Directories are walked (recursively with -r). Junk files and paths
 * rejected by the include/exclude patterns are dropped. Duplicates are
 * removed, keeping the first occurrence.
 */
std::vector<std::filesystem::path>
collect_input_files(const std::vector<std::filesystem::path>& inputs,
                    const Settings& settings);

#endif //QSHIFT_FILE_SCANNER_HPP
