#ifndef QSHIFT_REPORT_GENERATOR_HPP
#define QSHIFT_REPORT_GENERATOR_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "../../../libqshift/include/conversion_executor.hpp"
#include "../../../libqshift/include/events.hpp"

struct Result {
    std::filesystem::path path;
    std::string source_codec;   // e.g. "h264"
    uintmax_t size_before{};    // original size in bytes
    uintmax_t size_after{};     // committed size in bytes, 0 if nothing was written
    std::string parameter;      // winning parameter, "-" when rejected
    std::string metric;         // metric path of the quality report, "-" if none
    std::string outcome;        // "accepted", "best-effort" or "rejected"
    std::string reason;         // reject reason or best-effort reason
    std::string destination;    // committed path
    double seconds{};           // processing time
};

/// @return One report row for a finished file.
Result make_result(const qshift::FileOutcomeEvent& event);

void print_console_report(const std::vector<Result>& results,
                          unsigned num_threads,
                          double total_seconds);

/**
 * @brief Writes the results as CSV.
 * @return False if the file could not be opened.
 */
bool export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       double total_seconds);

unsigned get_terminal_width();

/// @return True if the file failed for a reason other than its own merits.
bool is_error(const qshift::ConversionOutcome& outcome);

/**
 * @brief Process exit code of a finished run.
 *
 * A single file given by name exits 0 only if it was committed. Any other
 * run exits 1 only if every file failed with an error.
 */
int exit_code_for(const std::vector<qshift::FileResult>& outcomes, bool single_file);

#endif //QSHIFT_REPORT_GENERATOR_HPP
