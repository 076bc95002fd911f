#include "report_generator.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <regex>
#include <sstream>
#include <sys/ioctl.h>
#include <unistd.h>

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

std::string strip_ansi(const std::string& s) {
    static const std::regex ansi_pattern("\033\\[[0-9;]*m");
    return std::regex_replace(s, ansi_pattern, "");
}

std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

std::string fixed(const double value, const int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

double delta_pct(const Result& r) {
    return r.size_after && r.size_before
               ? 100.0 * (1.0 - static_cast<double>(r.size_after) / static_cast<double>(r.size_before))
               : 0.0;
}

std::string colored_outcome(const std::string& outcome, const bool use_colors) {
    if (!use_colors) return outcome;
    if (outcome == "accepted") return "\033[1;32m" + outcome + "\033[0m";
    if (outcome == "best-effort") return "\033[1;33m" + outcome + "\033[0m";
    return "\033[1;31m" + outcome + "\033[0m";
}

} // namespace

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

Result make_result(const qshift::FileOutcomeEvent& event) {
    Result r;
    r.path = event.path;
    r.source_codec = std::string(qshift::to_string(event.source_codec));
    r.size_before = event.original_size;
    r.outcome = std::string(qshift::outcome_name(event.outcome));
    r.seconds = static_cast<double>(event.duration.count()) / 1000.0;
    r.parameter = "-";
    r.metric = "-";

    std::visit(overloaded{
        [&r](const qshift::Accepted& a) {
            r.size_after = a.output_size;
            r.parameter = fixed(a.parameter, 1);
            if (a.report) r.metric = std::string(qshift::to_string(a.report->path));
            r.destination = a.destination.string();
        },
        [&r](const qshift::Rejected& rej) {
            r.reason = std::string(qshift::to_string(rej.reason)) + ": " + rej.message;
        },
        [&r](const qshift::BestEffortAccepted& b) {
            r.size_after = b.output_size;
            r.parameter = fixed(b.parameter, 1);
            r.reason = b.reason;
            r.destination = b.destination.string();
        },
    }, event.outcome);
    return r;
}

void print_console_report(const std::vector<Result>& results,
                          const unsigned num_threads,
                          const double total_seconds) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    size_t max_codec = 8;
    size_t max_before = 12;
    size_t max_after = 12;
    size_t max_delta = 10;
    size_t max_param = 7;
    size_t max_metric = 8;
    size_t max_result = 13;
    for (const auto& r : results) {
        max_codec  = std::max(max_codec,  r.source_codec.size() + 2);
        max_before = std::max(max_before, std::to_string(r.size_before / 1024).size() + 2);
        max_after  = std::max(max_after,  std::to_string(r.size_after / 1024).size() + 2);
        max_param  = std::max(max_param,  r.parameter.size() + 2);
        max_metric = std::max(max_metric, r.metric.size() + 2);
    }

    const size_t fixed_cols_width = max_codec + max_before + max_after + max_delta + max_param +
                                    max_metric + max_result;
    const size_t file_col_width = term_width > fixed_cols_width + 30
                                      ? std::min<size_t>(40, term_width - fixed_cols_width - 20)
                                      : 20;

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() <= max_len ? s : s.substr(0, max_len - 4) + "... ";
    };

    std::cerr << "\n"
              << std::left << std::setw(static_cast<int>(file_col_width)) << "File"
              << std::setw(static_cast<int>(max_codec))  << "Codec"
              << std::setw(static_cast<int>(max_before)) << "Before(KB)"
              << std::setw(static_cast<int>(max_after))  << "After(KB)"
              << std::setw(static_cast<int>(max_delta))  << "Delta(%)"
              << std::setw(static_cast<int>(max_param))  << "Param"
              << std::setw(static_cast<int>(max_metric)) << "Metric"
              << std::setw(static_cast<int>(max_result)) << "Outcome"
              << "Reason"
              << "\n";

    uintmax_t total_original = 0;
    uintmax_t total_saved = 0;
    auto sorted = results;
    std::ranges::sort(sorted, [](const auto& a, const auto& b) {
        return a.path < b.path;
    });

    for (const auto& r : sorted) {
        const std::string delta = r.size_after ? fixed(delta_pct(r), 2) + "%" : "-";
        total_original += r.size_before;
        if (r.size_after && r.size_before > r.size_after)
            total_saved += r.size_before - r.size_after;

        const auto outcome = colored_outcome(r.outcome, use_colors);
        const auto padding = static_cast<int>(max_result + outcome.size() - strip_ansi(outcome).size());

        std::cerr << std::left << std::setw(static_cast<int>(file_col_width))
                  << truncate(r.path.filename().string(), file_col_width)
                  << std::setw(static_cast<int>(max_codec))  << r.source_codec
                  << std::setw(static_cast<int>(max_before)) << (r.size_before / 1024)
                  << std::setw(static_cast<int>(max_after))  << (r.size_after / 1024)
                  << std::setw(static_cast<int>(max_delta))  << delta
                  << std::setw(static_cast<int>(max_param))  << r.parameter
                  << std::setw(static_cast<int>(max_metric)) << r.metric
                  << std::setw(padding) << outcome
                  << r.reason
                  << "\n";
    }

    std::cerr << "\nTotal saved space: " << (total_saved / 1024) << " KB\n";
    if (total_original > 0) {
        const double total_pct = 100.0 * (static_cast<double>(total_saved) / static_cast<double>(total_original));
        std::cerr << "Total reduction: " << fixed(total_pct, 2) << "%\n";
    }
    std::cerr << "Total time: " << fixed(total_seconds, 2)
              << " s (" << num_threads << " thread"
              << (num_threads > 1U ? "s" : "") << ")\n";
}

bool export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "File,Codec,Before(B),After(B),Delta(%),Parameter,Metric,Outcome,Reason,Destination,Time(s)\n";

    for (const auto& r : results) {
        out << csv_escape(r.path.string()) << ","
            << csv_escape(r.source_codec) << ","
            << r.size_before << ","
            << r.size_after << ","
            << fixed(delta_pct(r), 2) << ","
            << csv_escape(r.parameter) << ","
            << csv_escape(r.metric) << ","
            << csv_escape(r.outcome) << ","
            << csv_escape(r.reason) << ","
            << csv_escape(r.destination) << ","
            << fixed(r.seconds, 2) << "\n";
    }

    out << "\n\nTotal amount of time\n";
    out << fixed(total_seconds, 2) << " seconds\n";
    return static_cast<bool>(out);
}

bool is_error(const qshift::ConversionOutcome& outcome) {
    const auto* rejected = std::get_if<qshift::Rejected>(&outcome);
    if (!rejected) return false;
    switch (rejected->reason) {
        case qshift::RejectReason::ProbeFailed:
        case qshift::RejectReason::EncodeFailed:
        case qshift::RejectReason::CommitFailed:
        case qshift::RejectReason::QualityUnverifiable:
        case qshift::RejectReason::Cancelled:
            return true;
        default:
            return false;
    }
}

int exit_code_for(const std::vector<qshift::FileResult>& outcomes, const bool single_file) {
    if (single_file && outcomes.size() == 1) {
        return qshift::is_committed(outcomes.front().outcome) ? 0 : 1;
    }
    const bool all_failed = std::all_of(outcomes.begin(), outcomes.end(),
                                        [](const qshift::FileResult& r) { return is_error(r.outcome); });
    return all_failed ? 1 : 0;
}
