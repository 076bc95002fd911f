#include <atomic>
#include <chrono>
#include <clocale>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <thread>
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "utils/file_scanner.hpp"
#include "utils/processed_list.hpp"
#include "../../libqshift/include/conversion_executor.hpp"
#include "../../libqshift/include/event_bus.hpp"
#include "../../libqshift/include/events.hpp"
#include "../../libqshift/include/ffmpeg_encoder.hpp"
#include "../../libqshift/include/ffmpeg_metric_tool.hpp"
#include "../../libqshift/include/logger.hpp"
#include "../../libqshift/include/media_prober.hpp"
#include "../../libqshift/include/process_runner.hpp"

using namespace qshift;
namespace fs = std::filesystem;

namespace {

constexpr int kExitInterrupted = 130;
constexpr int kExitParseError = 2;

volatile std::sig_atomic_t interrupted = 0;

// handle ctrl+c or termination signals; the executor is stopped from a watcher thread
void signal_handler(const int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        interrupted = 1;
    }
}

void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8"};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

bool is_terminal(const ConversionOutcome& outcome) {
    const auto* rejected = std::get_if<Rejected>(&outcome);
    return !rejected || rejected->reason != RejectReason::Cancelled;
}

} // namespace

int main(int argc, char* argv[]) {

    CLI::App app{"qshift: convert videos to modern codecs, keeping only smaller and equivalent results."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        app.exit(e);
        return kExitParseError;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // set file logger
    Logger::clear_sinks();
    auto file_sink = std::make_unique<FileLogSink>(settings.log_file.string(), false);
    if (!file_sink->is_open()) {
        std::cerr << "Cannot open log file: " << settings.log_file << std::endl;
    }
    Logger::add_sink(std::move(file_sink));

    const auto console_level = Logger::string_to_level(settings.log_level);
    if (!settings.quiet && console_level) {
        auto console_sink = std::make_unique<ConsoleLogSink>();
        console_sink->log_level = *console_level;
        Logger::add_sink(std::move(console_sink));
    }
    Logger::reset_counts();
    init_utf8_locale();

    if (!program_available(settings.ffmpeg.string())) {
        Logger::log(LogLevel::Error, "ffmpeg not found: " + settings.ffmpeg.string(), "main");
        return 1;
    }

    // collect input files
    auto inputs = collect_input_files(settings.inputs, settings);

    std::optional<ProcessedList> processed;
    try {
        if (!settings.resume_path.empty()) {
            processed.emplace(settings.resume_path);
            const auto before = inputs.size();
            inputs = processed->filter(inputs);
            if (before != inputs.size()) {
                Logger::log(LogLevel::Info, "Skipping " + std::to_string(before - inputs.size()) +
                            " already processed files", "main");
            }
        }
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        return 1;
    }

    if (inputs.empty()) {
        if (processed && processed->size() > 0) {
            Logger::log(LogLevel::Info, "Nothing left to process.", "main");
            return 0;
        }
        Logger::log(LogLevel::Error, "No valid input files.", "main");
        return 1;
    }

    Tuning tuning;
    ExecutorOptions options;
    try {
        tuning = make_tuning(settings);
        options = make_executor_options(settings);
    } catch (const std::invalid_argument& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        return kExitParseError;
    }

    FfmpegEncoder exact(make_exact_encoder_options(settings));
    std::optional<FfmpegEncoder> fast;
    if (const auto fast_options = make_fast_encoder_options(settings)) {
        fast.emplace(*fast_options);
    }
    FfmpegMetricTool metric(settings.ffmpeg.string(), fs::temp_directory_path() / "qshift-metrics");
    LibavMediaProber prober;

    EventBus bus;
    std::mutex results_mtx;
    std::vector<Result> results;
    const size_t total = inputs.size();
    size_t done = 0;
    const auto start_total = std::chrono::steady_clock::now();

    bus.subscribe<FileConvertStartEvent>([&](const FileConvertStartEvent& e) {
        Logger::log(LogLevel::Info, "Converting " + e.path.filename().string(), "main");
    });

    bus.subscribe<TrialRecordedEvent>([](const TrialRecordedEvent& e) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1) << e.path.filename().string() << " [" << e.phase << "] p="
            << e.parameter << " size=" << e.size;
        if (e.quality) oss << std::setprecision(4) << " q=" << *e.quality;
        if (e.cached) oss << " (cached)";
        if (e.fast_path) oss << " (fast)";
        Logger::log(LogLevel::Debug, oss.str(), "Search");
    });

    bus.subscribe<FileOutcomeEvent>([&](const FileOutcomeEvent& e) {
        std::lock_guard lock(results_mtx);
        results.push_back(make_result(e));
        ++done;
        if (processed && is_terminal(e.outcome)) {
            processed->append(e.path);
        }
        if (!settings.quiet) {
            std::cerr << "[" << done << "/" << total << "] " << e.path.filename().string() << ": "
                      << describe(e.outcome) << std::endl;
        }
    });

    std::vector<FileResult> outcomes;
    try {
        Backends backends{prober, exact, fast ? &*fast : nullptr, metric};
        ConversionExecutor executor(backends, options, tuning, bus);

        // relays the signal flag to the executor
        std::jthread watcher([&executor](const std::stop_token& st) {
            while (!st.stop_requested()) {
                if (interrupted) {
                    std::cerr << "\n[INTERRUPT] Stop detected. Waiting for running encodes to terminate..."
                              << std::endl;
                    executor.request_stop();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });

        outcomes = executor.run(inputs);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("Fatal: ") + e.what(), "main");
        return 1;
    }

    const double total_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_total).count();

    if (!settings.quiet) {
        print_console_report(results, options.threads, total_seconds);
    }

    if (!settings.quiet) {
        const auto warnings = Logger::count(LogLevel::Warning);
        const auto errors = Logger::count(LogLevel::Error);
        if (warnings + errors > 0) {
            std::cerr << warnings << " warning(s), " << errors << " error(s); details in "
                      << settings.log_file.string() << std::endl;
        }
    }

    if (!settings.report_path.empty()) {
        if (!export_csv_report(results, settings.report_path, total_seconds)) {
            Logger::log(LogLevel::Error, "Cannot write report: " + settings.report_path.string(), "main");
        }
    }

    if (interrupted) {
        return kExitInterrupted; // standard exit code for SIGINT
    }
    // a directory holding one file is still a batch
    const bool single_file = settings.inputs.size() == 1 && fs::is_regular_file(settings.inputs.front());
    return exit_code_for(outcomes, single_file);
}
