#ifndef QSHIFT_CLI_PARSER_HPP
#define QSHIFT_CLI_PARSER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "../../../libqshift/include/conversion_executor.hpp"
#include "../../../libqshift/include/ffmpeg_encoder.hpp"
#include "../../../libqshift/include/tuning.hpp"

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool recursive = false;
    bool dry_run = false;
    bool in_place = false;
    bool quiet = false;
    bool compat = false;
    bool relaxed = false;
    bool force_ms_ssim = false;
    bool film_grain = false;
    bool no_mime_check = false;

    unsigned num_threads = 1;
    unsigned encoder_threads = 0;          ///< 0 lets ffmpeg decide
    std::string log_level = "INFO";
    std::filesystem::path log_file = "qshift.log";
    std::optional<std::filesystem::path> output_dir;
    std::filesystem::path report_path;
    std::filesystem::path resume_path;
    std::filesystem::path ffmpeg = "ffmpeg";

    std::string intent = "explore";
    std::string strategy;                  ///< Overrides the intent when set
    std::string target = "hevc";
    std::string content;
    std::string fast_path;                 ///< Empty disables the approximate path
    std::string preset = "medium";
    std::string vaapi_device = "/dev/dri/renderD128";
    std::optional<double> sample_secs;
    std::optional<double> tolerance_pct;

    double min_ssim = 0.95;
    double min_psnr = 35.0;
    double min_ms_ssim = 0.90;
    double min_param = 10.0;
    double max_param = 51.0;
    std::optional<double> precision;       ///< Unset picks 0.5, or 1.0 for av1
    unsigned max_iterations = 0;
    double plateau_epsilon = 2e-4;
    unsigned zero_gains = 0;
    double heartbeat_warn_secs = 30.0;
    double heartbeat_kill_secs = 600.0;

    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;
    std::vector<std::filesystem::path> inputs;

    qshift::Tuning tuning;                 ///< Constants overridable from --config
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

/**
 * @brief Builds the engine configuration from parsed settings.
 * @throws std::invalid_argument on names that don't map to a value.
 */
qshift::ExecutorOptions make_executor_options(const Settings& settings);

/// @return Backend options for the exact encoder.
qshift::FfmpegEncoderOptions make_exact_encoder_options(const Settings& settings);

/// @return Backend options for the approximate encoder, or std::nullopt if disabled.
std::optional<qshift::FfmpegEncoderOptions> make_fast_encoder_options(const Settings& settings);

/// @return Tuning with the heartbeat windows from the command line applied.
qshift::Tuning make_tuning(const Settings& settings);

#endif //QSHIFT_CLI_PARSER_HPP
