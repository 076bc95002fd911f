#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <stdexcept>

namespace {
// helper for validating names against a parse function
template <typename Parse>
CLI::Validator name_validator(const std::string& kind, Parse parse, const std::string& allowed) {
    return CLI::Validator(
        [kind, parse, allowed](const std::string& str) {
            if (!parse(str)) {
                return "Invalid " + kind + ": '" + str + "'. Must be one of: " + allowed + ".";
            }
            return std::string(); // ok
        },
        kind);
}

std::chrono::milliseconds seconds_to_ms(const double secs) {
    return std::chrono::milliseconds(static_cast<long long>(secs * 1000.0));
}
} // namespace

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");
    app.set_config("--config", "", "Read options and tuning constants from an INI/TOML file.");

    // --- Flags (booleans) ---
    app.add_flag("-r,--recursive", settings.recursive,
                 "Recursively scan input folders.");

    app.add_flag("--dry-run", settings.dry_run,
                 "Run the full search and verification without writing any file.");

    app.add_flag("--in-place", settings.in_place,
                 "Replace the source when the output would take its name.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress, results table).");

    app.add_flag("--compat", settings.compat,
                 "Re-encode Apple-incompatible modern sources (AV1, VP9, VVC) for compatibility.");

    app.add_flag("--relaxed", settings.relaxed,
                 "Accept the lower fused quality thresholds.");

    app.add_flag("--force-ms-ssim", settings.force_ms_ssim,
                 "Run MS-SSIM even on long inputs.");

    app.add_flag("--film-grain", settings.film_grain,
                 "Treat every input as grainy content.");

    app.add_flag("--no-mime-check", settings.no_mime_check,
                 "Probe every input, even if it doesn't look like video.");

    // --- Conversion ---
    app.add_option("--intent", settings.intent,
                   "What to optimize for: compress, explore, match-quality, ultimate.")
        ->default_val("explore")
        ->check(CLI::IsMember({"compress", "explore", "match-quality", "ultimate"}, CLI::ignore_case));

    app.add_option("--strategy", settings.strategy,
                   "Explicit search strategy (overrides --intent): compress, size-only, quality-match,\n"
                   "precise-quality, precise-quality-compress, compress-quality, ultimate.")
        ->check(name_validator("strategy", [](const std::string& s) { return qshift::parse_strategy(s).has_value(); },
                               "compress, size-only, quality-match, precise-quality, precise-quality-compress, "
                               "compress-quality, ultimate"));

    app.add_option("--target", settings.target, "Target codec: hevc, av1, h264.")
        ->default_val("hevc")
        ->check(name_validator("target", [](const std::string& s) { return qshift::parse_target_codec(s).has_value(); },
                               "hevc, av1, h264"));

    app.add_option("--content", settings.content,
                   "Content hint: live-action, animation, screen, gaming, film-grain.")
        ->check(name_validator("content", [](const std::string& s) { return qshift::parse_content_type(s).has_value(); },
                               "live-action, animation, screen, gaming, film-grain"));

    app.add_option("--tolerance", settings.tolerance_pct,
                   "Accept outputs up to PCT percent larger than the input.")
        ->check(CLI::Range(0.0, 100.0));

    app.add_option("--fast-path", settings.fast_path,
                   "Approximate encoder for coarse search: vaapi, nvenc, videotoolbox, sample.")
        ->check(name_validator("fast path", [](const std::string& s) { return qshift::parse_encoder_backend(s).has_value(); },
                               "vaapi, nvenc, videotoolbox, sample"));

    app.add_option("--sample-secs", settings.sample_secs,
                   "Length of the fast-path sample, in seconds.")
        ->check(CLI::PositiveNumber);

    app.add_option("--preset", settings.preset, "Encoder preset for the exact path.")
        ->default_val("medium");

    app.add_option("--vaapi-device", settings.vaapi_device, "VAAPI render node.");

    // --- Quality floor ---
    app.add_option("--min-ssim", settings.min_ssim, "Floor for SSIM.")
        ->default_val(settings.min_ssim)
        ->check(CLI::Range(0.0, 1.0));
    app.add_option("--min-psnr", settings.min_psnr, "Floor for PSNR in dB.")
        ->default_val(settings.min_psnr)
        ->check(CLI::Range(0.0, 100.0));
    app.add_option("--min-ms-ssim", settings.min_ms_ssim, "Floor for MS-SSIM.")
        ->default_val(settings.min_ms_ssim)
        ->check(CLI::Range(0.0, 1.0));

    // --- Search bounds ---
    app.add_option("--min-param", settings.min_param, "Lowest encoder parameter (CRF) to try.")
        ->default_val(settings.min_param)
        ->check(CLI::Range(0.0, 63.0));
    app.add_option("--max-param", settings.max_param, "Highest encoder parameter (CRF) to try.")
        ->default_val(settings.max_param)
        ->check(CLI::Range(0.0, 63.0));
    app.add_option("--precision", settings.precision,
                   "Search step (default 0.5, 1.0 for av1).")
        ->check(CLI::PositiveNumber);
    app.add_option("--max-iterations", settings.max_iterations,
                   "Encode ceiling per file (0 derives it from the range).");
    app.add_option("--plateau-epsilon", settings.plateau_epsilon,
                   "Quality gain treated as no gain.")
        ->default_val(settings.plateau_epsilon);
    app.add_option("--zero-gains", settings.zero_gains,
                   "Consecutive sub-epsilon gains that end a quality walk (0 derives it).");

    // --- Output ---
    app.add_option("-o,--output", settings.output_dir,
                   "Write converted files to DIR instead of next to the source.");

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
        ->take_last(); // if used multiple times, take the last one

    app.add_option("--resume", settings.resume_path,
                   "Processed-files list: skip listed inputs and append finished ones.");

    // calculate default thread count
    settings.num_threads = std::max(1U, std::thread::hardware_concurrency() / 2);
    app.add_option("--threads", settings.num_threads,
                   "Files converted in parallel.")
        ->default_val(settings.num_threads)
        ->check(CLI::PositiveNumber);

    app.add_option("--encoder-threads", settings.encoder_threads,
                   "Threads per encoder process (0 lets ffmpeg decide).");

    app.add_option("--ffmpeg", settings.ffmpeg, "ffmpeg binary to run.")
        ->default_val("ffmpeg");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
        ->default_val("INFO")
        ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Log file (default: qshift.log).")
        ->default_val("qshift.log");

    app.add_option("--heartbeat-warn", settings.heartbeat_warn_secs,
                   "Seconds without encoder progress before a warning.")
        ->default_val(settings.heartbeat_warn_secs)
        ->check(CLI::PositiveNumber);
    app.add_option("--heartbeat-kill", settings.heartbeat_kill_secs,
                   "Seconds without encoder progress before the encoder is killed.")
        ->default_val(settings.heartbeat_kill_secs)
        ->check(CLI::PositiveNumber);

    app.add_option("--include", settings.include_patterns,
                   "Process only files matching regex PATTERN. (Can be used multiple times).");

    app.add_option("--exclude", settings.exclude_patterns,
                   "Do not process files matching regex PATTERN. (Can be used multiple times).");

    // --- Tuning constants, usually set from --config ---
    auto& t = settings.tuning;
    const std::string tuning_group = "Tuning";
    app.add_option("--calibration-coarse-step", t.calibration.coarse_step)->group(tuning_group);
    app.add_option("--calibration-probe-spread", t.calibration.probe_spread)->group(tuning_group);
    app.add_option("--calibration-sample-secs", t.calibration.sample_secs)->group(tuning_group);
    app.add_option("--calibration-min-uncertainty", t.calibration.min_uncertainty)->group(tuning_group);
    app.add_option("--calibration-max-offset-spread", t.calibration.max_offset_spread)->group(tuning_group);
    app.add_option("--calibration-offset-above", t.calibration.ratio_offset_above)->group(tuning_group);
    app.add_option("--verifier-psnr-norm", t.verifier.psnr_norm_db)->group(tuning_group);
    app.add_option("--verifier-ms-ssim-weight", t.verifier.ms_ssim_weight)->group(tuning_group);
    app.add_option("--verifier-ssim-all-weight", t.verifier.ssim_all_weight)->group(tuning_group);
    app.add_option("--verifier-ssim-y-weight", t.verifier.ssim_y_weight)->group(tuning_group);
    app.add_option("--verifier-short-secs", t.verifier.short_duration_secs)->group(tuning_group);
    app.add_option("--verifier-long-secs", t.verifier.long_duration_secs)->group(tuning_group);
    app.add_option("--verifier-fused-quality-short", t.verifier.fused_quality_short)->group(tuning_group);
    app.add_option("--verifier-fused-quality-normal", t.verifier.fused_quality_normal)->group(tuning_group);
    app.add_option("--verifier-fused-quality-long", t.verifier.fused_quality_long)->group(tuning_group);
    app.add_option("--verifier-fused-standard-short", t.verifier.fused_standard_short)->group(tuning_group);
    app.add_option("--verifier-fused-standard-normal", t.verifier.fused_standard_normal)->group(tuning_group);
    app.add_option("--verifier-fused-standard-long", t.verifier.fused_standard_long)->group(tuning_group);
    app.add_option("--verifier-relaxed-delta", t.verifier.relaxed_delta)->group(tuning_group);
    app.add_option("--predictor-hdr-factor", t.predictor.hdr_factor)->group(tuning_group);
    app.add_option("--predictor-bt2020-factor", t.predictor.bt2020_factor)->group(tuning_group);
    app.add_option("--predictor-grain-factor", t.predictor.grain_factor)->group(tuning_group);
    app.add_option("--predictor-alpha-factor", t.predictor.alpha_factor)->group(tuning_group);
    app.add_option("--predictor-gop-factor-above", t.predictor.gop_factor_above)->group(tuning_group);
    app.add_option("--predictor-b-frame-bonus-above", t.predictor.b_frame_bonus_above)->group(tuning_group);
    app.add_option("--predictor-resolution-floor", t.predictor.resolution_floor)->group(tuning_group);
    app.add_option("--predictor-wide-aspect-factor", t.predictor.wide_aspect_factor)->group(tuning_group);
    app.add_option("--predictor-ultra-wide-aspect-factor", t.predictor.ultra_wide_aspect_factor)->group(tuning_group);
    app.add_option("--predictor-tall-aspect-factor", t.predictor.tall_aspect_factor)->group(tuning_group);
    app.add_option("--predictor-complexity-max", t.predictor.complexity_max_factor)->group(tuning_group);
    app.add_option("--predictor-complexity-low", t.predictor.complexity_low_factor)->group(tuning_group);
    app.add_option("--predictor-hevc-base", t.predictor.hevc.base)->group(tuning_group);
    app.add_option("--predictor-hevc-scale", t.predictor.hevc.scale)->group(tuning_group);
    app.add_option("--predictor-av1-base", t.predictor.av1.base)->group(tuning_group);
    app.add_option("--predictor-av1-scale", t.predictor.av1.scale)->group(tuning_group);
    app.add_option("--predictor-h264-base", t.predictor.h264.base)->group(tuning_group);
    app.add_option("--predictor-h264-scale", t.predictor.h264.scale)->group(tuning_group);
    app.add_option("--search-abs-min", t.search.abs_min)->group(tuning_group);
    app.add_option("--search-abs-max", t.search.abs_max)->group(tuning_group);
    app.add_option("--search-long-secs", t.search.long_duration_secs)->group(tuning_group);
    app.add_option("--search-min-iterations", t.search.min_iterations)->group(tuning_group);
    app.add_option("--search-max-iterations", t.search.max_iterations)->group(tuning_group);

    // --- Positional Arguments ---
    app.add_option("inputs", settings.inputs, "One or more files or directories.")
        ->required()
        ->check(CLI::ExistingPath);

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (settings.min_param >= settings.max_param) {
            throw CLI::ValidationError("--min-param must be lower than --max-param.");
        }
        if (settings.dry_run && settings.output_dir) {
            throw CLI::ValidationError("--dry-run and -o, --output cannot be used together.");
        }
        if (settings.heartbeat_kill_secs <= settings.heartbeat_warn_secs) {
            throw CLI::ValidationError("--heartbeat-kill must be longer than --heartbeat-warn.");
        }
        if (!settings.fast_path.empty() && settings.fast_path == "software") {
            throw CLI::ValidationError("--fast-path needs an approximate backend, not 'software'.");
        }
    });
}

qshift::Tuning make_tuning(const Settings& settings) {
    qshift::Tuning tuning = settings.tuning;
    tuning.heartbeat.warn_after = seconds_to_ms(settings.heartbeat_warn_secs);
    tuning.heartbeat.kill_after = seconds_to_ms(settings.heartbeat_kill_secs);
    return tuning;
}

qshift::ExecutorOptions make_executor_options(const Settings& settings) {
    qshift::ExecutorOptions options;

    const auto target = qshift::parse_target_codec(settings.target);
    if (!target) throw std::invalid_argument("unknown target: " + settings.target);
    options.target = *target;

    auto strategy = settings.strategy.empty() ? qshift::strategy_for_intent(settings.intent)
                                              : qshift::parse_strategy(settings.strategy);
    if (!strategy) {
        throw std::invalid_argument("unknown strategy: " + (settings.strategy.empty() ? settings.intent : settings.strategy));
    }

    auto& search = options.search;
    search.strategy = *strategy;
    search.min_param = settings.min_param;
    search.max_param = settings.max_param;
    search.precision = settings.precision.value_or(*target == qshift::TargetCodec::Av1 ? 1.0 : 0.5);
    search.max_iterations = settings.max_iterations;
    search.plateau_epsilon = settings.plateau_epsilon;
    search.required_zero_gains = settings.zero_gains;
    search.sample_secs = settings.sample_secs;
    search.size.tolerance_pct = settings.tolerance_pct;
    search.quality.min_ssim = settings.min_ssim;
    search.quality.min_psnr = settings.min_psnr;
    search.quality.min_ms_ssim = settings.min_ms_ssim;
    search.quality.relaxed = settings.relaxed;
    search.quality.force_ms_ssim_long = settings.force_ms_ssim;

    options.codec_policy.compat = settings.compat;
    options.commit.dry_run = settings.dry_run;
    options.commit.in_place = settings.in_place;
    options.commit.output_dir = settings.output_dir;
    if (!settings.content.empty()) options.content = qshift::parse_content_type(settings.content);
    if (settings.film_grain) options.film_grain = true;
    options.check_mime = !settings.no_mime_check;
    options.threads = settings.num_threads;
    return options;
}

qshift::FfmpegEncoderOptions make_exact_encoder_options(const Settings& settings) {
    qshift::FfmpegEncoderOptions options;
    options.ffmpeg = settings.ffmpeg.string();
    options.target = qshift::parse_target_codec(settings.target).value_or(qshift::TargetCodec::Hevc);
    options.backend = qshift::EncoderBackend::Software;
    options.threads = settings.encoder_threads;
    options.preset = settings.preset;
    return options;
}

std::optional<qshift::FfmpegEncoderOptions> make_fast_encoder_options(const Settings& settings) {
    if (settings.fast_path.empty()) return std::nullopt;
    auto options = make_exact_encoder_options(settings);
    options.backend = qshift::parse_encoder_backend(settings.fast_path).value_or(qshift::EncoderBackend::Software);
    options.fast_path = true;
    options.vaapi_device = settings.vaapi_device;
    if (options.backend == qshift::EncoderBackend::Software) options.preset = "ultrafast";
    return options;
}
