/**
 * @file tuning.hpp
 * @brief Empirically tuned constants consumed by the engine.
 *
 * @details None of these values are derived by the engine. They are data
 * supplied by the caller; the defaults below are the values the tool ships
 * with, and the CLI can override every one of them from a config file.
 */

#ifndef QSHIFT_TUNING_HPP
#define QSHIFT_TUNING_HPP

#include "media_probe.hpp"
#include <chrono>
#include <cstdint>
#include <map>

namespace qshift {

/**
 * @brief Parameter curve for one target encoder.
 *
 * parameter = base - scale * log2(effective_bpp * 100), then capped for
 * very low bpp, floored for very high bpp, and clamped to [min, max].
 */
struct CodecCurve {
    double base = 46.0;
    double scale = 5.0;
    double min = 10.0;
    double max = 35.0;
    double low_bpp_threshold = 0.02;  ///< Below this the input looks like a screen capture
    double low_bpp_cap = 35.0;        ///< Highest parameter allowed for low-bpp inputs
    double high_bpp_threshold = 2.0;  ///< Above this the input looks like an intermediate
    double high_bpp_floor = 15.0;     ///< Lowest parameter allowed for high-bpp inputs
};

/**
 * @brief Constants of the quality predictor.
 */
struct PredictorTuning {
    CodecCurve hevc{46.0, 5.0, 10.0, 35.0, 0.02, 35.0, 2.0, 15.0};
    CodecCurve av1{50.0, 6.0, 15.0, 40.0, 0.03, 35.0, 2.0, 18.0};
    CodecCurve h264{42.0, 5.0, 10.0, 35.0, 0.02, 33.0, 2.0, 14.0};

    /// Bits a codec needs relative to H.264 for the same quality (H.264 = 1.0).
    std::map<SourceCodec, double> source_efficiency;
    /// Efficiency of the target encoder relative to H.264.
    std::map<TargetCodec, double> target_efficiency;
    /// Additive parameter offset per content type.
    std::map<ContentType, double> content_offset;

    double hdr_factor = 1.25;
    double bt2020_factor = 1.15;
    double grain_factor = 1.20;
    double alpha_factor = 0.90;
    double chroma_444_factor = 1.15;
    double chroma_422_factor = 1.05;
    double chroma_rgb_factor = 1.20;
    double palette_depth_factor = 1.30; ///< 8-bit palette sources (GIF)
    /// Divisor per bit depth; depths not listed count as 8-bit.
    std::map<unsigned, double> bit_depth_factor{{10, 1.25}, {12, 1.5}, {16, 2.0}};

    /// GOP length upper bounds and their factors.
    std::map<unsigned, double> gop_factors{{1, 0.70}, {10, 0.85}, {50, 1.0}, {150, 1.15}, {300, 1.20}};
    double gop_factor_above = 1.25;     ///< GOPs longer than the last bound
    /// B-frame counts and their bonus.
    std::map<unsigned, double> b_frame_bonus{{0, 1.0}, {1, 1.05}, {2, 1.08}};
    double b_frame_bonus_above = 1.12;

    /// Resolution factor at anchor megapixel counts, interpolated linearly.
    std::map<double, double> resolution_curve{{0.0, 1.0}, {0.5, 0.95}, {2.0, 0.90}, {8.0, 0.85}};
    double resolution_floor = 0.80;     ///< Approached past the last anchor

    double wide_aspect = 2.0;           ///< Width / height above this is wide
    double wide_aspect_factor = 1.04;
    double ultra_wide_aspect = 2.5;
    double ultra_wide_aspect_factor = 1.08;
    double tall_aspect = 0.5;           ///< Width / height below this is tall
    double tall_aspect_factor = 1.08;

    /// Typical bpp of an encode with more pixels than the key.
    std::map<std::uint64_t, double> expected_bpp{
        {0, 0.50}, {500'000, 0.30}, {2'000'000, 0.20}, {8'000'000, 0.15}};
    double complexity_high_ratio = 2.0; ///< raw / expected bpp from which complexity saturates
    double complexity_max_factor = 1.15;
    double complexity_low_ratio = 0.5;  ///< raw / expected bpp below which content looks simple
    double complexity_low_factor = 0.95;

    double safe_bpp_min = 1e-6;
    double safe_bpp_max = 50.0;

    /// @return The curve for a target codec.
    [[nodiscard]] const CodecCurve& curve(TargetCodec target) const noexcept;

    /// @return Default tables.
    static PredictorTuning defaults();
};

/**
 * @brief Constants of the fast-path/exact-path calibration.
 */
struct CalibrationTuning {
    double coarse_step = 4.0;          ///< Step of the fast-path coarse search
    double probe_spread = 2.0;         ///< Distance of the side probes from the boundary
    double sample_secs = 10.0;         ///< Duration of the fast-path sample
    double min_uncertainty = 1.0;      ///< Lower bound of the uncertainty band
    double max_offset_spread = 2.0;    ///< Probe offsets further apart than this are inconsistent
    double default_offset = 2.5;       ///< Offset used when the fast path has no reference
    /// Size ratio (exact / fast) upper bounds and the offsets they map to.
    std::map<double, double> ratio_offsets{{0.70, 4.0}, {0.80, 3.5}, {0.90, 3.0}};
    double ratio_offset_above = 2.5;   ///< Offset for ratios above the last bound
};

/**
 * @brief Weights and thresholds of the quality verifier.
 */
struct VerifierTuning {
    double psnr_norm_db = 50.0;            ///< PSNR mapped to [0, 1] as psnr / psnr_norm_db
    double ms_ssim_weight = 0.80;          ///< Weight of the primary when it is MS-SSIM
    double ssim_all_weight = 0.75;         ///< Weight of the primary when it is SSIM (all channels)
    double ssim_y_weight = 0.70;           ///< Weight of the primary when it is SSIM (luma)

    double short_duration_secs = 60.0;     ///< Below: short content class
    double long_duration_secs = 300.0;     ///< From here: long content class

    double fused_quality_short = 0.93;     ///< Fused threshold, quality-priority, short
    double fused_quality_normal = 0.92;
    double fused_quality_long = 0.91;
    double fused_standard_short = 0.91;    ///< Fused threshold, other strategies, short
    double fused_standard_normal = 0.90;
    double fused_standard_long = 0.89;
    double relaxed_delta = 0.02;           ///< Subtracted under the explicit relaxed opt-in

    double epsilon = 1e-4;                 ///< Tolerance on every threshold comparison
};

/**
 * @brief Stall detection windows for external processes.
 */
struct HeartbeatTuning {
    std::chrono::milliseconds warn_after{30'000};  ///< Silence before a warning
    std::chrono::milliseconds kill_after{600'000}; ///< Silence before the process is killed
    std::chrono::milliseconds tick{500};           ///< Monitor wake-up interval
};

/**
 * @brief Search constants shared by every strategy.
 */
struct SearchTuning {
    double abs_min = 10.0;              ///< Lowest parameter any encoder accepts here
    double abs_max = 51.0;              ///< Highest parameter any encoder accepts here
    double precision = 0.5;             ///< Quantization and termination step
    double plateau_epsilon = 2e-4;      ///< Quality delta treated as no gain
    unsigned normal_zero_gains = 4;
    unsigned ultimate_zero_gains = 8;
    unsigned long_zero_gains = 3;
    double long_duration_secs = 300.0;
    unsigned min_iterations = 10;       ///< Lower clamp of the derived iteration ceiling
    unsigned max_iterations = 60;       ///< Upper clamp of the derived iteration ceiling
};

/**
 * @brief Every tunable constant of the engine.
 */
struct Tuning {
    PredictorTuning predictor = PredictorTuning::defaults();
    CalibrationTuning calibration;
    VerifierTuning verifier;
    HeartbeatTuning heartbeat;
    SearchTuning search;
};

} // namespace qshift

#endif // QSHIFT_TUNING_HPP
