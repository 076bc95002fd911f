/**
 * @file quality_report.hpp
 * @brief Metric identifiers and the verdict produced by the quality verifier.
 */

#ifndef QSHIFT_QUALITY_REPORT_HPP
#define QSHIFT_QUALITY_REPORT_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qshift {

/**
 * @brief Perceptual metrics the metric capability can compute.
 */
enum class MetricKind {
    MsSsim,  ///< Multi-scale structural similarity
    SsimAll, ///< Single-scale SSIM over all channels
    SsimY,   ///< Single-scale SSIM over luma only
    Psnr     ///< Peak signal-to-noise ratio, in dB
};

/// @return "ms-ssim", "ssim-all", "ssim-y" or "psnr".
std::string_view to_string(MetricKind kind) noexcept;

/**
 * @brief Result of verifying one candidate artifact.
 */
struct QualityReport {
    bool passed = false;
    MetricKind path = MetricKind::SsimAll;       ///< Primary metric that actually ran
    std::map<MetricKind, double> readings;       ///< Every metric that produced a value
    double floor = 0.0;                          ///< Floor applied to the primary reading
    std::optional<double> fused_score;           ///< Present when primary and PSNR both ran
    std::optional<double> fused_threshold;       ///< Threshold the fused score was held to
    std::vector<std::string> notes;              ///< One entry per fallback step taken

    /// @return The primary reading. The verifier guarantees it exists.
    [[nodiscard]] double primary() const { return readings.at(path); }

    /// @return One-line description with path, readings and thresholds.
    [[nodiscard]] std::string summary() const;
};

} // namespace qshift

#endif // QSHIFT_QUALITY_REPORT_HPP
