/**
 * @file ffmpeg_metric_tool.hpp
 * @brief Metric capability backed by ffmpeg's ssim, psnr and libvmaf filters.
 */

#ifndef QSHIFT_FFMPEG_METRIC_TOOL_HPP
#define QSHIFT_FFMPEG_METRIC_TOOL_HPP

#include "metric_tool.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qshift {

/**
 * @brief Runs `ffmpeg -i reference -i candidate -lavfi <graph> -f null -`.
 *
 * @details SSIM and PSNR are read from the filter summary on stderr. MS-SSIM
 * comes from libvmaf's `float_ms_ssim` feature, logged per frame as CSV and
 * averaged. All-channel SSIM retries with three filter graphs (even
 * dimensions, forced yuv420p, plain) before giving up.
 */
class FfmpegMetricTool final : public IMetricTool {
public:
    /**
     * @param ffmpeg Binary name or path.
     * @param scratch_dir Directory for libvmaf logs; the system temp dir when empty.
     */
    explicit FfmpegMetricTool(std::string ffmpeg = "ffmpeg", std::filesystem::path scratch_dir = {});

    [[nodiscard]] std::string_view get_name() const noexcept override { return "ffmpeg"; }

    double measure(const std::filesystem::path& reference,
                   const std::filesystem::path& candidate,
                   MetricKind kind,
                   const CallContext& ctx) override;

    /// @return The `All:` value of an ssim filter summary.
    [[nodiscard]] static std::optional<double> parse_ssim_all(std::string_view stderr_text);
    /// @return The `Y:` value of an ssim filter summary.
    [[nodiscard]] static std::optional<double> parse_ssim_y(std::string_view stderr_text);
    /// @return The `average:` value of a psnr filter summary; "inf" reads as 100 dB.
    [[nodiscard]] static std::optional<double> parse_psnr(std::string_view stderr_text);
    /// @return Mean of the `float_ms_ssim` column of a libvmaf CSV log.
    [[nodiscard]] static std::optional<double> parse_ms_ssim_csv(std::string_view csv);

    /// @return Filter graphs tried in order for single-scale SSIM.
    [[nodiscard]] static std::vector<std::string> ssim_graphs();

private:
    double run_ssim(const std::filesystem::path& reference, const std::filesystem::path& candidate,
                    MetricKind kind, const CallContext& ctx);
    double run_psnr(const std::filesystem::path& reference, const std::filesystem::path& candidate,
                    const CallContext& ctx);
    double run_ms_ssim(const std::filesystem::path& reference, const std::filesystem::path& candidate,
                       const CallContext& ctx);

    [[nodiscard]] std::vector<std::string> base_args(const std::filesystem::path& reference,
                                                     const std::filesystem::path& candidate,
                                                     const std::string& graph) const;

    std::string ffmpeg_;
    std::filesystem::path scratch_dir_;
};

} // namespace qshift

#endif // QSHIFT_FFMPEG_METRIC_TOOL_HPP
