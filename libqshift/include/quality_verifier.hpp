/**
 * @file quality_verifier.hpp
 * @brief Metric fallback chain and fused-score verdict for a candidate.
 */

#ifndef QSHIFT_QUALITY_VERIFIER_HPP
#define QSHIFT_QUALITY_VERIFIER_HPP

#include "call_context.hpp"
#include "event_bus.hpp"
#include "metric_tool.hpp"
#include "quality_report.hpp"
#include "search_config.hpp"
#include "tuning.hpp"
#include <filesystem>
#include <optional>

namespace qshift {

/**
 * @brief Inputs of one verification.
 */
struct VerifyRequest {
    std::filesystem::path reference;
    std::filesystem::path candidate;
    bool palette = false;                  ///< Source uses an indexed-palette layout
    std::optional<double> duration_secs;   ///< Selects the duration class
    Strategy strategy = QualityMatch{};
    QualityThresholds thresholds;
};

/**
 * @brief Runs MS-SSIM, then all-channel SSIM, then luma SSIM until one works.
 *
 * @details The chain never skips silently: every step down is logged, noted
 * in the report and published as a MetricFallbackEvent. PSNR is measured as
 * a secondary metric; when it is available the primary and PSNR are fused
 * and the fused score must also clear a threshold chosen by duration class
 * and strategy.
 */
class QualityVerifier {
public:
    explicit QualityVerifier(IMetricTool& metric, VerifierTuning tuning = {}, EventBus* bus = nullptr);

    /**
     * @brief Verifies a candidate against its reference.
     * @throws QualityUnverifiable if no metric in the chain produced a value.
     * @throws OperationCancelled on a stop request.
     */
    QualityReport verify(const VerifyRequest& request, const CallContext& ctx);

    /// @return Weight of the primary metric in the fused score.
    [[nodiscard]] double weight_for(MetricKind primary) const noexcept;

    /// @return w * primary + (1 - w) * clamp(psnr / psnr_norm_db, 0, 1).
    [[nodiscard]] double fuse(MetricKind primary, double value, double psnr) const noexcept;

    /// @return Fused threshold for a duration class and strategy.
    [[nodiscard]] double fused_threshold(std::optional<double> duration_secs, bool quality_priority,
                                         bool relaxed) const noexcept;

    [[nodiscard]] const VerifierTuning& tuning() const noexcept { return tuning_; }

private:
    IMetricTool& metric_;
    VerifierTuning tuning_;
    EventBus* bus_;
};

} // namespace qshift

#endif // QSHIFT_QUALITY_VERIFIER_HPP
