/**
 * @file search_config.hpp
 * @brief Strategy variants and the parameters of one search.
 */

#ifndef QSHIFT_SEARCH_CONFIG_HPP
#define QSHIFT_SEARCH_CONFIG_HPP

#include "quality_report.hpp"
#include "tuning.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace qshift {

/// Lowest parameter whose output is smaller than the input.
struct CompressOnly {};
/// Single most-compressive trial at the upper bound. No quality floor.
struct SizeOnly {};
/// One trial at the predicted parameter, then verification.
struct QualityMatch {};
/// Highest parameter whose quality stays within epsilon of the best.
struct PreciseQualityMatch {};
/// Best quality that still compresses.
struct PreciseQualityMatchWithCompression {};
/// CompressOnly followed by verification against the floor.
struct CompressWithQuality {};
/// As PreciseQualityMatchWithCompression, continued until gains plateau.
struct Ultimate {};

using Strategy = std::variant<CompressOnly, SizeOnly, QualityMatch, PreciseQualityMatch,
                              PreciseQualityMatchWithCompression, CompressWithQuality, Ultimate>;

/// @return Kebab-case name, e.g. "precise-quality-compress".
[[nodiscard]] std::string_view strategy_name(const Strategy& strategy) noexcept;

/// @return The strategy for a name produced by strategy_name(), or std::nullopt.
[[nodiscard]] std::optional<Strategy> parse_strategy(std::string_view name);

/**
 * @brief Maps a CLI intent ("compress", "explore", "match-quality", "ultimate").
 */
[[nodiscard]] std::optional<Strategy> strategy_for_intent(std::string_view intent);

/// @return True if the final artifact must pass the quality verifier.
[[nodiscard]] bool requires_verification(const Strategy& strategy) noexcept;

/// @return True for variants that measure quality on every trial.
[[nodiscard]] bool measures_each_trial(const Strategy& strategy) noexcept;

/// @return True for variants held to the stricter fused thresholds.
[[nodiscard]] bool quality_priority(const Strategy& strategy) noexcept;

/**
 * @brief Quality floors.
 */
struct QualityThresholds {
    double min_ssim = 0.95;
    double min_psnr = 35.0;
    double min_ms_ssim = 0.90;
    bool force_ms_ssim_long = false;  ///< Run MS-SSIM even on long inputs
    bool relaxed = false;             ///< Explicit opt-in to the lower fused thresholds

    /// @return Floor for a primary metric path.
    [[nodiscard]] double floor_for(MetricKind kind) const noexcept;
};

/**
 * @brief Size acceptance rule.
 */
struct SizePolicy {
    std::optional<double> tolerance_pct;  ///< Unset means strictly smaller

    /**
     * @return output < input in strict mode, or
     *         output <= input * (1 + tolerance_pct / 100) with a tolerance.
     */
    [[nodiscard]] bool allows(std::uintmax_t output, std::uintmax_t input) const noexcept;

    /// @return "<" or "<= +N%" for messages.
    [[nodiscard]] std::string describe() const;
};

/**
 * @brief Everything one SearchEngine::run needs besides the source.
 */
struct SearchConfig {
    Strategy strategy = CompressOnly{};
    double min_param = 10.0;
    double max_param = 51.0;
    double initial = 23.0;            ///< Usually the predicted parameter
    QualityThresholds quality;
    SizePolicy size;
    unsigned max_iterations = 0;      ///< 0 derives the ceiling from the range
    double precision = 0.5;
    double plateau_epsilon = 2e-4;
    unsigned required_zero_gains = 0; ///< 0 derives it from duration and range
    std::optional<double> sample_secs; ///< Fast-path sample length; tuning default when unset
    bool best_effort_fallback = false; ///< Keep the smallest trial instead of rejecting when nothing compresses
};

/**
 * @brief Default iteration ceiling: clamp(ceil(log2(range / precision)) + 10, min, max).
 */
[[nodiscard]] unsigned derive_iteration_ceiling(double range, double precision, const SearchTuning& tuning);

/**
 * @brief Consecutive sub-epsilon gains that end a plateau walk.
 *
 * Base count by duration class (long, ultimate, normal), scaled by
 * range / 20 clamped to [0.5, 1] for narrow ranges, never below 3.
 */
[[nodiscard]] unsigned derive_zero_gains(std::optional<double> duration_secs, double range, bool ultimate,
                                         const SearchTuning& tuning);

} // namespace qshift

#endif // QSHIFT_SEARCH_CONFIG_HPP
