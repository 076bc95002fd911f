/**
 * @file calibration.hpp
 * @brief Maps fast-path parameters onto the exact path.
 */

#ifndef QSHIFT_CALIBRATION_HPP
#define QSHIFT_CALIBRATION_HPP

#include "tuning.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace qshift {

/**
 * @brief The same sample encoded at one parameter on both paths.
 */
struct CalibrationProbe {
    double parameter = 0.0;
    std::uintmax_t fast_size = 0;
    std::uintmax_t exact_size = 0;
};

/**
 * @brief Offset between the fast and exact parameter scales.
 */
struct CalibrationMapping {
    double offset = 0.0;       ///< exact = fast + offset
    double uncertainty = 0.0;  ///< Half-width of the seeded search window
    double confidence = 0.0;   ///< In [0, 1]
    size_t probes = 0;

    [[nodiscard]] double to_exact(const double fast_parameter) const noexcept { return fast_parameter + offset; }
    [[nodiscard]] double to_fast(const double exact_parameter) const noexcept { return exact_parameter - offset; }
};

/**
 * @brief Output of calibrate(). Either a mapping, or the reason there is none.
 */
struct CalibrationResult {
    std::optional<CalibrationMapping> mapping;
    std::string reason;

    [[nodiscard]] bool valid() const noexcept { return mapping.has_value(); }
};

/**
 * @brief Offset for one exact/fast size ratio, from the tuning's ratio table.
 */
[[nodiscard]] double ratio_offset(double ratio, const CalibrationTuning& tuning);

/**
 * @brief Builds a mapping from probe pairs.
 *
 * Pure. The mapping is discarded when there are no probes, when any probe
 * has a zero size on either path, or when the per-probe offsets spread
 * further than `max_offset_spread`.
 */
[[nodiscard]] CalibrationResult calibrate(std::span<const CalibrationProbe> probes,
                                          const CalibrationTuning& tuning);

/**
 * @brief Exact-path search window seeded from a fast boundary.
 */
struct SeededWindow {
    double seed = 0.0;
    double lo = 0.0;
    double hi = 0.0;
};

/**
 * @brief Seeds the exact search at fast_boundary + offset, bounded to
 * ±uncertainty and intersected with [valid_min, valid_max].
 */
[[nodiscard]] SeededWindow seeded_window(double fast_boundary, const CalibrationMapping& mapping,
                                         double valid_min, double valid_max, double precision);

} // namespace qshift

#endif // QSHIFT_CALIBRATION_HPP
