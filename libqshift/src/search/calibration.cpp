#include "../../include/calibration.hpp"
#include "../../include/trial_cache.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>

namespace qshift {

double ratio_offset(const double ratio, const CalibrationTuning& tuning) {
    for (const auto& [bound, offset] : tuning.ratio_offsets) {
        if (ratio < bound) return offset;
    }
    return tuning.ratio_offset_above;
}

CalibrationResult calibrate(const std::span<const CalibrationProbe> probes,
                            const CalibrationTuning& tuning) {
    if (probes.empty()) {
        return {std::nullopt, "no calibration probes"};
    }

    std::vector<double> offsets;
    offsets.reserve(probes.size());
    for (const auto& probe : probes) {
        if (probe.fast_size == 0 || probe.exact_size == 0) {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(1)
                << "zero-sized probe at " << probe.parameter
                << " (fast " << probe.fast_size << ", exact " << probe.exact_size << ")";
            return {std::nullopt, oss.str()};
        }
        const double ratio = static_cast<double>(probe.exact_size) / static_cast<double>(probe.fast_size);
        offsets.push_back(ratio_offset(ratio, tuning));
    }

    const auto [lo, hi] = std::minmax_element(offsets.begin(), offsets.end());
    const double spread = *hi - *lo;
    if (spread > tuning.max_offset_spread) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2)
            << "inconsistent probes: offsets spread " << spread
            << " > " << tuning.max_offset_spread;
        return {std::nullopt, oss.str()};
    }

    double sum = 0.0;
    for (const double o : offsets) sum += o;

    CalibrationMapping mapping;
    mapping.offset = sum / static_cast<double>(offsets.size());
    mapping.uncertainty = std::max(tuning.min_uncertainty, spread);
    mapping.confidence = offsets.size() == 1 ? 0.75 : 0.85;
    mapping.probes = offsets.size();
    return {mapping, {}};
}

SeededWindow seeded_window(const double fast_boundary, const CalibrationMapping& mapping,
                           const double valid_min, const double valid_max, const double precision) {
    SeededWindow w;
    w.seed = std::clamp(quantize(mapping.to_exact(fast_boundary), precision), valid_min, valid_max);
    w.lo = std::max(valid_min, quantize(w.seed - mapping.uncertainty, precision));
    w.hi = std::min(valid_max, quantize(w.seed + mapping.uncertainty, precision));
    return w;
}

} // namespace qshift
