/**
 * @file trial_cache.hpp
 * @brief Memoizes encode trials by quantized parameter.
 */

#ifndef QSHIFT_TRIAL_CACHE_HPP
#define QSHIFT_TRIAL_CACHE_HPP

#include "quality_report.hpp"
#include <cstdint>
#include <map>
#include <optional>

namespace qshift {

/**
 * @brief One encode at one parameter. Immutable once recorded.
 */
struct EncodeTrial {
    long long key = 0;              ///< Parameter quantized to the precision step
    double parameter = 0.0;         ///< Quantized parameter actually encoded
    std::uintmax_t size = 0;        ///< Artifact size in bytes
    std::optional<double> quality;  ///< Search-time quality reading, when measured
    bool fast_path = false;         ///< Produced by the approximate encoder after a failure
    std::optional<MetricKind> metric; ///< Metric behind `quality`
};

/**
 * @return The integer key of a parameter: round(parameter / precision).
 */
[[nodiscard]] long long quantize_key(double parameter, double precision) noexcept;

/**
 * @return The parameter snapped to the precision grid.
 */
[[nodiscard]] double quantize(double parameter, double precision) noexcept;

/**
 * @brief Per-search map from quantized parameter to EncodeTrial.
 *
 * @details Owned by exactly one search; no locking. Also remembers which key
 * was produced most recently, so the search knows whether the artifact on
 * disk already belongs to the winner.
 */
class TrialCache {
public:
    explicit TrialCache(double precision);

    [[nodiscard]] double precision() const noexcept { return precision_; }
    [[nodiscard]] long long key_for(double parameter) const noexcept;

    /// @return The trial recorded for the parameter's key, or nullptr.
    [[nodiscard]] const EncodeTrial* find(double parameter) const;

    /**
     * @brief Records a trial under the key of its parameter.
     *
     * An existing entry is never overwritten.
     *
     * @return The stored trial.
     */
    const EncodeTrial& record(EncodeTrial trial);

    void mark_produced(long long key) noexcept { last_produced_ = key; }
    /// Forgets the produced marker, e.g. after a failed encode removed the artifact.
    void clear_produced() noexcept { last_produced_.reset(); }
    [[nodiscard]] std::optional<long long> last_produced() const noexcept { return last_produced_; }

    [[nodiscard]] size_t size() const noexcept { return trials_.size(); }
    [[nodiscard]] const std::map<long long, EncodeTrial>& trials() const noexcept { return trials_; }

private:
    double precision_;
    std::map<long long, EncodeTrial> trials_;
    std::optional<long long> last_produced_;
};

} // namespace qshift

#endif // QSHIFT_TRIAL_CACHE_HPP
