/**
 * @file quality_predictor.hpp
 * @brief Predicts an initial encoder parameter from source characteristics.
 */

#ifndef QSHIFT_QUALITY_PREDICTOR_HPP
#define QSHIFT_QUALITY_PREDICTOR_HPP

#include "media_probe.hpp"
#include "tuning.hpp"
#include <string_view>

namespace qshift {

/**
 * @brief Coarse reliability tag attached to a prediction.
 */
enum class Confidence {
    Low,    ///< Few optional characteristics were known
    Medium, ///< Core fields known, some refinements missing
    High    ///< Direct bitrate plus most refinements known
};

/// @return "low", "medium" or "high".
std::string_view to_string(Confidence confidence) noexcept;

/**
 * @brief Multiplicative factors that produced an effective bpp.
 *
 * Exposed so callers can log or display how a prediction was reached.
 */
struct BppBreakdown {
    double raw_bpp = 0.0;
    double source_efficiency = 1.0;
    double target_efficiency = 1.0;
    double gop = 1.0;
    double chroma = 1.0;
    double hdr = 1.0;
    double aspect = 1.0;
    double complexity = 1.0;
    double grain = 1.0;
    double depth = 1.0;
    double resolution = 1.0;
    double alpha = 1.0;
    double effective_bpp = 0.0;
};

/**
 * @brief Predicted parameter for one source and target.
 */
struct QualityTarget {
    double parameter = 0.0;                    ///< Predicted encoder parameter (CRF)
    Confidence confidence = Confidence::Low;   ///< Coarse tag
    double confidence_score = 0.0;             ///< Score in [0, 1] behind the tag
    BppBreakdown breakdown;                    ///< Factors used
};

/**
 * @brief Pure function object from MediaProbe to QualityTarget.
 *
 * @details The predictor normalizes the source bitrate to bits per pixel,
 * applies a chain of adjustment factors and maps the result onto the target
 * encoder's parameter curve. It has no side effects and never substitutes a
 * default for a required field.
 */
class QualityPredictor {
public:
    explicit QualityPredictor(PredictorTuning tuning = PredictorTuning::defaults());

    /**
     * @brief Predicts the starting parameter for a target encoder.
     * @param probe Source characteristics.
     * @param target Target encoder.
     * @return The prediction.
     * @throws ProbeError (MissingField) if width, height, frame rate, or both
     *         bitrate and duration are absent.
     */
    [[nodiscard]] QualityTarget predict(const MediaProbe& probe, TargetCodec target) const;

    /**
     * @brief Computes the effective bits-per-pixel with every factor applied.
     * @throws ProbeError under the same conditions as predict().
     */
    [[nodiscard]] BppBreakdown effective_bpp(const MediaProbe& probe, TargetCodec target) const;

    /**
     * @brief Maps an effective bpp onto the parameter curve of a target.
     *
     * Applies the low/high bpp clamps, rounds to 0.5 and clamps to the
     * target's valid range. Content offsets are not applied here.
     */
    [[nodiscard]] double parameter_for_bpp(double effective_bpp, TargetCodec target) const;

    /// @return Confidence score in [0, 1] from the fields present in the probe.
    [[nodiscard]] static double confidence_score(const MediaProbe& probe);

    [[nodiscard]] const PredictorTuning& tuning() const noexcept { return tuning_; }

private:
    PredictorTuning tuning_;
};

} // namespace qshift

#endif // QSHIFT_QUALITY_PREDICTOR_HPP
