/**
 * @file search_engine.hpp
 * @brief Bounded parameter search over the exact encoder.
 */

#ifndef QSHIFT_SEARCH_ENGINE_HPP
#define QSHIFT_SEARCH_ENGINE_HPP

#include "calibration.hpp"
#include "call_context.hpp"
#include "conversion_outcome.hpp"
#include "encoder.hpp"
#include "event_bus.hpp"
#include "media_probe.hpp"
#include "metric_tool.hpp"
#include "search_config.hpp"
#include "trial_cache.hpp"
#include "tuning.hpp"
#include <filesystem>
#include <optional>
#include <vector>

namespace qshift {

/**
 * @brief What a search produced.
 *
 * Either `winner` is set and `artifact` holds exactly its bytes, or
 * `rejection` says why nothing qualified.
 */
struct SearchResult {
    std::optional<EncodeTrial> winner;
    std::filesystem::path artifact;          ///< Exact-path output of the winner
    std::uintmax_t artifact_size = 0;        ///< Re-measured size of `artifact`
    bool reencoded = false;                  ///< True if a final re-encode produced `artifact`
    bool below_size_policy = false;          ///< Winner is the fallback smallest trial; nothing compressed
    std::optional<Rejected> rejection;
    unsigned iterations = 0;                 ///< Encoder invocations counted against the ceiling
    std::vector<EncodeTrial> trials;         ///< Every exact-cache trial, ordered by parameter
    std::optional<CalibrationMapping> calibration;
};

/**
 * @brief Drives the encode capability through one strategy.
 *
 * @details Phases: init, then coarse and calibrate when a fast encoder is
 * available, then boundary, refine and finalize. All trials go through a
 * TrialCache owned by the run, so no quantized parameter is encoded twice
 * during the search. The only extra encode is the final one, when the
 * winner's bytes are no longer on disk.
 *
 * An engine instance can be reused sequentially; it holds no per-file state.
 */
class SearchEngine {
public:
    /**
     * @param exact Encoder whose output may be committed.
     * @param fast Optional approximate encoder; must report is_fast_path().
     * @param metric Metric capability for per-trial quality.
     * @param tuning Search and calibration constants.
     * @param bus Optional event sink for TrialRecordedEvent and CalibrationEvent.
     */
    SearchEngine(IEncoder& exact, IEncoder* fast, IMetricTool& metric, const Tuning& tuning,
                 EventBus* bus = nullptr);

    /**
     * @brief Runs the configured strategy for one source.
     * @param probe Source characteristics; probe.path is the encoder input.
     * @param workdir Directory for trial artifacts; must exist.
     * @param config Strategy and bounds.
     * @param ctx Cancellation and supervision for every external call.
     * @throws EncodeFailure when an exact encode fails and no fast retry is possible.
     * @throws QualityUnverifiable when no search metric can be computed.
     * @throws OperationCancelled on a stop request.
     */
    SearchResult run(const MediaProbe& probe, const std::filesystem::path& workdir,
                     const SearchConfig& config, const CallContext& ctx);

private:
    class Run;

    IEncoder& exact_;
    IEncoder* fast_;
    IMetricTool& metric_;
    SearchTuning search_tuning_;
    CalibrationTuning calibration_tuning_;
    EventBus* bus_;
};

} // namespace qshift

#endif // QSHIFT_SEARCH_ENGINE_HPP
