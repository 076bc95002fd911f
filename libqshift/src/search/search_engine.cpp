#include "../../include/search_engine.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>

namespace qshift {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

constexpr double kGoldenFraction = 0.3819660112501051; // 1 - 1/phi
constexpr double kSlack = 1e-9;
constexpr std::array kSearchMetrics{MetricKind::SsimAll, MetricKind::SsimY};

/// Raised inside a run when the iteration ceiling is reached.
class CeilingReached : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::string fmt(const double value, const int decimals = 1) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(decimals) << value;
    return oss.str();
}

} // namespace

/**
 * @brief State of one SearchEngine::run call.
 *
 * Owns the trial cache, the iteration counter and the produced-key marker.
 * Never shared between threads.
 */
class SearchEngine::Run {
public:
    Run(SearchEngine& engine, const MediaProbe& probe, const std::filesystem::path& workdir,
        const SearchConfig& config, const CallContext& ctx)
        : engine_(engine), probe_(probe), config_(config), ctx_(ctx),
          cache_(config.precision),
          input_size_(probe.file_size),
          artifact_(workdir / ("candidate" + std::string(engine.exact_.output_extension()))),
          fast_artifact_(engine.fast_ ? workdir / ("fast" + std::string(engine.fast_->output_extension()))
                                      : std::filesystem::path{}),
          exact_sample_(workdir / ("exact_sample" + std::string(engine.exact_.output_extension()))),
          measure_(measures_each_trial(config.strategy)) {
        const auto& t = engine_.search_tuning_;
        floor_limit_ = std::min(t.abs_min, config_.min_param);
        required_zero_gains_ = config_.required_zero_gains
            ? config_.required_zero_gains
            : derive_zero_gains(probe_.duration_secs, config_.max_param - config_.min_param,
                                std::holds_alternative<Ultimate>(config_.strategy), t);
        ceiling_ = config_.max_iterations
            ? config_.max_iterations
            : derive_iteration_ceiling(config_.max_param - config_.min_param, config_.precision, t);
        if (!config_.max_iterations && std::holds_alternative<Ultimate>(config_.strategy)) {
            ceiling_ = std::min(ceiling_ + 2 * required_zero_gains_, t.max_iterations);
        }
    }

    SearchResult execute() {
        enter("init");
        Logger::log(LogLevel::Debug,
                    name() + ": " + std::string(strategy_name(config_.strategy)) + " in [" +
                    fmt(config_.min_param) + ", " + fmt(config_.max_param) + "], initial " +
                    fmt(config_.initial) + ", ceiling " + std::to_string(ceiling_) + " iterations",
                    "Search");

        std::optional<double> winner;
        try {
            winner = std::visit(overloaded{
                [this](const CompressOnly&) { return compress_only(); },
                [this](const SizeOnly&) { return size_only(); },
                [this](const QualityMatch&) { return quality_match(); },
                [this](const PreciseQualityMatch&) { return precise_quality(); },
                [this](const PreciseQualityMatchWithCompression&) { return quality_walk(false); },
                [this](const CompressWithQuality&) { return compress_only(); },
                [this](const Ultimate&) { return quality_walk(true); },
            }, config_.strategy);
        } catch (const CeilingReached& e) {
            result_.rejection = Rejected{RejectReason::IterationLimitExceeded, e.what()};
            Logger::log(LogLevel::Warning, name() + ": " + e.what(), "Search");
        }

        if (winner && !result_.rejection) {
            finalize(*winner);
        }

        result_.iterations = iterations_;
        for (const auto& [key, trial] : cache_.trials()) {
            result_.trials.push_back(trial);
        }
        enter("terminal");
        return std::move(result_);
    }

private:
    // --- Strategies ---

    std::optional<double> compress_only() {
        const auto window = calibrate_fast_path();
        const double initial = window ? window->seed : initial_parameter();
        const auto boundary = find_boundary(initial,
                                            window ? window->lo : config_.min_param,
                                            window ? window->hi : config_.max_param);
        if (!boundary) return no_compression();
        return boundary;
    }

    std::optional<double> size_only() {
        enter("boundary");
        const auto& t = trial(config_.max_param, "boundary");
        if (!compresses(t)) return no_compression();
        return t.parameter;
    }

    std::optional<double> quality_match() {
        enter("boundary");
        return trial(initial_parameter(), "boundary").parameter;
    }

    std::optional<double> precise_quality() {
        const double eps = config_.plateau_epsilon;

        enter("boundary");
        const auto& lo_trial = trial(config_.min_param, "boundary");
        const auto& hi_trial = trial(config_.max_param, "boundary");

        if (lo_trial.metric == hi_trial.metric && std::abs(*lo_trial.quality - *hi_trial.quality) < eps) {
            Logger::log(LogLevel::Debug,
                        name() + ": quality flat across the range, choosing " + fmt(hi_trial.parameter),
                        "Search");
            return hi_trial.parameter;
        }

        enter("refine");
        double lo = lo_trial.parameter;
        double hi = hi_trial.parameter;
        while (hi - lo > config_.precision + kSlack) {
            double mid = quantize(lo + (hi - lo) * kGoldenFraction, config_.precision);
            if (mid <= lo) mid = lo + config_.precision;
            if (mid >= hi) break;
            const auto& t = trial(mid, "refine");
            if (*t.quality >= best_comparable(false) - eps) {
                lo = t.parameter;
            } else {
                hi = t.parameter;
            }
        }

        const double step = 2.0 * config_.precision;
        for (const double offset : {-step, -step / 2.0, step / 2.0, step}) {
            const double p = lo + offset;
            if (p < config_.min_param - kSlack || p > config_.max_param + kSlack) continue;
            trial(p, "fine-tune");
        }

        return highest_within(best_comparable(false), config_.min_param, config_.max_param, false);
    }

    std::optional<double> quality_walk(const bool ultimate) {
        const double eps = config_.plateau_epsilon;
        const auto window = calibrate_fast_path();
        const double initial = window ? window->seed : initial_parameter();
        const auto boundary = find_boundary(initial,
                                            window ? window->lo : config_.min_param,
                                            window ? window->hi : config_.max_param);
        if (!boundary) return no_compression();

        enter("refine");
        const unsigned required = ultimate ? required_zero_gains_ : 1;
        const auto& start = trial(*boundary, "refine");
        double previous_q = *start.quality;
        auto previous_metric = start.metric;
        unsigned zero_gains = 0;

        for (double p = *boundary - config_.precision; p >= floor_limit_ - kSlack; p -= config_.precision) {
            const auto& t = trial(p, "refine");
            if (!compresses(t)) {
                Logger::log(LogLevel::Debug, name() + ": " + fmt(t.parameter) +
                            " no longer compresses, walk ends", "Search");
                break;
            }
            if (t.metric != previous_metric) {
                // Readings from different metrics are not comparable; count gains afresh.
                previous_metric = t.metric;
                previous_q = *t.quality;
                zero_gains = 0;
                continue;
            }
            const double gain = *t.quality - previous_q;
            previous_q = *t.quality;
            zero_gains = gain < eps ? zero_gains + 1 : 0;
            if (zero_gains >= required) {
                Logger::log(LogLevel::Debug, name() + ": " + std::to_string(zero_gains) +
                            " consecutive gains below " + fmt(eps, 5) + ", walk ends at " +
                            fmt(t.parameter), "Search");
                break;
            }
        }

        return highest_within(best_comparable(true), floor_limit_, config_.max_param, true);
    }

    // --- Phases ---

    /**
     * @brief Lowest compressing parameter, searching from `initial`.
     *
     * [lo_bound, hi_bound] is the preferred window; it grows to the full
     * range when its edges turn out to be on the wrong side of the boundary.
     */
    std::optional<double> find_boundary(const double initial, const double lo_bound, const double hi_bound) {
        enter("boundary");
        double lo;
        double hi;

        const auto& first = trial(initial, "boundary");
        if (compresses(first)) {
            hi = first.parameter;
            lo = lo_bound;
            if (lo_bound > config_.min_param + kSlack && lo_bound < hi) {
                const auto& edge = trial(lo_bound, "boundary");
                if (compresses(edge)) {
                    Logger::log(LogLevel::Warning, name() + ": window edge " + fmt(lo_bound) +
                                " already compresses, expanding to " + fmt(config_.min_param), "Search");
                    hi = edge.parameter;
                    lo = config_.min_param;
                }
            }
        } else {
            lo = first.parameter;
            hi = hi_bound;
            const auto& edge = trial(hi, "boundary");
            if (!compresses(edge)) {
                if (hi >= config_.max_param - kSlack) return std::nullopt;
                Logger::log(LogLevel::Warning, name() + ": window edge " + fmt(hi) +
                            " does not compress, expanding to " + fmt(config_.max_param), "Search");
                lo = edge.parameter;
                if (!compresses(trial(config_.max_param, "boundary"))) return std::nullopt;
                hi = quantize(config_.max_param, config_.precision);
            }
        }

        while (hi - lo > config_.precision + kSlack) {
            const double mid = quantize((lo + hi) / 2.0, config_.precision);
            if (mid <= lo || mid >= hi) break;
            const auto& t = trial(mid, "boundary");
            if (compresses(t)) {
                hi = t.parameter;
            } else {
                lo = t.parameter;
            }
        }

        // The lower edge is only known not to compress once it was tried.
        if (lo < hi && !cache_.find(lo)) {
            const auto& t = trial(lo, "boundary");
            if (compresses(t)) hi = t.parameter;
        }
        return hi;
    }

    std::optional<SeededWindow> calibrate_fast_path() {
        if (!engine_.fast_) return std::nullopt;
        const auto& tuning = engine_.calibration_tuning_;

        enter("coarse");
        if (!probe_.duration_secs || *probe_.duration_secs <= 0.0) {
            discard_calibration("source duration unknown");
            return std::nullopt;
        }
        const double sample = std::min(config_.sample_secs.value_or(tuning.sample_secs), *probe_.duration_secs);
        const double scaled_input = static_cast<double>(input_size_) * sample / *probe_.duration_secs;

        std::map<long long, std::uintmax_t> fast_sizes;
        auto fast_size = [&](const double p) {
            const auto key = quantize_key(p, config_.precision);
            if (const auto it = fast_sizes.find(key); it != fast_sizes.end()) return it->second;
            const auto size = engine_.fast_->encode({probe_.path, fast_artifact_, p, sample},
                                                    call("coarse", p)).size_bytes;
            fast_sizes.emplace(key, size);
            publish_trial("coarse", EncodeTrial{key, p, size, std::nullopt, true}, false);
            return size;
        };

        std::vector<CalibrationProbe> probes;
        double fast_boundary = config_.max_param;
        try {
            const double step = std::max(tuning.coarse_step, config_.precision);
            for (double p = config_.min_param; p <= config_.max_param + kSlack; p += step) {
                const double q = quantize(p, config_.precision);
                if (static_cast<double>(fast_size(q)) < scaled_input) {
                    fast_boundary = q;
                    break;
                }
            }

            enter("calibrate");
            std::vector<long long> seen;
            for (const double p : {fast_boundary - tuning.probe_spread, fast_boundary,
                                   fast_boundary + tuning.probe_spread}) {
                const double q = std::clamp(quantize(p, config_.precision), config_.min_param, config_.max_param);
                const auto key = quantize_key(q, config_.precision);
                if (std::find(seen.begin(), seen.end(), key) != seen.end()) continue;
                seen.push_back(key);
                const auto fast = fast_size(q);
                const auto exact = engine_.exact_.encode({probe_.path, exact_sample_, q, sample},
                                                         call("calibrate", q)).size_bytes;
                probes.push_back({q, fast, exact});
            }
        } catch (const EncodeFailure& e) {
            discard_calibration(std::string("calibration encode failed: ") + e.what());
            return std::nullopt;
        }
        remove_quietly(exact_sample_, "Calibration");
        remove_quietly(fast_artifact_, "Calibration");

        const auto calibration = calibrate(probes, tuning);
        if (!calibration.valid()) {
            discard_calibration(calibration.reason);
            return std::nullopt;
        }

        mapping_ = calibration.mapping;
        result_.calibration = mapping_;
        const auto window = seeded_window(fast_boundary, *mapping_, config_.min_param, config_.max_param,
                                          config_.precision);
        if (engine_.bus_) {
            engine_.bus_->publish(CalibrationEvent{probe_.path, true, mapping_->offset, mapping_->uncertainty, {}});
        }
        Logger::log(LogLevel::Info,
                    name() + ": fast boundary " + fmt(fast_boundary) + ", offset " + fmt(mapping_->offset, 2) +
                    " +/- " + fmt(mapping_->uncertainty, 2) + ", exact search seeded at " + fmt(window.seed) +
                    " in [" + fmt(window.lo) + ", " + fmt(window.hi) + "]",
                    "Calibration");
        return window;
    }

    void discard_calibration(const std::string& reason) {
        Logger::log(LogLevel::Warning,
                    name() + ": calibration discarded (" + reason + "), searching the full range [" +
                    fmt(config_.min_param) + ", " + fmt(config_.max_param) + "]",
                    "Calibration");
        if (engine_.bus_) {
            engine_.bus_->publish(CalibrationEvent{probe_.path, false, 0.0, 0.0, reason});
        }
    }

    void finalize(const double winner) {
        enter("finalize");
        const EncodeTrial* w = cache_.find(winner);
        if (!w) {
            throw std::logic_error("search winner " + fmt(winner) + " was never recorded");
        }

        const bool stale = w->fast_path || cache_.last_produced() != w->key;
        std::uintmax_t size;
        if (stale) {
            Logger::log(LogLevel::Debug, name() + ": re-encoding winner " + fmt(w->parameter), "Search");
            size = engine_.exact_.encode({probe_.path, artifact_, w->parameter, std::nullopt},
                                         call("finalize", w->parameter)).size_bytes;
            cache_.mark_produced(w->key);
            result_.reencoded = true;
            if (!w->fast_path && size != w->size) {
                Logger::log(LogLevel::Warning,
                            name() + ": re-encode at " + fmt(w->parameter) + " produced " +
                            std::to_string(size) + " bytes, cached trial had " + std::to_string(w->size) +
                            "; using the re-measured size",
                            "Search");
            }
        } else {
            const auto measured = file_size_if_exists(artifact_);
            if (!measured) {
                throw EncodeFailure(EncodeFailure::Kind::EmptyOutput,
                                    "winner artifact vanished: " + artifact_.string());
            }
            size = *measured;
        }

        result_.winner = *w;
        result_.artifact = artifact_;
        result_.artifact_size = size;
    }

    // --- Trials ---

    const EncodeTrial& trial(const double parameter, const std::string_view phase) {
        const auto& tuning = engine_.search_tuning_;
        const double p = std::clamp(quantize(parameter, config_.precision), tuning.abs_min, tuning.abs_max);

        if (const auto* hit = cache_.find(p)) {
            publish_trial(phase, *hit, true);
            return *hit;
        }

        if (iterations_ >= ceiling_) {
            throw CeilingReached("iteration ceiling " + std::to_string(ceiling_) + " reached in " +
                                 std::string(phase) + " phase before the search converged (last parameter " +
                                 fmt(p) + ")");
        }
        ++iterations_;

        EncodeTrial t;
        t.parameter = p;
        const auto ctx = call(phase, p);
        try {
            t.size = engine_.exact_.encode({probe_.path, artifact_, p, std::nullopt}, ctx).size_bytes;
            cache_.mark_produced(cache_.key_for(p));
            if (measure_) {
                t.quality = measure_quality(artifact_, ctx);
                t.metric = kSearchMetrics[metric_index_];
            }
        } catch (const EncodeFailure& e) {
            cache_.clear_produced();
            if (!mapping_ || !engine_.fast_) throw;
            const double fp = mapping_->to_fast(p);
            Logger::log(LogLevel::Warning,
                        name() + ": exact encode failed at " + fmt(p) + " (" + std::string(to_string(e.kind())) +
                        "), retrying on " + std::string(engine_.fast_->get_name()) + " at " + fmt(fp),
                        "Search");
            t.size = engine_.fast_->encode({probe_.path, fast_artifact_, fp, std::nullopt}, ctx).size_bytes;
            t.fast_path = true;
            if (measure_) {
                t.quality = measure_quality(fast_artifact_, ctx);
                t.metric = kSearchMetrics[metric_index_];
            }
        }

        const auto& stored = cache_.record(t);
        publish_trial(phase, stored, false);

        std::string line = name() + ": " + std::string(phase) + " " + fmt(p) + " -> " +
                           std::to_string(stored.size) + " bytes (" +
                           fmt(100.0 * (static_cast<double>(stored.size) / static_cast<double>(std::max<std::uintmax_t>(input_size_, 1)) - 1.0)) + "%)";
        if (stored.quality) line += ", quality " + fmt(*stored.quality, 4);
        Logger::log(LogLevel::Debug, line, "Search");
        return stored;
    }

    double measure_quality(const std::filesystem::path& artifact, const CallContext& ctx) {
        while (metric_index_ < kSearchMetrics.size()) {
            const auto kind = kSearchMetrics[metric_index_];
            try {
                return engine_.metric_.measure(probe_.path, artifact, kind, ctx);
            } catch (const MetricUnavailable& e) {
                Logger::log(LogLevel::Warning,
                            name() + ": search metric " + std::string(to_string(kind)) + " unavailable (" +
                            e.what() + ")", "Search");
                ++metric_index_;
            }
        }
        throw QualityUnverifiable("no search metric could be computed for " + name());
    }

    // --- Helpers ---

    [[nodiscard]] bool compresses(const EncodeTrial& t) const noexcept {
        return config_.size.allows(t.size, input_size_);
    }

    [[nodiscard]] double initial_parameter() const {
        return std::clamp(quantize(config_.initial, config_.precision), config_.min_param, config_.max_param);
    }

    /// True if t was measured with the metric the search currently uses.
    [[nodiscard]] bool comparable(const EncodeTrial& t) const noexcept {
        return t.quality && metric_index_ < kSearchMetrics.size() && t.metric == kSearchMetrics[metric_index_];
    }

    [[nodiscard]] double best_comparable(const bool must_compress) const {
        double best = 0.0;
        for (const auto& [key, t] : cache_.trials()) {
            if (!comparable(t) || (must_compress && !compresses(t))) continue;
            best = std::max(best, *t.quality);
        }
        return best;
    }

    /**
     * @brief Highest parameter in [lo, hi] whose quality is within epsilon of best_q.
     *
     * Only trials read with the current search metric take part.
     */
    [[nodiscard]] std::optional<double> highest_within(const double best_q, const double lo, const double hi,
                                                       const bool must_compress) const {
        std::optional<double> chosen;
        for (const auto& [key, t] : cache_.trials()) {
            if (!comparable(t) || t.parameter < lo - kSlack || t.parameter > hi + kSlack) continue;
            if (must_compress && !compresses(t)) continue;
            if (*t.quality >= best_q - config_.plateau_epsilon) chosen = t.parameter;
        }
        return chosen;
    }

    [[nodiscard]] const EncodeTrial* smallest_trial() const {
        const EncodeTrial* smallest = nullptr;
        for (const auto& [key, t] : cache_.trials()) {
            if (!smallest || t.size < smallest->size) smallest = &t;
        }
        return smallest;
    }

    void reject_no_compression() {
        const EncodeTrial* smallest = smallest_trial();
        std::string message = "no parameter compresses below input";
        if (smallest) {
            message += ": smallest output " + std::to_string(smallest->size) + " bytes at " +
                       fmt(smallest->parameter) + " vs input " + std::to_string(input_size_) +
                       " bytes (policy " + config_.size.describe() + ") across [" +
                       fmt(config_.min_param) + ", " + fmt(config_.max_param) + "]";
        }
        result_.rejection = Rejected{RejectReason::NoCompression, message};
        Logger::log(LogLevel::Info, name() + ": " + message, "Search");
    }

    /// Rejects the file, or with the best-effort fallback keeps its smallest trial.
    std::optional<double> no_compression() {
        reject_no_compression();
        if (!config_.best_effort_fallback) return std::nullopt;
        const EncodeTrial* smallest = smallest_trial();
        if (!smallest) return std::nullopt;

        Logger::log(LogLevel::Warning, name() + ": keeping smallest output at " + fmt(smallest->parameter) +
                    " (" + std::to_string(smallest->size) + " bytes) for best-effort acceptance", "Search");
        result_.rejection.reset();
        result_.below_size_policy = true;
        return smallest->parameter;
    }

    void publish_trial(const std::string_view phase, const EncodeTrial& t, const bool cached) const {
        if (!engine_.bus_) return;
        engine_.bus_->publish(TrialRecordedEvent{probe_.path, std::string(phase), t.parameter, t.size,
                                                 t.quality, cached, t.fast_path});
    }

    void enter(const std::string_view phase) {
        Logger::log(LogLevel::Debug, name() + ": phase " + std::string(phase), "Search");
    }

    [[nodiscard]] CallContext call(const std::string_view phase, const double parameter) const {
        return {ctx_.stop, ctx_.heartbeat, name() + ": " + std::string(phase) + "@" + fmt(parameter)};
    }

    [[nodiscard]] std::string name() const { return probe_.path.filename().string(); }

    SearchEngine& engine_;
    const MediaProbe& probe_;
    const SearchConfig& config_;
    const CallContext& ctx_;

    TrialCache cache_;
    std::uintmax_t input_size_;
    std::filesystem::path artifact_;
    std::filesystem::path fast_artifact_;
    std::filesystem::path exact_sample_;
    bool measure_;

    double floor_limit_ = 0.0;          ///< Lowest parameter a quality walk may reach
    unsigned required_zero_gains_ = 0;
    unsigned ceiling_ = 0;
    unsigned iterations_ = 0;
    size_t metric_index_ = 0;
    std::optional<CalibrationMapping> mapping_;
    SearchResult result_;
};

SearchEngine::SearchEngine(IEncoder& exact, IEncoder* fast, IMetricTool& metric, const Tuning& tuning,
                           EventBus* bus)
    : exact_(exact), fast_(fast), metric_(metric),
      search_tuning_(tuning.search), calibration_tuning_(tuning.calibration), bus_(bus) {
    if (exact_.is_fast_path()) {
        throw std::invalid_argument("exact encoder must not be a fast-path backend");
    }
    if (fast_ && !fast_->is_fast_path()) {
        throw std::invalid_argument("fast encoder must report is_fast_path()");
    }
}

SearchResult SearchEngine::run(const MediaProbe& probe, const std::filesystem::path& workdir,
                               const SearchConfig& config, const CallContext& ctx) {
    if (!(config.precision > 0.0)) {
        throw std::invalid_argument("search precision must be positive");
    }
    if (config.min_param > config.max_param) {
        throw std::invalid_argument("search range is empty: [" + fmt(config.min_param) + ", " +
                                    fmt(config.max_param) + "]");
    }
    Run run(*this, probe, workdir, config, ctx);
    return run.execute();
}

} // namespace qshift
