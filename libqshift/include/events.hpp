/**
 * @file events.hpp
 * @brief Events published while files are probed, searched and committed.
 */

#ifndef QSHIFT_EVENTS_HPP
#define QSHIFT_EVENTS_HPP

#include "conversion_outcome.hpp"
#include "media_probe.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace qshift {

/**
 * @brief Events published by the executor, the search engine, the verifier
 * and the heartbeat supervisor.
 *
 * These are plain data carriers used with EventBus. The CLI subscribes to
 * them for progress output and the final report.
 */

// --- Per-file lifecycle ---

/**
 * @brief Emitted when a worker picks up a file.
 */
struct FileConvertStartEvent {
    std::filesystem::path path; ///< Source file
};

/**
 * @brief Emitted when a file is excluded before any trial runs.
 */
struct FileSkippedEvent {
    std::filesystem::path path;
    std::string reason;
};

/**
 * @brief Emitted once the predictor has produced a starting parameter.
 */
struct PredictionEvent {
    std::filesystem::path path;
    double parameter = 0.0;
    double confidence = 0.0;     ///< Score in [0, 1]
    double effective_bpp = 0.0;
};

/**
 * @brief Emitted exactly once per input with its terminal outcome.
 */
struct FileOutcomeEvent {
    std::filesystem::path path;
    ConversionOutcome outcome;
    std::uintmax_t original_size = 0;
    SourceCodec source_codec = SourceCodec::Unknown;
    std::chrono::milliseconds duration{0}; ///< Wall time spent on the file
};

// --- Search ---

/**
 * @brief Emitted for every trial, cached or not.
 */
struct TrialRecordedEvent {
    std::filesystem::path path;
    std::string phase;               ///< Search phase that requested the trial
    double parameter = 0.0;
    std::uintmax_t size = 0;
    std::optional<double> quality;   ///< Present when the phase measured quality
    bool cached = false;             ///< True if served from the trial cache
    bool fast_path = false;          ///< True if produced by the approximate encoder
};

/**
 * @brief Emitted after the calibration mapper ran, valid or not.
 */
struct CalibrationEvent {
    std::filesystem::path path;
    bool valid = false;
    double offset = 0.0;
    double uncertainty = 0.0;
    std::string reason;              ///< Why the mapping was discarded; empty when valid
};

// --- Verification ---

/**
 * @brief Emitted each time the verifier steps down the metric chain.
 */
struct MetricFallbackEvent {
    std::filesystem::path path;
    MetricKind from = MetricKind::MsSsim;
    MetricKind to = MetricKind::SsimAll;
    std::string reason;
};

// --- Supervision ---

/**
 * @brief Emitted when an external call has been silent for too long.
 */
struct HeartbeatWarningEvent {
    std::string label;                     ///< Call label, usually "<file>: <phase>"
    std::chrono::milliseconds silent_for{0};
    bool killed = false;                   ///< True once the absolute ceiling was passed
};

} // namespace qshift

#endif // QSHIFT_EVENTS_HPP
