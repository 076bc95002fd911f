/**
 * @file conversion_executor.hpp
 * @brief Runs the per-file conversion pipeline over a bounded worker pool.
 */

#ifndef QSHIFT_CONVERSION_EXECUTOR_HPP
#define QSHIFT_CONVERSION_EXECUTOR_HPP

#include "acceptance.hpp"
#include "codec_policy.hpp"
#include "conversion_outcome.hpp"
#include "encoder.hpp"
#include "event_bus.hpp"
#include "heartbeat.hpp"
#include "media_prober.hpp"
#include "metric_tool.hpp"
#include "quality_predictor.hpp"
#include "search_config.hpp"
#include "thread_pool.hpp"
#include "tuning.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

namespace qshift {

/**
 * @brief External capabilities used by every file. Not owned.
 *
 * The encoders, the metric tool and the prober are shared by all workers and
 * must be safe to call concurrently.
 */
struct Backends {
    IMediaProber& prober;
    IEncoder& exact;
    IEncoder* fast = nullptr;   ///< Optional approximate path
    IMetricTool& metric;
};

/**
 * @brief Batch-wide settings.
 */
struct ExecutorOptions {
    TargetCodec target = TargetCodec::Hevc;
    SearchConfig search;                           ///< `initial` is replaced by the prediction
    CodecPolicy codec_policy;
    CommitOptions commit;
    std::optional<ContentType> content;            ///< Applied to every probe
    std::optional<bool> film_grain;
    bool check_mime = true;                        ///< Reject non-video inputs before probing
    std::filesystem::path work_base;               ///< Empty means the system temp dir
    unsigned threads = std::max(1u, std::thread::hardware_concurrency() / 2);
};

/**
 * @brief One terminal outcome for one input.
 */
struct FileResult {
    std::filesystem::path path;
    ConversionOutcome outcome;
};

/**
 * @brief Orchestrates probe, prediction, search, verification and commit.
 *
 * @details Each file is processed by exactly one worker, start to finish.
 * Every exception raised while converting a file is caught at the file
 * boundary and turned into a Rejected outcome, so one failure never aborts
 * the batch. A FileOutcomeEvent is published for every input.
 */
class ConversionExecutor {
public:
    ConversionExecutor(Backends backends, ExecutorOptions options, Tuning tuning, EventBus& bus);

    ConversionExecutor(const ConversionExecutor&) = delete;
    ConversionExecutor& operator=(const ConversionExecutor&) = delete;

    /**
     * @brief Converts every input on the worker pool and waits for all of them.
     * @return One result per input, in input order.
     */
    std::vector<FileResult> run(const std::vector<std::filesystem::path>& inputs);

    /**
     * @brief Converts a single file on the calling thread.
     * @param path Source file.
     * @param stop Cancellation token for this file.
     */
    ConversionOutcome convert(const std::filesystem::path& path, std::stop_token stop = {});

    /**
     * @brief Cancels queued and running files. Safe to call from any thread.
     */
    void request_stop();

    [[nodiscard]] bool is_stopped() const noexcept { return stop_source_.stop_requested(); }

    /// @return Labels of external calls currently running.
    [[nodiscard]] std::vector<std::string> active_calls() const { return heartbeat_.active(); }

private:
    ConversionOutcome convert_checked(const std::filesystem::path& path, const std::stop_token& stop,
                                      SourceCodec& codec);

    Backends backends_;
    ExecutorOptions options_;
    Tuning tuning_;
    QualityPredictor predictor_;
    EventBus& bus_;
    HeartbeatSupervisor heartbeat_;
    std::stop_source stop_source_;
    std::optional<ThreadPool> pool_;   ///< Created on the first run()
};

} // namespace qshift

#endif // QSHIFT_CONVERSION_EXECUTOR_HPP
