/**
 * @file process_runner.hpp
 * @brief Runs an external process with progress supervision and cancellation.
 */

#ifndef QSHIFT_PROCESS_RUNNER_HPP
#define QSHIFT_PROCESS_RUNNER_HPP

#include "call_context.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qshift {

/**
 * @brief One progress report parsed from an ffmpeg status line.
 */
struct ProgressSample {
    std::optional<std::uint64_t> frame;
    std::optional<double> fps;
    std::optional<double> time_secs;
    std::optional<double> speed;
};

/**
 * @brief Parses ffmpeg status lines such as
 * `frame=  120 fps= 30 q=28.0 size=1024kB time=00:00:04.00 bitrate=... speed=1.5x`.
 */
class ProgressParser {
public:
    /// @return The sample, or std::nullopt if the line is not a status line.
    [[nodiscard]] static std::optional<ProgressSample> parse_line(std::string_view line);

    /// @return Seconds for "HH:MM:SS.ms", or std::nullopt if malformed.
    [[nodiscard]] static std::optional<double> parse_timestamp(std::string_view text);
};

/**
 * @brief Picks the most relevant diagnostic line of a stderr capture.
 *
 * The last line mentioning "error" wins; otherwise the last non-empty line
 * that is not a status line.
 *
 * @return The line, or "Unknown ffmpeg error" if none qualifies.
 */
std::string format_error_tail(std::string_view stderr_text);

/**
 * @brief Outcome of a finished child process.
 */
struct ProcessResult {
    enum class Termination {
        Exited,      ///< Normal exit; see exit_code
        Signaled,    ///< Terminated by a signal it did not get from us
        Stuck,       ///< Killed after the heartbeat supervisor declared it stuck
        SpawnFailed  ///< exec failed; stderr_text holds the reason
    };

    Termination termination = Termination::Exited;
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;   ///< Last 64 KiB of stderr

    [[nodiscard]] bool ok() const noexcept {
        return termination == Termination::Exited && exit_code == 0;
    }
};

/**
 * @brief Runs argv[0] (searched in PATH) and waits for it.
 *
 * @details The call blocks the worker. Both output pipes are multiplexed
 * with poll(2); every ffmpeg status line on stderr is reported to the
 * heartbeat handle of the call, when ctx carries a supervisor. The child is
 * terminated with SIGTERM, then SIGKILL after a grace period, when either the
 * worker's stop token or the heartbeat's stuck token fires.
 *
 * @param argv Program and arguments. Must not be empty.
 * @param ctx Cancellation and supervision.
 * @return The result. Stuck and SpawnFailed are reported, not thrown.
 * @throws OperationCancelled if ctx.stop was requested.
 * @throws std::system_error if the pipes or the fork could not be created.
 */
ProcessResult run_process(const std::vector<std::string>& argv, const CallContext& ctx);

/// @return True if an executable named `program` is reachable (absolute, relative or in PATH).
bool program_available(const std::string& program);

} // namespace qshift

#endif // QSHIFT_PROCESS_RUNNER_HPP
