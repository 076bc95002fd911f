/**
 * @file heartbeat.hpp
 * @brief Stall detection for blocking external-process calls.
 */

#ifndef QSHIFT_HEARTBEAT_HPP
#define QSHIFT_HEARTBEAT_HPP

#include "event_bus.hpp"
#include "tuning.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace qshift {

/**
 * @brief Labels of the external calls currently in flight.
 *
 * Used for diagnostic display only; nothing makes control decisions on it.
 */
class ActiveRegistry {
public:
    void add(const std::string& label);
    void remove(const std::string& label);
    [[nodiscard]] std::vector<std::string> snapshot() const;
    [[nodiscard]] size_t size() const;

private:
    std::multiset<std::string> labels_;
    mutable std::mutex mtx_;
};

/**
 * @brief Monitors external calls through progress messages.
 *
 * @details Each blocking call obtains a Handle from begin() and reports
 * progress through it. Handles never touch the supervisor's state directly:
 * they post messages to a queue drained by a monitor std::jthread, which
 * keeps the last-progress timestamp of each call.
 *
 * When a call has been silent for `warn_after`, the monitor logs a warning
 * (once per window) and publishes a HeartbeatWarningEvent. Past `kill_after`
 * it requests stop on the call's own stop source; the process runner observes
 * it through Handle::stuck() and kills the child.
 *
 * The supervisor must outlive every Handle it has issued.
 */
class HeartbeatSupervisor {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief RAII registration of one external call.
     */
    class Handle {
    public:
        Handle(Handle&& other) noexcept;
        Handle& operator=(Handle&&) = delete;
        Handle(const Handle&) = delete;
        Handle& operator=(const Handle&) = delete;
        ~Handle();

        /// Reports that the call made observable progress.
        void progress();

        /// @return True once the supervisor declared the call stuck.
        [[nodiscard]] bool stuck() const noexcept { return stuck_source_.stop_requested(); }

        /// @return Token that is stopped when the call is declared stuck.
        [[nodiscard]] std::stop_token stuck_token() const noexcept { return stuck_source_.get_token(); }

    private:
        friend class HeartbeatSupervisor;
        Handle(HeartbeatSupervisor* owner, std::uint64_t id, std::string label,
               std::stop_source source);

        HeartbeatSupervisor* owner_;
        std::uint64_t id_;
        std::string label_;
        std::stop_source stuck_source_;
    };

    explicit HeartbeatSupervisor(HeartbeatTuning tuning, EventBus* bus = nullptr);
    ~HeartbeatSupervisor();

    HeartbeatSupervisor(const HeartbeatSupervisor&) = delete;
    HeartbeatSupervisor& operator=(const HeartbeatSupervisor&) = delete;

    /**
     * @brief Registers a new call.
     * @param label Display label, e.g. "clip.mp4: boundary@24.0".
     */
    [[nodiscard]] Handle begin(std::string label);

    /// @return Labels of the calls currently registered.
    [[nodiscard]] std::vector<std::string> active() const { return registry_.snapshot(); }

    [[nodiscard]] const HeartbeatTuning& tuning() const noexcept { return tuning_; }

private:
    enum class MessageKind { Begin, Progress, End };

    struct Message {
        MessageKind kind;
        std::uint64_t id;
        Clock::time_point at;
        std::string label;
        std::stop_source source;
    };

    struct Tracked {
        std::string label;
        Clock::time_point last_progress;
        std::stop_source source;
        long long warned_windows = 0;
        bool killed = false;
    };

    void post(Message message);
    void monitor(const std::stop_token& st);
    void check(Clock::time_point now);

    HeartbeatTuning tuning_;
    EventBus* bus_;
    ActiveRegistry registry_;

    std::mutex queue_mtx_;
    std::condition_variable_any queue_cv_;
    std::deque<Message> queue_;             ///< Guarded by queue_mtx_
    std::uint64_t next_id_{1};              ///< Guarded by queue_mtx_

    std::map<std::uint64_t, Tracked> calls_; ///< Owned by the monitor thread
    std::jthread monitor_;
};

} // namespace qshift

#endif // QSHIFT_HEARTBEAT_HPP
