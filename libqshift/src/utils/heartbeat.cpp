#include "../../include/heartbeat.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <utility>

namespace qshift {

void ActiveRegistry::add(const std::string& label) {
    std::lock_guard lock(mtx_);
    labels_.insert(label);
}

void ActiveRegistry::remove(const std::string& label) {
    std::lock_guard lock(mtx_);
    if (const auto it = labels_.find(label); it != labels_.end()) {
        labels_.erase(it);
    }
}

std::vector<std::string> ActiveRegistry::snapshot() const {
    std::lock_guard lock(mtx_);
    return {labels_.begin(), labels_.end()};
}

size_t ActiveRegistry::size() const {
    std::lock_guard lock(mtx_);
    return labels_.size();
}

HeartbeatSupervisor::Handle::Handle(HeartbeatSupervisor* owner, const std::uint64_t id,
                                    std::string label, std::stop_source source)
    : owner_(owner), id_(id), label_(std::move(label)), stuck_source_(std::move(source)) {}

HeartbeatSupervisor::Handle::Handle(Handle&& other) noexcept
    : owner_(std::exchange(other.owner_, nullptr)),
      id_(other.id_),
      label_(std::move(other.label_)),
      stuck_source_(std::move(other.stuck_source_)) {}

HeartbeatSupervisor::Handle::~Handle() {
    if (!owner_) return;
    owner_->registry_.remove(label_);
    owner_->post({MessageKind::End, id_, Clock::now(), {}, std::stop_source(std::nostopstate)});
}

void HeartbeatSupervisor::Handle::progress() {
    if (!owner_) return;
    owner_->post({MessageKind::Progress, id_, Clock::now(), {}, std::stop_source(std::nostopstate)});
}

HeartbeatSupervisor::HeartbeatSupervisor(HeartbeatTuning tuning, EventBus* bus)
    : tuning_(tuning), bus_(bus) {
    if (tuning_.tick <= std::chrono::milliseconds::zero()) {
        tuning_.tick = std::chrono::milliseconds(500);
    }
    monitor_ = std::jthread([this](const std::stop_token& st) { monitor(st); });
}

HeartbeatSupervisor::~HeartbeatSupervisor() {
    monitor_.request_stop();
    queue_cv_.notify_all();
}

HeartbeatSupervisor::Handle HeartbeatSupervisor::begin(std::string label) {
    std::uint64_t id;
    {
        std::lock_guard lock(queue_mtx_);
        id = next_id_++;
    }
    std::stop_source source;
    registry_.add(label);
    post({MessageKind::Begin, id, Clock::now(), label, source});
    return {this, id, std::move(label), source};
}

void HeartbeatSupervisor::post(Message message) {
    {
        std::lock_guard lock(queue_mtx_);
        queue_.push_back(std::move(message));
    }
    queue_cv_.notify_one();
}

void HeartbeatSupervisor::monitor(const std::stop_token& st) {
    while (!st.stop_requested()) {
        std::deque<Message> batch;
        {
            std::unique_lock lock(queue_mtx_);
            queue_cv_.wait_for(lock, st, tuning_.tick, [this] { return !queue_.empty(); });
            batch.swap(queue_);
        }

        for (auto& msg : batch) {
            switch (msg.kind) {
                case MessageKind::Begin:
                    calls_.insert_or_assign(msg.id, Tracked{std::move(msg.label), msg.at, std::move(msg.source)});
                    break;
                case MessageKind::Progress:
                    if (const auto it = calls_.find(msg.id); it != calls_.end()) {
                        it->second.last_progress = std::max(it->second.last_progress, msg.at);
                        it->second.warned_windows = 0;
                    }
                    break;
                case MessageKind::End:
                    calls_.erase(msg.id);
                    break;
            }
        }

        check(Clock::now());
    }
}

void HeartbeatSupervisor::check(const Clock::time_point now) {
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;

    for (auto& [id, call] : calls_) {
        if (call.killed) continue;
        const auto silent = duration_cast<milliseconds>(now - call.last_progress);

        if (silent >= tuning_.kill_after) {
            call.killed = true;
            call.source.request_stop();
            Logger::log(LogLevel::Error,
                        call.label + ": no progress for " + std::to_string(silent.count() / 1000) +
                        "s, terminating process", "Heartbeat");
            if (bus_) bus_->publish(HeartbeatWarningEvent{call.label, silent, true});
            continue;
        }

        if (tuning_.warn_after <= milliseconds::zero()) continue;
        const long long windows = silent / tuning_.warn_after;
        if (windows > call.warned_windows) {
            call.warned_windows = windows;
            Logger::log(LogLevel::Warning,
                        call.label + ": no progress for " + std::to_string(silent.count() / 1000) + "s",
                        "Heartbeat");
            if (bus_) bus_->publish(HeartbeatWarningEvent{call.label, silent, false});
        }
    }
}

} // namespace qshift
