/**
 * @file event_bus.hpp
 * @brief Thread-safe publish/subscribe bus for engine notifications.
 */

#ifndef QSHIFT_EVENT_BUS_HPP
#define QSHIFT_EVENT_BUS_HPP

#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace qshift {

    /**
     * @brief Type-indexed publish/subscribe event bus.
     *
     * @details Workers, the heartbeat monitor and the executor publish plain
     * event structs; the CLI and the report generator subscribe to the types
     * they care about. Handlers run on the publishing thread, outside the
     * bus lock, so a handler may publish further events.
     */
    class EventBus {
    public:
        EventBus() = default;

        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Subscribe a handler to an event type.
         * @tparam Event The event struct type (e.g. FileOutcomeEvent).
         * @param handler Invoked with a const reference to each published event.
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            subscribers_[std::type_index(typeid(Event))].push_back(
                [handler = std::move(handler)](const void* e) {
                    handler(*static_cast<const Event*>(e));
                });
        }

        /**
         * @brief Publish an event to every subscriber of its type.
         * @tparam Event The event struct type.
         * @param event The event instance.
         */
        template <typename Event>
        void publish(const Event& event) const {
            std::vector<Callback> targets;
            {
                std::lock_guard lock(mtx_);
                const auto it = subscribers_.find(std::type_index(typeid(Event)));
                if (it == subscribers_.end()) return;
                targets = it->second;
            }
            for (const auto& fn : targets) {
                fn(&event);
            }
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_; ///< Handlers per event type
        mutable std::mutex mtx_; ///< Guards subscribers_
    };

} // namespace qshift

#endif // QSHIFT_EVENT_BUS_HPP
