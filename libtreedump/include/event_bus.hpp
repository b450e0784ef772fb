//
// Created by Giuseppe Francione on 20/01/26.
//

/**
 * @file event_bus.hpp
 * @brief Serialising publish/subscribe bus between capture workers and the CLI.
 */

#ifndef TREEDUMP_EVENT_BUS_HPP
#define TREEDUMP_EVENT_BUS_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace treedump {

    /**
     * @brief Type-indexed event bus fed by CaptureExecutor workers.
     *
     * @details Workers publish capture results without knowing who listens;
     * the CLI subscribes to draw progress and collect report rows.
     *
     * Dispatch is serialised: one publish() runs its handlers at a time, in
     * subscription order, so handlers may touch unsynchronised state of
     * their own. A handler must not publish or subscribe on the bus that is
     * calling it; doing so throws std::logic_error instead of deadlocking.
     */
    class EventBus {
    public:
        EventBus() = default;

        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Registers a handler for one event type.
         * @throws std::logic_error if called from inside a handler of this bus.
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            reject_reentry("subscribe");
            std::lock_guard lock(mtx_);
            handlers_[std::type_index(typeid(Event))].push_back(
                [handler = std::move(handler)](const void* e) {
                    handler(*static_cast<const Event*>(e));
                });
        }

        /**
         * @brief Runs every handler subscribed to `Event`, on the calling thread.
         *
         * An exception thrown by a handler propagates to the publisher and
         * skips the remaining handlers for that event.
         * @throws std::logic_error if called from inside a handler of this bus.
         */
        template <typename Event>
        void publish(const Event& event) {
            reject_reentry("publish");
            std::lock_guard lock(mtx_);
            const auto it = handlers_.find(std::type_index(typeid(Event)));
            if (it == handlers_.end()) return;

            DispatchScope scope(dispatching_);
            for (const auto& fn : it->second) {
                fn(&event);
            }
        }

        /**
         * @return Number of handlers subscribed to `Event`.
         */
        template <typename Event>
        [[nodiscard]] std::size_t subscriber_count() const {
            std::lock_guard lock(mtx_);
            const auto it = handlers_.find(std::type_index(typeid(Event)));
            return it == handlers_.end() ? 0 : it->second.size();
        }

    private:
        using Handler = std::function<void(const void*)>;

        // marks the dispatching thread for the duration of one publish()
        class DispatchScope {
        public:
            explicit DispatchScope(std::atomic<std::thread::id>& slot) : slot_(slot) {
                slot_.store(std::this_thread::get_id());
            }
            ~DispatchScope() { slot_.store(std::thread::id{}); }
            DispatchScope(const DispatchScope&) = delete;
            DispatchScope& operator=(const DispatchScope&) = delete;
        private:
            std::atomic<std::thread::id>& slot_;
        };

        void reject_reentry(const char* operation) const {
            if (dispatching_.load() == std::this_thread::get_id()) {
                throw std::logic_error(std::string("EventBus::") + operation + " called from an event handler");
            }
        }

        std::unordered_map<std::type_index, std::vector<Handler>> handlers_;
        std::atomic<std::thread::id> dispatching_{};   ///< Thread running handlers, or none
        mutable std::mutex mtx_;
    };

} // namespace treedump

#endif // TREEDUMP_EVENT_BUS_HPP
