//
// Created by Giuseppe Francione on 20/10/25.
//

/**
 * @file event_bus.hpp
 * @brief Defines a simple, thread-safe publish/subscribe event bus.
 */

#ifndef BILLPRESS_EVENT_BUS_HPP
#define BILLPRESS_EVENT_BUS_HPP

#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace billpress {

    /**
     * @brief Simple type-safe publish/subscribe event bus.
     *
     * @details EventBus allows decoupled communication between components.
     * The BatchExecutor broadcasts events without knowing who is listening.
     * Consumers (CLI, public API bridge) subscribe to the event types they
     * care about.
     *
     * Subscriptions are protected by a mutex. Handlers run on the publishing
     * thread, outside the lock, so a handler may subscribe or publish.
     */
    class EventBus {
    public:
        EventBus() = default;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g., FileProcessCompleteEvent).
         * @param handler Function to invoke when an event of this type is published.
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            auto& vec = subscribers_[std::type_index(typeid(Event))];
            vec.push_back([handler = std::move(handler)](const void* e) {
                handler(*static_cast<const Event*>(e));
            });
        }

        /**
         * @brief Publish an event to all subscribers of its type.
         * @tparam Event The event struct type.
         * @param event The event instance to publish.
         */
        template <typename Event>
        void publish(const Event& event) const {
            std::vector<Callback> callbacks;
            {
                std::lock_guard lock(mtx_);
                const auto it = subscribers_.find(std::type_index(typeid(Event)));
                if (it == subscribers_.end()) return;
                callbacks = it->second;
            }
            for (const auto& fn : callbacks) {
                fn(&event);
            }
        }

        /// Drops every subscription.
        void clear() {
            std::lock_guard lock(mtx_);
            subscribers_.clear();
        }

    private:
        ///< Type alias for the internal type-erased callback.
        using Callback = std::function<void(const void*)>;
        ///< Map of event type_index to a vector of callbacks.
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        ///< Protects subscriber map during read/write.
        mutable std::mutex mtx_;
    };

} // namespace billpress

#endif // BILLPRESS_EVENT_BUS_HPP
