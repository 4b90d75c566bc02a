//
// Created by the shotport authors on 20/10/25.
//

/**
 * @file event_bus.hpp
 * @brief Typed publish/subscribe channel between the executor and its observers.
 */

#ifndef SHOTPORT_EVENT_BUS_HPP
#define SHOTPORT_EVENT_BUS_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace shotport {

    /**
     * @brief Delivers events to the handlers subscribed to their type.
     *
     * @details The ConversionExecutor publishes per-file events from worker
     * threads; the CLI subscribes to print progress and collect results.
     * Handlers run on the publishing thread with the bus locked, so at most
     * one handler runs at a time and handlers may share unsynchronized state.
     * A handler must not publish or subscribe itself.
     */
    class EventBus {
    public:
        /**
         * @brief Registers @p handler for events of type Event.
         * Handlers of one type are called in subscription order.
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            channel<Event>().push_back(std::move(handler));
        }

        /// Calls every handler subscribed to Event. Without subscribers this is a no-op.
        template <typename Event>
        void publish(const Event& event) {
            std::lock_guard lock(mtx_);
            const auto it = channels_.find(std::type_index(typeid(Event)));
            if (it == channels_.end()) return;
            for (const auto& handler : *std::static_pointer_cast<Handlers<Event>>(it->second)) {
                handler(event);
            }
        }

    private:
        template <typename Event>
        using Handlers = std::vector<std::function<void(const Event&)>>;

        template <typename Event>
        Handlers<Event>& channel() {
            auto& slot = channels_[std::type_index(typeid(Event))];
            if (!slot) slot = std::make_shared<Handlers<Event>>();
            return *std::static_pointer_cast<Handlers<Event>>(slot);
        }

        std::unordered_map<std::type_index, std::shared_ptr<void>> channels_;
        std::mutex mtx_;
    };

} // namespace shotport

#endif // SHOTPORT_EVENT_BUS_HPP
