/**
 * @file event_bus.hpp
 * @brief Thread-safe publish/subscribe bus keyed by event type.
 */

#ifndef UNROLL_EVENT_BUS_HPP
#define UNROLL_EVENT_BUS_HPP

#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace unroll {

    /**
     * @brief Type-keyed publish/subscribe bus.
     *
     * @details Producers (BatchExecutor) broadcast lifecycle events without
     * knowing who listens; the CLI subscribes to print progress. Handlers run
     * synchronously on the publishing thread, under the bus mutex, so they
     * must not publish themselves.
     */
    class EventBus {
    public:
        EventBus() = default;

        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            subscribers_[std::type_index(typeid(Event))].push_back(
                [handler = std::move(handler)](const void* e) {
                    handler(*static_cast<const Event*>(e));
                });
        }

        template <typename Event>
        void publish(const Event& event) {
            std::lock_guard lock(mtx_);
            const auto it = subscribers_.find(std::type_index(typeid(Event)));
            if (it == subscribers_.end())
                return;
            for (const auto& fn : it->second) {
                fn(&event);
            }
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        std::mutex mtx_;
    };

} // namespace unroll

#endif // UNROLL_EVENT_BUS_HPP
