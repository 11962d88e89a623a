/**
 * @file event_bus.hpp
 * @brief Thread-safe publish/subscribe bus carrying chunk progress events.
 */

#ifndef CHUNKZLI_EVENT_BUS_HPP
#define CHUNKZLI_EVENT_BUS_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace chunkzli {

    /**
     * @brief Type-safe publish/subscribe event bus.
     *
     * @details Workers publish from pool threads; subscribers (the CLI
     * progress bar, tests) are invoked on the publishing thread, one event
     * at a time. Handlers are called outside the subscription lock, so a
     * handler may subscribe further handlers without deadlocking.
     */
    class EventBus {
    public:
        EventBus() = default;

        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g., ChunkCompleteEvent).
         * @param handler Invoked with a const reference to each published event.
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            auto cb = std::make_shared<const Callback>([h = std::move(handler)](const void* e) {
                h(*static_cast<const Event*>(e));
            });
            std::lock_guard lock(mtx_);
            subscribers_[std::type_index(typeid(Event))].push_back(std::move(cb));
        }

        /**
         * @brief Publish an event to all subscribers of its type.
         */
        template <typename Event>
        void publish(const Event& event) {
            std::vector<std::shared_ptr<const Callback>> targets;
            {
                std::lock_guard lock(mtx_);
                const auto it = subscribers_.find(std::type_index(typeid(Event)));
                if (it == subscribers_.end()) {
                    return;
                }
                targets = it->second;
            }
            std::lock_guard dispatch(dispatch_mtx_);
            for (const auto& fn : targets) {
                (*fn)(&event);
            }
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<std::shared_ptr<const Callback>>> subscribers_;
        std::mutex mtx_;          ///< Protects subscribers_
        std::mutex dispatch_mtx_; ///< Serializes handler invocations across publishers
    };

} // namespace chunkzli

#endif // CHUNKZLI_EVENT_BUS_HPP
