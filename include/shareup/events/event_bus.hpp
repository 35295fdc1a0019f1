/**
 * @file event_bus.hpp
 * @brief Type-indexed publish/subscribe bus for transfer events
 *
 * Tasks emit what happened (started, resumed, chunk written, finished)
 * without knowing who listens. Logging and metrics subscribe to the
 * event types they care about.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<UploadCompletedEvent>([](const UploadCompletedEvent& e) { ... });
 * bus.emit(UploadCompletedEvent{...});
 * bus.unsubscribe(id);
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace shareup::events {

/**
 * @brief Synchronous event bus
 *
 * THREAD SAFETY:
 * - emit/subscribe/unsubscribe may be called from any thread
 * - Handlers run on the emitting thread, outside the bus lock, so a
 *   handler may itself subscribe or emit
 */
class EventBus {
public:
    using SubscriptionId = std::size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        const SubscriptionId id = next_id_++;
        handlers_[std::type_index(typeid(EventType))].push_back(
            {id, std::make_shared<Handler<EventType>>(std::move(handler))});
        return id;
    }

    /// Removes a handler regardless of its event type
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        for (auto& [type, list] : handlers_) {
            list.erase(std::remove_if(list.begin(), list.end(),
                                      [id](const auto& entry) { return entry.first == id; }),
                       list.end());
        }
    }

    /**
     * @brief Deliver an event to every handler of its type
     *
     * A handler that throws is logged and skipped; the remaining handlers
     * still run and the emitter never sees the exception.
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        std::vector<std::shared_ptr<HandlerBase>> snapshot;
        {
            std::shared_lock lock(mutex_);
            const auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            snapshot.reserve(it->second.size());
            for (const auto& entry : it->second) {
                snapshot.push_back(entry.second);
            }
        }

        for (const auto& handler : snapshot) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        const auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct Handler : HandlerBase {
        explicit Handler(std::function<void(const EventType&)> f) : func(std::move(f)) {}

        // Only ever stored under typeid(EventType)
        void call(const void* event) override {
            func(*static_cast<const EventType*>(event));
        }

        std::function<void(const EventType&)> func;
    };

    std::unordered_map<std::type_index,
                       std::vector<std::pair<SubscriptionId, std::shared_ptr<HandlerBase>>>> handlers_;
    mutable std::shared_mutex mutex_;
    SubscriptionId next_id_ = 0;
};

} // namespace shareup::events
