/**
 * @file event_bus.hpp
 * @brief Type-indexed publish/subscribe bus for upload lifecycle events
 *
 * The scheduler emits events without knowing who consumes them. Logging,
 * metrics and callers' own observers subscribe by event type.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<UploadQueueEvent>([](const UploadQueueEvent& e) { ... });
 * bus.emit(UploadQueueEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace upq::events {

/**
 * @brief Synchronous, thread-safe event bus
 *
 * THREAD SAFETY:
 * - emit/subscribe/unsubscribe may be called from any thread
 * - Handlers run synchronously on the emitting thread, outside the bus lock,
 *   so a handler may subscribe or emit without deadlocking
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register a handler for one event type
     * @return Subscription id for unsubscribe()
     */
    template<typename EventType>
    std::size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        const std::size_t id = next_handler_id_++;
        handlers_[std::type_index(typeid(EventType))].emplace_back(
            id, std::make_shared<HandlerImpl<EventType>>(std::move(handler)));
        return id;
    }

    template<typename EventType>
    void unsubscribe(std::size_t handler_id) {
        std::unique_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [handler_id](const auto& entry) { return entry.first == handler_id; }),
                   list.end());
    }

    /**
     * @brief Deliver an event to every subscriber of its type
     *
     * A handler that throws is logged and skipped; the remaining handlers
     * still run.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<std::shared_ptr<HandlerBase>> targets;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            targets.reserve(it->second.size());
            for (const auto& [id, handler] : it->second) {
                targets.push_back(handler);
            }
        }

        for (auto& handler : targets) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
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
    struct HandlerImpl : HandlerBase {
        explicit HandlerImpl(std::function<void(const EventType&)> f) : func(std::move(f)) {}

        void call(const void* event) override {
            func(*static_cast<const EventType*>(event));
        }

        std::function<void(const EventType&)> func;
    };

    std::unordered_map<std::type_index,
                       std::vector<std::pair<std::size_t, std::shared_ptr<HandlerBase>>>> handlers_;
    mutable std::shared_mutex mutex_;
    std::size_t next_handler_id_ = 0;
};

} // namespace upq::events
