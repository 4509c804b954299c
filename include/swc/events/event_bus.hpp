/**
 * @file event_bus.hpp
 * @brief Type-safe observer bus between an upload session and its watchers
 *
 * WHY THIS FILE EXISTS:
 * A session publishes state changes and progress without knowing whether a
 * terminal UI, a CLI printer, a logger or nobody at all is listening.
 * Detaching a session is simply clearing its bus.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<ProgressUpdatedEvent>([](const ProgressUpdatedEvent& e) { ... });
 * bus.emit(ProgressUpdatedEvent{...});
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

namespace swc::events {

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - subscribe/unsubscribe/clear/emit may be called from any thread
 * - Handlers run synchronously on the emitting thread
 * - The handler list is copied before dispatch, so a handler may
 *   subscribe, unsubscribe or clear the bus without deadlocking
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe to events of one type
     * @return Subscription id for unsubscribe()
     */
    template<typename EventType>
    std::size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);

        auto type_id = std::type_index(typeid(EventType));
        auto wrapper = std::make_shared<HandlerImpl<EventType>>(std::move(handler));
        std::size_t handler_id = next_handler_id_++;

        handlers_[type_id].push_back({handler_id, wrapper});
        return handler_id;
    }

    template<typename EventType>
    void unsubscribe(std::size_t handler_id) {
        std::unique_lock lock(mutex_);

        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& handler_list = it->second;
        handler_list.erase(
            std::remove_if(handler_list.begin(), handler_list.end(),
                [handler_id](const auto& pair) { return pair.first == handler_id; }),
            handler_list.end());
    }

    /**
     * @brief Deliver event to every current subscriber of its type
     *
     * EXCEPTION SAFETY:
     * A handler that throws is logged and skipped; the remaining handlers
     * still run and the exception does not reach the emitter.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<std::shared_ptr<HandlerBase>> handlers_copy;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            for (const auto& [id, handler] : it->second) {
                handlers_copy.push_back(handler);
            }
        }

        for (auto& handler : handlers_copy) {
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
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    /// Drop every subscriber of every type
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
        std::function<void(const EventType&)> func;

        explicit HandlerImpl(std::function<void(const EventType&)> f) : func(std::move(f)) {}

        void call(const void* event) override {
            func(*static_cast<const EventType*>(event));
        }
    };

    // event type -> (handler id, handler)
    std::unordered_map<
        std::type_index,
        std::vector<std::pair<std::size_t, std::shared_ptr<HandlerBase>>>
    > handlers_;

    mutable std::shared_mutex mutex_;
    std::size_t next_handler_id_ = 0;
};

} // namespace swc::events
