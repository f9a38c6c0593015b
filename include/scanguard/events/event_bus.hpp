/**
 * @file event_bus.hpp
 * @brief Type-safe in-process event bus
 *
 * WHY THIS FILE EXISTS:
 * The loop detector, failure tracker and crawler report what happened
 * (loops, recorded failures, skipped directories) without knowing who
 * listens. Logging and metrics subscribe here instead of being wired
 * into the core.
 *
 * WHAT IT DOES:
 * - Subscription keyed by event type, resolved at compile time
 * - Thread-safe subscribe / unsubscribe / emit
 * - Handlers run synchronously in the emitting thread
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<LoopDetectedEvent>([](const LoopDetectedEvent& e) { ... });
 * bus.emit(LoopDetectedEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace scanguard::events {

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - Emitters take a shared lock only long enough to copy the handler list
 * - Handlers are invoked without any lock held, so a handler may
 *   subscribe or emit without deadlocking
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe to events of a specific type
     *
     * RETURNS:
     * Subscription ID for unsubscribe()
     *
     * EXAMPLE:
     * auto id = bus.subscribe<ScanFailureRecordedEvent>([](const auto& e) {
     *     spdlog::warn("failure at {}", e.resource_path);
     * });
     */
    template<typename EventType>
    size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);

        auto type_id = std::type_index(typeid(EventType));
        auto wrapper = std::make_shared<HandlerImpl<EventType>>(std::move(handler));
        size_t handler_id = next_handler_id_++;

        handlers_[type_id].push_back({handler_id, wrapper});
        return handler_id;
    }

    template<typename EventType>
    void unsubscribe(size_t handler_id) {
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
     * @brief Deliver an event to every subscriber of its type
     *
     * A handler that throws is logged and skipped; the remaining handlers
     * still run.
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
                spdlog::error("[EventBus] handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    // ════════════════════════════════════════════════════════
    // Type Erasure
    // ════════════════════════════════════════════════════════

    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct HandlerImpl : HandlerBase {
        std::function<void(const EventType&)> func;

        explicit HandlerImpl(std::function<void(const EventType&)> f)
            : func(std::move(f)) {}

        void call(const void* event) override {
            // Only EventType* is ever stored under EventType's type_index
            func(*static_cast<const EventType*>(event));
        }
    };

    std::unordered_map<
        std::type_index,
        std::vector<std::pair<size_t, std::shared_ptr<HandlerBase>>>
    > handlers_;

    mutable std::shared_mutex mutex_;
    size_t next_handler_id_ = 0;
};

} // namespace scanguard::events
