// =============================================================================
// Marionette - Event Bus
// =============================================================================
// Thread-safe, type-erased publish/subscribe event system.
// The binding layer publishes rebind / session events; the resolver, the
// keyboard state cache and the simulator registry subscribe to drop stale
// state.
// Usage:
//   EventBus bus;
//   auto sub = bus.subscribe<WindowRebindEvent>([](const auto& e) { ... });
//   bus.publish(WindowRebindEvent{...});
// =============================================================================
#pragma once
#include <functional>
#include <mutex>
#include <vector>
#include <unordered_map>
#include <typeindex>
#include <memory>
#include <string>
#include <cstdint>
#include <algorithm>
#include "marionette_log.hpp"

namespace marionette {

// =============================================================================
// Event Types
// =============================================================================

struct Event {
    virtual ~Event() = default;
};

// A single window was rebound / reattached to a different automation target
struct WindowRebindEvent : Event {
    std::uintptr_t window = 0;
};

// The whole binding set changed (new binding session)
struct BindingSessionChangedEvent : Event {
    std::string session_id;
};

// =============================================================================
// SubscriptionHandle - RAII unsubscribe
// =============================================================================

class SubscriptionHandle {
public:
    SubscriptionHandle() = default;
    explicit SubscriptionHandle(std::function<void()> unsub) : unsub_(std::move(unsub)) {}
    ~SubscriptionHandle() { if (unsub_) unsub_(); }

    SubscriptionHandle(SubscriptionHandle&& o) noexcept : unsub_(std::move(o.unsub_)) { o.unsub_ = nullptr; }
    SubscriptionHandle& operator=(SubscriptionHandle&& o) noexcept {
        if (unsub_) unsub_();
        unsub_ = std::move(o.unsub_);
        o.unsub_ = nullptr;
        return *this;
    }
    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

    void release() { unsub_ = nullptr; } // detach: subscription lives forever

private:
    std::function<void()> unsub_;
};

// =============================================================================
// EventBus - Thread-safe publish/subscribe
// =============================================================================

class EventBus {
public:
    using HandlerId = uint64_t;

    template<typename T>
    SubscriptionHandle subscribe(std::function<void(const T&)> handler) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        std::lock_guard<std::mutex> lock(mutex_);
        auto id = next_id_++;
        auto key = std::type_index(typeid(T));

        handlers_[key].push_back({id, [handler](const Event& e) {
            handler(static_cast<const T&>(e));
        }});

        MNLOG_DEBUG("eventbus", "Subscribed handler %llu for %s",
                    (unsigned long long)id, typeid(T).name());

        return SubscriptionHandle([this, key, id]() {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(key);
            if (it != handlers_.end()) {
                auto& vec = it->second;
                vec.erase(std::remove_if(vec.begin(), vec.end(),
                    [id](const HandlerEntry& h) { return h.id == id; }), vec.end());
            }
        });
    }

    template<typename T>
    void publish(const T& event) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        std::vector<HandlerEntry> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto key = std::type_index(typeid(T));
            auto it = handlers_.find(key);
            if (it != handlers_.end()) {
                snapshot = it->second;
            }
        }

        for (auto& entry : snapshot) {
            try {
                entry.fn(event);
            } catch (const std::exception& e) {
                MNLOG_ERROR("eventbus", "Handler %llu threw: %s",
                            (unsigned long long)entry.id, e.what());
            }
        }
    }

    template<typename T>
    size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(T)));
        return it == handlers_.end() ? 0 : it->second.size();
    }

    template<typename T>
    bool has_subscribers() const { return subscriber_count<T>() > 0; }

    // Publishes WindowRebindEvent for one handle
    void publish_rebind(std::uintptr_t window) {
        WindowRebindEvent e;
        e.window = window;
        publish(e);
    }

    // Publishes BindingSessionChangedEvent
    void publish_session_change(const std::string& session_id) {
        BindingSessionChangedEvent e;
        e.session_id = session_id;
        publish(e);
    }

private:
    struct HandlerEntry {
        HandlerId id;
        std::function<void(const Event&)> fn;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::type_index, std::vector<HandlerEntry>> handlers_;
    HandlerId next_id_ = 1;
};

} // namespace marionette
