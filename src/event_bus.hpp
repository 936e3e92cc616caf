#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <memory>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace multichat {

using EventHandler = std::function<void(const Event&)>;

// Synchronous publish/subscribe. Stream events are published from worker
// threads, so a handler may be invoked on any thread. Calls into one
// handler are serialized, and once unsubscribe() returns that handler is
// neither running on another thread nor called again. A handler must not
// publish events whose handlers could in turn publish back to it.
class EventBus {
public:
    // Subscribe to events with a given tag. Returns a subscription ID.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Unsubscribe by ID. Returns true if found and removed. Blocks while
    // the handler runs on another thread; safe from inside the handler.
    bool unsubscribe(uint64_t id);

    // Publish an event on the caller's thread, handlers in registration
    // order. The bus mutex is not held while handlers run.
    void publish(const Event& event);

    // Remove all subscriptions.
    void clear();

    // Number of subscriptions for a given tag (0 if none).
    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id = 0;
        EventHandler handler;
        std::recursive_mutex delivery;
        bool active = true; // guarded by delivery
    };
    using SubscriptionPtr = std::shared_ptr<Subscription>;

    static void deactivate(const SubscriptionPtr& sub);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<SubscriptionPtr>> handlers_;
    uint64_t next_id_ = 1;
};

// Owns one bus subscription and removes it on destruction.
class ScopedEventSubscription {
public:
    ScopedEventSubscription() = default;
    ScopedEventSubscription(EventBus& bus, uint64_t id) : bus_(&bus), id_(id) {}
    ~ScopedEventSubscription() { reset(); }

    ScopedEventSubscription(const ScopedEventSubscription&) = delete;
    ScopedEventSubscription& operator=(const ScopedEventSubscription&) = delete;

    ScopedEventSubscription(ScopedEventSubscription&& other) noexcept
        : bus_(other.bus_), id_(other.id_) {
        other.bus_ = nullptr;
        other.id_ = 0;
    }

    ScopedEventSubscription& operator=(ScopedEventSubscription&& other) noexcept {
        if (this != &other) {
            reset();
            bus_ = other.bus_;
            id_ = other.id_;
            other.bus_ = nullptr;
            other.id_ = 0;
        }
        return *this;
    }

    void reset() {
        if (bus_ && id_ != 0) bus_->unsubscribe(id_);
        bus_ = nullptr;
        id_ = 0;
    }

    bool active() const { return bus_ != nullptr && id_ != 0; }

private:
    EventBus* bus_ = nullptr;
    uint64_t id_ = 0;
};

// Type-safe subscribe helper: auto-casts Event& to the concrete type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

// Same as subscribe<E>, but the subscription lives as long as the returned guard.
template<typename E>
ScopedEventSubscription subscribe_scoped(EventBus& bus, std::function<void(const E&)> handler) {
    return ScopedEventSubscription(bus, subscribe<E>(bus, std::move(handler)));
}

} // namespace multichat
