#include "event_bus.hpp"

namespace multichat {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    auto sub = std::make_shared<Subscription>();
    sub->handler = std::move(handler);

    std::lock_guard<std::mutex> lock(mutex_);
    sub->id = next_id_++;
    handlers_[tag].push_back(sub);
    return sub->id;
}

void EventBus::deactivate(const SubscriptionPtr& sub) {
    // Waits out a delivery in progress on another thread
    std::lock_guard<std::recursive_mutex> lock(sub->delivery);
    sub->active = false;
}

bool EventBus::unsubscribe(uint64_t id) {
    SubscriptionPtr removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto tag_it = handlers_.begin(); tag_it != handlers_.end() && !removed; ++tag_it) {
            auto& subs = tag_it->second;
            for (auto it = subs.begin(); it != subs.end(); ++it) {
                if ((*it)->id != id) continue;
                removed = *it;
                subs.erase(it);
                if (subs.empty()) handlers_.erase(tag_it);
                break;
            }
        }
    }
    if (!removed) return false;
    deactivate(removed);
    return true;
}

void EventBus::publish(const Event& event) {
    std::vector<SubscriptionPtr> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(event.type_tag);
        if (it == handlers_.end()) return;
        targets = it->second;
    }
    for (const auto& sub : targets) {
        std::lock_guard<std::recursive_mutex> lock(sub->delivery);
        if (!sub->active) continue;
        sub->handler(event);
    }
}

void EventBus::clear() {
    std::unordered_map<std::string, std::vector<SubscriptionPtr>> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed.swap(handlers_);
    }
    for (const auto& [tag, subs] : removed) {
        for (const auto& sub : subs) deactivate(sub);
    }
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(tag);
    if (it == handlers_.end()) return 0;
    return it->second.size();
}

} // namespace multichat
