#include "event_bus.hpp"
#include <iostream>

namespace pbrelay {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    handlers_[tag].push_back(Subscription{id, std::move(handler)});
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto entry = handlers_.begin(); entry != handlers_.end(); ++entry) {
        auto& subs = entry->second;
        for (auto it = subs.begin(); it != subs.end(); ++it) {
            if (it->id == id) {
                subs.erase(it);
                if (subs.empty()) handlers_.erase(entry);
                return true;
            }
        }
    }
    return false;
}

size_t EventBus::publish(const Event& event) {
    std::vector<EventHandler> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(event.type_tag);
        if (it == handlers_.end()) return 0;
        to_call.reserve(it->second.size());
        for (const auto& sub : it->second) {
            to_call.push_back(sub.handler);
        }
    }

    size_t failed = 0;
    for (const auto& handler : to_call) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            ++failed;
            std::cerr << "[events] " << event.type_tag << " handler failed: "
                      << e.what() << "\n";
        }
    }
    return failed;
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(tag);
    if (it == handlers_.end()) return 0;
    return it->second.size();
}

} // namespace pbrelay
