#include "dedup_store.hpp"
#include "util.hpp"
#include <stdexcept>

namespace pbrelay {

DedupStore::DedupStore(uint32_t max_entries, uint32_t retention_seconds, Clock clock)
    : max_entries_(max_entries), retention_seconds_(retention_seconds),
      clock_(clock ? std::move(clock) : Clock(epoch_seconds)) {
    if (max_entries_ == 0) {
        throw std::invalid_argument("DedupStore requires max_entries > 0");
    }
}

bool DedupStore::expired(uint64_t stamp, uint64_t now) const {
    return retention_seconds_ > 0 && now > stamp && (now - stamp) > retention_seconds_;
}

bool DedupStore::admit(const std::string& event_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t now = clock_();
    evict_seen(now);

    if (seen_.count(event_id)) return false;

    uint64_t seq = next_seq_++;
    seen_.emplace(event_id, seq);
    seen_order_.push_back(Seen{event_id, now, seq});
    evict_seen(now);
    return true;
}

bool DedupStore::forget(const std::string& event_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.erase(event_id) > 0;
}

void DedupStore::evict_seen(uint64_t now) {
    // Must be called with mutex_ already held.
    while (!seen_order_.empty()) {
        const Seen& front = seen_order_.front();
        auto it = seen_.find(front.event_id);
        if (it == seen_.end() || it->second != front.seq) {
            // Forgotten or re-admitted since
            seen_order_.pop_front();
            continue;
        }
        if (seen_.size() > max_entries_ || expired(front.admitted_at, now)) {
            seen_.erase(it);
            seen_order_.pop_front();
            continue;
        }
        break;
    }

    if (seen_order_.size() > 2 * static_cast<size_t>(max_entries_) + 16) {
        std::deque<Seen> live;
        for (const auto& entry : seen_order_) {
            auto it = seen_.find(entry.event_id);
            if (it != seen_.end() && it->second == entry.seq) live.push_back(entry);
        }
        seen_order_.swap(live);
    }
}

void DedupStore::record_rendered(const std::string& key, uint32_t notification_id,
                                 const std::string& event_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t now = clock_();
    uint64_t seq = next_seq_++;
    rendered_[key] = Rendered{notification_id, now, seq, event_id};
    rendered_order_.emplace_back(key, seq);
    evict_rendered(now);
}

void DedupStore::evict_rendered(uint64_t now) {
    // Must be called with mutex_ already held.
    while (!rendered_order_.empty()) {
        const auto& [key, seq] = rendered_order_.front();
        auto it = rendered_.find(key);
        if (it == rendered_.end() || it->second.seq != seq) {
            // Removed or re-recorded since; a newer order entry exists
            rendered_order_.pop_front();
            continue;
        }
        if (rendered_.size() > max_entries_ || expired(it->second.recorded_at, now)) {
            rendered_.erase(it);
            rendered_order_.pop_front();
            continue;
        }
        break;
    }

    if (rendered_order_.size() > 2 * static_cast<size_t>(max_entries_) + 16) {
        std::deque<std::pair<std::string, uint64_t>> live;
        for (const auto& entry : rendered_order_) {
            auto it = rendered_.find(entry.first);
            if (it != rendered_.end() && it->second.seq == entry.second) live.push_back(entry);
        }
        rendered_order_.swap(live);
    }
}

std::optional<uint32_t> DedupStore::lookup_rendered(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rendered_.find(key);
    if (it == rendered_.end()) return std::nullopt;
    if (expired(it->second.recorded_at, clock_())) return std::nullopt;
    return it->second.notification_id;
}

std::string DedupStore::rendered_event(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rendered_.find(key);
    if (it == rendered_.end()) return {};
    return it->second.event_id;
}

bool DedupStore::remove_rendered(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return rendered_.erase(key) > 0;
}

size_t DedupStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.size();
}

size_t DedupStore::rendered_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rendered_.size();
}

void DedupStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    seen_.clear();
    seen_order_.clear();
    rendered_.clear();
    rendered_order_.clear();
}

} // namespace pbrelay
