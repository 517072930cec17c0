#pragma once
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace pbrelay {

// Remembers which events were already surfaced and which local notification
// each rendered key maps to. In memory only; both tables are bounded by
// max_entries and (when non-zero) retention_seconds, oldest evicted first.
// A redelivery arriving after its id was evicted is rendered again.
class DedupStore {
public:
    using Clock = std::function<uint64_t()>;

    DedupStore(uint32_t max_entries, uint32_t retention_seconds, Clock clock = {});

    // True (and recorded) the first time an id is seen, false on repeat.
    bool admit(const std::string& event_id);

    // Drop an admitted id so the same event may be rendered again.
    bool forget(const std::string& event_id);

    // Map an event id or notification key to the notification it rendered,
    // remembering which admitted event produced it.
    void record_rendered(const std::string& key, uint32_t notification_id,
                         const std::string& event_id = {});

    std::optional<uint32_t> lookup_rendered(const std::string& key) const;

    // Event id recorded with a rendered key; empty when unknown.
    std::string rendered_event(const std::string& key) const;

    // Returns true if a mapping was removed.
    bool remove_rendered(const std::string& key);

    size_t size() const;
    size_t rendered_size() const;
    uint32_t max_entries() const { return max_entries_; }

    void clear();

private:
    struct Rendered {
        uint32_t notification_id;
        uint64_t recorded_at;
        uint64_t seq;
        std::string event_id;
    };

    struct Seen {
        std::string event_id;
        uint64_t admitted_at;
        uint64_t seq;
    };

    void evict_seen(uint64_t now);
    void evict_rendered(uint64_t now);
    bool expired(uint64_t stamp, uint64_t now) const;

    uint32_t max_entries_;
    uint32_t retention_seconds_;
    Clock clock_;

    // admission order; front is oldest, forgotten ids leave stale entries
    std::deque<Seen> seen_order_;
    std::unordered_map<std::string, uint64_t> seen_; // id -> seq

    // (key, seq) in insertion order; stale seqs are skipped on eviction
    std::deque<std::pair<std::string, uint64_t>> rendered_order_;
    std::unordered_map<std::string, Rendered> rendered_;
    uint64_t next_seq_ = 1;

    mutable std::mutex mutex_;
};

} // namespace pbrelay
