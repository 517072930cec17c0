#pragma once
#include "crypto.hpp"
#include "dispatcher.hpp"
#include "session.hpp"
#include "stream_event.hpp"
#include <cstdint>
#include <string>

namespace pbrelay {

class EventBus;      // forward declaration
class PushbulletApi; // forward declaration

// The single consuming loop: pull a frame, decode, open, dispatch.
// Per-frame failures are logged and dropped; only AuthError and shutdown end it.
class RelayEngine {
public:
    struct Stats {
        uint64_t frames = 0;
        uint64_t dispatched = 0;
        uint64_t dropped = 0;
        uint64_t reconnects = 0;
        uint64_t backfills = 0;
    };

    // An empty key disables decryption; sealed events are then dropped.
    // `api` serves tickle backfill and may be null.
    RelayEngine(StreamSession& stream, NotificationDispatcher& dispatcher,
                Key key, PushbulletApi* api = nullptr, uint32_t backfill_limit = 10);

    // Connect and relay until shutdown. Throws AuthError.
    void run(const std::string& access_token);

    // Route one raw frame. Throws only AuthError (from backfill).
    void handle_frame(const std::string& raw);

    static constexpr uint32_t kMaxBackfillPages = 10;

    // Fetch and dispatch pushes modified since the cursor, following up to
    // kMaxBackfillPages history pages.
    void backfill();

    // Pushes modified at or before this time are not backfilled.
    void set_backfill_cursor(double modified_after) { cursor_ = modified_after; }
    double backfill_cursor() const { return cursor_; }

    void set_event_bus(EventBus* bus) { event_bus_ = bus; }

    const Stats& stats() const { return stats_; }

private:
    void route(StreamEvent& event);
    bool open(StreamEvent& event);
    void dispatch(const StreamEvent& event);
    void report_drop(const std::string& event_id, const char* reason, const std::string& detail);

    StreamSession& stream_;
    NotificationDispatcher& dispatcher_;
    Key key_;
    PushbulletApi* api_;
    uint32_t backfill_limit_;
    EventBus* event_bus_ = nullptr;
    double cursor_ = 0.0;
    Stats stats_;
};

} // namespace pbrelay
