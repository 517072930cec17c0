#include "engine.hpp"
#include "decoder.hpp"
#include "errors.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "pushbullet_api.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>

namespace pbrelay {

RelayEngine::RelayEngine(StreamSession& stream, NotificationDispatcher& dispatcher,
                         Key key, PushbulletApi* api, uint32_t backfill_limit)
    : stream_(stream), dispatcher_(dispatcher), key_(std::move(key)), api_(api),
      backfill_limit_(backfill_limit == 0 ? 1 : backfill_limit)
{}

void RelayEngine::report_drop(const std::string& event_id, const char* reason,
                              const std::string& detail) {
    stats_.dropped++;
    if (!event_bus_) return;
    EventDroppedEvent ev;
    ev.event_id = event_id;
    ev.reason = reason;
    ev.detail = detail;
    event_bus_->publish(ev);
}

void RelayEngine::run(const std::string& access_token) {
    if (cursor_ <= 0.0) cursor_ = epoch_seconds_precise();

    Session session = stream_.open(access_token);
    try {
        try {
            stream_.connect(session);
        } catch (const TransportError& e) {
            std::cerr << "[stream] Connect failed: " << e.what() << "\n";
            if (!stream_.reconnect(session)) return;
        }
        std::cerr << "[relay] Listening for pushes\n";

        while (true) {
            std::string raw;
            try {
                raw = stream_.next_frame(session);
            } catch (const TransportError& e) {
                if (e.kind() == TransportError::Kind::ShutdownRequested) {
                    stream_.terminate(session);
                    return;
                }
                std::cerr << "[stream] " << e.what() << "\n";
                stats_.reconnects++;
                if (!stream_.reconnect(session)) return;
                backfill(); // pushes sent while the stream was down
                continue;
            }
            handle_frame(raw);
        }
    } catch (const AuthError&) {
        stream_.terminate(session);
        throw;
    }
}

void RelayEngine::handle_frame(const std::string& raw) {
    stats_.frames++;

    DecodedFrame frame;
    try {
        frame = decode(raw, epoch_seconds_precise());
    } catch (const MalformedFrame& e) {
        std::cerr << "[relay] Dropping malformed frame: " << e.what() << "\n";
        report_drop("", drop_reasons::Malformed, e.what());
        return;
    }

    switch (frame.kind) {
        case FrameKind::Heartbeat:
            return;
        case FrameKind::Ignored:
            if (verbose()) std::cerr << "[relay] Ignoring frame: " << raw << "\n";
            return;
        case FrameKind::Tickle:
            if (verbose()) std::cerr << "[relay] Tickle: " << frame.tickle_subtype << "\n";
            if (frame.tickle_subtype == "push") backfill();
            return;
        case FrameKind::Event:
            route(frame.event);
            return;
    }
}

// Decrypt a sealed event in place. False when it should be dropped.
bool RelayEngine::open(StreamEvent& event) {
    if (key_.empty()) {
        std::cerr << "[crypto] Encrypted push received but no encryption password is set\n";
        secure_clear(event.payload);
        report_drop(event.event_id, drop_reasons::Decryption, "encryption disabled");
        return false;
    }

    std::string plaintext;
    try {
        plaintext = decrypt_message(key_, event.payload);
    } catch (const DecryptionFailure& e) {
        secure_clear(event.payload);
        std::cerr << "[crypto] Cannot decrypt push: " << e.what() << "\n";
        report_drop(event.event_id, drop_reasons::Decryption, e.what());
        return false;
    }

    FrameKind kind;
    try {
        kind = open_sealed(event, plaintext);
    } catch (const MalformedFrame& e) {
        secure_clear(plaintext);
        std::cerr << "[relay] Dropping malformed encrypted push: " << e.what() << "\n";
        report_drop("", drop_reasons::Malformed, e.what());
        return false;
    }
    if (verbose()) std::cerr << "[crypto] Decrypted push: " << plaintext << "\n";
    secure_clear(plaintext);
    return kind == FrameKind::Event;
}

void RelayEngine::route(StreamEvent& event) {
    if (event.type == EventType::Sealed && !open(event)) return;
    dispatch(event);
}

void RelayEngine::dispatch(const StreamEvent& event) {
    DispatchResult result = dispatcher_.dispatch(event);
    stats_.dispatched++;
    if (verbose()) {
        std::cerr << "[relay] " << event_type_name(event.type) << " " << event.event_id
                  << ": " << dispatch_result_name(result) << "\n";
    }
}

void RelayEngine::backfill() {
    if (!api_) return;
    stats_.backfills++;

    // Follow page cursors so a long outage is not cut to the newest page.
    std::vector<nlohmann::json> pushes;
    try {
        PushPage page = api_->fetch_pushes(cursor_, backfill_limit_);
        pushes = std::move(page.pushes);
        uint32_t pages = 1;
        while (!page.cursor.empty() && pages < kMaxBackfillPages) {
            page = api_->fetch_pushes(cursor_, backfill_limit_, page.cursor);
            pages++;
            for (auto& p : page.pushes) pushes.push_back(std::move(p));
        }
        if (!page.cursor.empty()) {
            std::cerr << "[api] Push history truncated after " << pages
                      << " pages; older pushes are skipped\n";
        }
    } catch (const ApiError& e) {
        std::cerr << "[api] Push history unavailable: " << e.what() << "\n";
        return;
    }

    // The API lists newest first; render in the order they were sent.
    double now = epoch_seconds_precise();
    for (auto it = pushes.rbegin(); it != pushes.rend(); ++it) {
        auto modified = it->find("modified");
        if (modified != it->end() && modified->is_number())
            cursor_ = std::max(cursor_, modified->get<double>());

        DecodedFrame frame;
        try {
            frame = decode_push_object(*it, now);
        } catch (const MalformedFrame& e) {
            std::cerr << "[relay] Dropping malformed push: " << e.what() << "\n";
            report_drop("", drop_reasons::Malformed, e.what());
            continue;
        }
        if (frame.kind == FrameKind::Event) dispatch(frame.event);
    }
}

} // namespace pbrelay
