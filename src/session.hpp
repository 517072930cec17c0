#pragma once
#include "backoff.hpp"
#include "config.hpp"
#include "transport.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace pbrelay {

class EventBus; // forward declaration

enum class SessionState { Disconnected, Connecting, Connected, Reconnecting, Terminated };

const char* session_state_name(SessionState state);

// Connection state for one account. Re-used across reconnects: the transport
// is replaced, the identity and backoff state are kept.
struct Session {
    Session(std::string token, const BackoffPolicy& policy, uint64_t seed)
        : access_token(std::move(token)), backoff(policy, seed) {}

    std::string access_token; // never logged
    SessionState state = SessionState::Disconnected;
    std::unique_ptr<StreamTransport> transport;
    std::chrono::steady_clock::time_point last_heartbeat{};
    Backoff backoff;
    std::chrono::steady_clock::time_point next_retry{};
    uint32_t generation = 0; // successful connects so far
};

// Sleep for the given duration; false when interrupted by shutdown.
using SleepFn = std::function<bool(std::chrono::milliseconds)>;

// Drives the realtime connection lifecycle:
// Disconnected -> Connecting -> Connected -> {Reconnecting -> Connecting, Terminated}
class StreamSession {
public:
    StreamSession(TransportFactory factory, const StreamConfig& config,
                  const std::atomic<bool>* shutdown = nullptr,
                  SleepFn sleeper = {});
    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    // Session in state Disconnected, not yet connected.
    Session open(const std::string& access_token);

    // Open the session's transport. Throws AuthError (state Terminated) or
    // TransportError (state Disconnected).
    void connect(Session& session);

    // open() + connect() in one step.
    Session connect(const std::string& access_token);

    // Block until the next non-heartbeat frame. Throws TransportError with
    // kind Disconnected, Timeout (no frame for heartbeat_timeout_ms) or
    // ShutdownRequested.
    std::string next_frame(Session& session);

    // Wait out the backoff delay and connect again, repeating until it works.
    // False when shutdown interrupted it (state Terminated). AuthError is
    // rethrown with state Terminated.
    bool reconnect(Session& session);

    // Close the transport for good.
    void terminate(Session& session);

    void set_event_bus(EventBus* bus) { event_bus_ = bus; }

    BackoffPolicy backoff_policy() const;

private:
    bool shutdown_requested() const;
    void set_state(Session& session, SessionState state);
    bool default_sleep(std::chrono::milliseconds delay) const;

    TransportFactory factory_;
    StreamConfig config_;
    const std::atomic<bool>* shutdown_;
    SleepFn sleeper_;
    EventBus* event_bus_ = nullptr;
};

} // namespace pbrelay
