#include "session.hpp"
#include "decoder.hpp"
#include "errors.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>
#include <random>
#include <thread>

namespace pbrelay {

static constexpr std::chrono::milliseconds kReceiveSlice{1000};
static constexpr std::chrono::milliseconds kSleepSlice{100};

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Disconnected: return "disconnected";
        case SessionState::Connecting:   return "connecting";
        case SessionState::Connected:    return "connected";
        case SessionState::Reconnecting: return "reconnecting";
        case SessionState::Terminated:   return "terminated";
    }
    return "unknown";
}

StreamSession::StreamSession(TransportFactory factory, const StreamConfig& config,
                             const std::atomic<bool>* shutdown, SleepFn sleeper)
    : factory_(std::move(factory)), config_(config), shutdown_(shutdown),
      sleeper_(std::move(sleeper))
{
    if (!sleeper_) {
        sleeper_ = [this](std::chrono::milliseconds d) { return default_sleep(d); };
    }
}

BackoffPolicy StreamSession::backoff_policy() const {
    BackoffPolicy policy;
    policy.base = std::chrono::milliseconds(config_.backoff_base_ms);
    policy.max = std::chrono::milliseconds(config_.backoff_max_ms);
    policy.jitter = config_.backoff_jitter;
    return policy;
}

bool StreamSession::shutdown_requested() const {
    return shutdown_ && shutdown_->load(std::memory_order_relaxed);
}

bool StreamSession::default_sleep(std::chrono::milliseconds delay) const {
    auto deadline = std::chrono::steady_clock::now() + delay;
    while (true) {
        if (shutdown_requested()) return false;
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return true;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(left, kSleepSlice));
    }
}

void StreamSession::set_state(Session& session, SessionState state) {
    if (session.state == state) return;
    SessionState from = session.state;
    session.state = state;

    if (verbose()) {
        std::cerr << "[stream] " << session_state_name(from) << " -> "
                  << session_state_name(state) << "\n";
    }
    if (event_bus_) {
        SessionStateChangedEvent ev;
        ev.from = from;
        ev.to = state;
        ev.attempt = session.backoff.attempts();
        event_bus_->publish(ev);
    }
}

Session StreamSession::open(const std::string& access_token) {
    return Session(access_token, backoff_policy(), std::random_device{}());
}

void StreamSession::connect(Session& session) {
    if (session.transport) {
        session.transport->close();
        session.transport.reset();
    }
    set_state(session, SessionState::Connecting);

    try {
        session.transport = factory_();
        session.transport->connect(session.access_token);
    } catch (const AuthError&) {
        terminate(session);
        throw;
    } catch (const TransportError&) {
        if (session.transport) session.transport->close();
        session.transport.reset();
        set_state(session, SessionState::Disconnected);
        throw;
    }

    session.last_heartbeat = std::chrono::steady_clock::now();
    session.backoff.reset();
    session.next_retry = {};
    session.generation++;
    set_state(session, SessionState::Connected);
}

Session StreamSession::connect(const std::string& access_token) {
    Session session = open(access_token);
    connect(session);
    return session;
}

std::string StreamSession::next_frame(Session& session) {
    if (session.state != SessionState::Connected || !session.transport) {
        throw TransportError(TransportError::Kind::Disconnected, "session not connected");
    }

    auto stale_after = std::chrono::milliseconds(config_.heartbeat_timeout_ms);
    while (true) {
        if (shutdown_requested()) {
            throw TransportError(TransportError::Kind::ShutdownRequested, "shutdown requested");
        }

        auto idle = std::chrono::steady_clock::now() - session.last_heartbeat;
        if (idle >= stale_after) {
            throw TransportError(TransportError::Kind::Timeout,
                                 "no frame for " + std::to_string(config_.heartbeat_timeout_ms) + "ms");
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(stale_after - idle);
        auto slice = std::max(std::chrono::milliseconds(1), std::min(left, kReceiveSlice));

        std::optional<std::string> frame;
        try {
            frame = session.transport->receive(slice);
        } catch (const TransportError&) {
            // An aborted read surfaces as a disconnect; report the real cause.
            if (shutdown_requested()) {
                throw TransportError(TransportError::Kind::ShutdownRequested, "shutdown requested");
            }
            throw;
        }
        if (!frame) continue;

        session.last_heartbeat = std::chrono::steady_clock::now();
        if (is_heartbeat(*frame)) {
            if (verbose()) std::cerr << "[stream] heartbeat\n";
            continue;
        }
        return std::move(*frame);
    }
}

bool StreamSession::reconnect(Session& session) {
    if (shutdown_requested()) {
        terminate(session);
        return false;
    }
    if (session.transport) {
        session.transport->close();
        session.transport.reset();
    }

    while (true) {
        set_state(session, SessionState::Reconnecting);
        auto delay = session.backoff.next_delay();
        session.next_retry = std::chrono::steady_clock::now() + delay;
        std::cerr << "[stream] Reconnecting in " << delay.count() << "ms (attempt "
                  << session.backoff.attempts() << ")\n";

        if (!sleeper_(delay) || shutdown_requested()) {
            terminate(session);
            return false;
        }

        try {
            connect(session);
            std::cerr << "[stream] Reconnected\n";
            return true;
        } catch (const TransportError& e) {
            std::cerr << "[stream] Connect failed: " << e.what() << "\n";
        }
    }
}

void StreamSession::terminate(Session& session) {
    if (session.transport) {
        session.transport->close();
        session.transport.reset();
    }
    set_state(session, SessionState::Terminated);
}

} // namespace pbrelay
