#include <catch2/catch.hpp>
#include "session.hpp"
#include "errors.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "mock_transport.hpp"
#include <vector>

using namespace pbrelay;
using std::chrono::milliseconds;

static StreamConfig fast_config() {
    StreamConfig cfg;
    cfg.heartbeat_timeout_ms = 50;
    cfg.backoff_base_ms = 10;
    cfg.backoff_max_ms = 1000;
    cfg.backoff_jitter = 0.0;
    return cfg;
}

// Sleeper that records requested delays and returns immediately
struct RecordingSleeper {
    std::vector<milliseconds> delays;
    bool interrupt = false;

    SleepFn fn() {
        return [this](milliseconds d) {
            delays.push_back(d);
            return !interrupt;
        };
    }
};

// ── Connect ─────────────────────────────────────────────────────

TEST_CASE("StreamSession: connect reaches Connected", "[session]") {
    MockTransportState state;
    StreamSession ss(mock_transport_factory(state), fast_config());

    Session s = ss.connect("o.token");
    REQUIRE(s.state == SessionState::Connected);
    REQUIRE(s.transport != nullptr);
    REQUIRE(s.generation == 1);
    REQUIRE(state.tokens == std::vector<std::string>{"o.token"});
}

TEST_CASE("StreamSession: open leaves the session disconnected", "[session]") {
    MockTransportState state;
    StreamSession ss(mock_transport_factory(state), fast_config());

    Session s = ss.open("o.token");
    REQUIRE(s.state == SessionState::Disconnected);
    REQUIRE(s.transport == nullptr);
    REQUIRE(state.connects == 0);
}

TEST_CASE("StreamSession: failed connect returns to Disconnected", "[session]") {
    MockTransportState state;
    state.connect_outcomes = {ConnectOutcome::Fail};
    StreamSession ss(mock_transport_factory(state), fast_config());

    Session s = ss.open("o.token");
    REQUIRE_THROWS_AS(ss.connect(s), TransportError);
    REQUIRE(s.state == SessionState::Disconnected);
    REQUIRE(s.transport == nullptr);
}

TEST_CASE("StreamSession: rejected token terminates the session", "[session]") {
    MockTransportState state;
    state.connect_outcomes = {ConnectOutcome::Unauthorized};
    StreamSession ss(mock_transport_factory(state), fast_config());

    Session s = ss.open("o.revoked");
    REQUIRE_THROWS_AS(ss.connect(s), AuthError);
    REQUIRE(s.state == SessionState::Terminated);
}

// ── Frames ──────────────────────────────────────────────────────

TEST_CASE("StreamSession: heartbeats are absorbed", "[session]") {
    MockTransportState state;
    state.scripts.push_back(TransportScript()
        .frame(R"({"type":"nop"})")
        .idle()
        .frame(R"({"type":"nop"})")
        .frame(R"({"type":"tickle","subtype":"push"})"));
    StreamSession ss(mock_transport_factory(state), fast_config());

    Session s = ss.connect("o.token");
    REQUIRE(ss.next_frame(s) == R"({"type":"tickle","subtype":"push"})");
}

TEST_CASE("StreamSession: silence past the heartbeat timeout", "[session]") {
    MockTransportState state;
    state.scripts.push_back(TransportScript().idle().idle());
    StreamSession ss(mock_transport_factory(state), fast_config());

    Session s = ss.connect("o.token");
    try {
        ss.next_frame(s);
        FAIL("expected TransportError");
    } catch (const TransportError& e) {
        REQUIRE(e.kind() == TransportError::Kind::Timeout);
    }
}

TEST_CASE("StreamSession: peer disconnect surfaces as TransportError", "[session]") {
    MockTransportState state;
    state.scripts.push_back(TransportScript().disconnect());
    StreamSession ss(mock_transport_factory(state), fast_config());

    Session s = ss.connect("o.token");
    try {
        ss.next_frame(s);
        FAIL("expected TransportError");
    } catch (const TransportError& e) {
        REQUIRE(e.kind() == TransportError::Kind::Disconnected);
    }
}

TEST_CASE("StreamSession: shutdown flag stops next_frame", "[session]") {
    MockTransportState state;
    std::atomic<bool> stop{false};
    StreamSession ss(mock_transport_factory(state), fast_config(), &stop);

    Session s = ss.connect("o.token");
    stop = true;
    try {
        ss.next_frame(s);
        FAIL("expected TransportError");
    } catch (const TransportError& e) {
        REQUIRE(e.kind() == TransportError::Kind::ShutdownRequested);
    }
}

TEST_CASE("StreamSession: next_frame requires a connection", "[session]") {
    MockTransportState state;
    StreamSession ss(mock_transport_factory(state), fast_config());
    Session s = ss.open("o.token");
    REQUIRE_THROWS_AS(ss.next_frame(s), TransportError);
}

// ── Reconnect ───────────────────────────────────────────────────

TEST_CASE("StreamSession: reconnect backs off until a connect succeeds", "[session]") {
    MockTransportState state;
    state.connect_outcomes = {ConnectOutcome::Ok, ConnectOutcome::Fail,
                              ConnectOutcome::Fail, ConnectOutcome::Ok};
    RecordingSleeper sleeper;
    StreamSession ss(mock_transport_factory(state), fast_config(), nullptr, sleeper.fn());

    Session s = ss.connect("o.token");
    REQUIRE(ss.reconnect(s));
    REQUIRE(s.state == SessionState::Connected);
    REQUIRE(s.generation == 2);
    REQUIRE(sleeper.delays == std::vector<milliseconds>{milliseconds(10), milliseconds(20),
                                                        milliseconds(40)});
    REQUIRE(s.backoff.attempts() == 0);
    REQUIRE(state.tokens.size() == 4);
    REQUIRE(state.tokens.back() == "o.token");
}

TEST_CASE("StreamSession: backoff restarts after a successful reconnect", "[session]") {
    MockTransportState state;
    state.connect_outcomes = {ConnectOutcome::Ok, ConnectOutcome::Fail, ConnectOutcome::Ok,
                              ConnectOutcome::Ok};
    RecordingSleeper sleeper;
    StreamSession ss(mock_transport_factory(state), fast_config(), nullptr, sleeper.fn());

    Session s = ss.connect("o.token");
    REQUIRE(ss.reconnect(s));
    REQUIRE(ss.reconnect(s));
    REQUIRE(sleeper.delays == std::vector<milliseconds>{milliseconds(10), milliseconds(20),
                                                        milliseconds(10)});
}

TEST_CASE("StreamSession: jittered reconnect delays never decrease", "[session]") {
    MockTransportState state;
    state.connect_outcomes = {ConnectOutcome::Ok};
    for (int i = 0; i < 8; i++) state.connect_outcomes.push_back(ConnectOutcome::Fail);
    state.connect_outcomes.push_back(ConnectOutcome::Ok);

    StreamConfig cfg = fast_config();
    cfg.backoff_jitter = 0.25;
    cfg.backoff_max_ms = 500;
    RecordingSleeper sleeper;
    StreamSession ss(mock_transport_factory(state), cfg, nullptr, sleeper.fn());

    Session s = ss.connect("o.token");
    REQUIRE(ss.reconnect(s));
    REQUIRE(sleeper.delays.size() == 9);
    for (size_t i = 1; i < sleeper.delays.size(); i++) {
        REQUIRE(sleeper.delays[i] >= sleeper.delays[i - 1]);
        REQUIRE(sleeper.delays[i] <= milliseconds(500));
    }
}

TEST_CASE("StreamSession: only one transport is open at a time", "[session]") {
    MockTransportState state;
    state.connect_outcomes = {ConnectOutcome::Ok, ConnectOutcome::Ok, ConnectOutcome::Fail,
                              ConnectOutcome::Ok};
    RecordingSleeper sleeper;
    StreamSession ss(mock_transport_factory(state), fast_config(), nullptr, sleeper.fn());

    Session s = ss.connect("o.token");
    REQUIRE(ss.reconnect(s));
    REQUIRE(ss.reconnect(s));
    REQUIRE(state.max_open_transports == 1);
    REQUIRE(state.open_transports == 1);

    ss.terminate(s);
    REQUIRE(state.open_transports == 0);
    REQUIRE(s.state == SessionState::Terminated);
}

TEST_CASE("StreamSession: interrupted backoff terminates", "[session]") {
    MockTransportState state;
    RecordingSleeper sleeper;
    sleeper.interrupt = true;
    StreamSession ss(mock_transport_factory(state), fast_config(), nullptr, sleeper.fn());

    Session s = ss.connect("o.token");
    REQUIRE_FALSE(ss.reconnect(s));
    REQUIRE(s.state == SessionState::Terminated);
    REQUIRE(state.connects == 1);
}

TEST_CASE("StreamSession: shutdown before reconnect skips the wait", "[session]") {
    MockTransportState state;
    std::atomic<bool> stop{false};
    RecordingSleeper sleeper;
    StreamSession ss(mock_transport_factory(state), fast_config(), &stop, sleeper.fn());

    Session s = ss.connect("o.token");
    stop = true;
    REQUIRE_FALSE(ss.reconnect(s));
    REQUIRE(sleeper.delays.empty());
    REQUIRE(s.state == SessionState::Terminated);
}

TEST_CASE("StreamSession: revoked token during reconnect is terminal", "[session]") {
    MockTransportState state;
    state.connect_outcomes = {ConnectOutcome::Ok, ConnectOutcome::Fail,
                              ConnectOutcome::Unauthorized};
    RecordingSleeper sleeper;
    StreamSession ss(mock_transport_factory(state), fast_config(), nullptr, sleeper.fn());

    Session s = ss.connect("o.token");
    REQUIRE_THROWS_AS(ss.reconnect(s), AuthError);
    REQUIRE(s.state == SessionState::Terminated);
    REQUIRE(state.open_transports == 0);
}

// ── State change events ─────────────────────────────────────────

TEST_CASE("StreamSession: state changes are published", "[session]") {
    MockTransportState state;
    state.connect_outcomes = {ConnectOutcome::Ok, ConnectOutcome::Ok};
    RecordingSleeper sleeper;
    StreamSession ss(mock_transport_factory(state), fast_config(), nullptr, sleeper.fn());

    EventBus bus;
    std::vector<SessionState> seen;
    subscribe<SessionStateChangedEvent>(bus, [&](const SessionStateChangedEvent& ev) {
        seen.push_back(ev.to);
    });
    ss.set_event_bus(&bus);

    Session s = ss.connect("o.token");
    REQUIRE(ss.reconnect(s));
    ss.terminate(s);

    REQUIRE(seen == std::vector<SessionState>{
        SessionState::Connecting, SessionState::Connected,
        SessionState::Reconnecting, SessionState::Connecting, SessionState::Connected,
        SessionState::Terminated});
}
