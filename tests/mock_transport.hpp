#pragma once
#include "errors.hpp"
#include "transport.hpp"
#include <atomic>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pbrelay {

// Scripted stream. Each receive() pops one step: a frame, an idle slice
// (nullopt) or a disconnect. An empty script behaves as an idle connection.
struct TransportScript {
    enum class Step { Frame, Idle, Disconnect };

    struct Item {
        Step step;
        std::string frame;
    };

    std::deque<Item> items;

    TransportScript& frame(const std::string& f) { items.push_back({Step::Frame, f}); return *this; }
    TransportScript& idle() { items.push_back({Step::Idle, ""}); return *this; }
    TransportScript& disconnect() { items.push_back({Step::Disconnect, ""}); return *this; }
};

// How the next connect() attempt ends
enum class ConnectOutcome { Ok, Fail, Unauthorized };

// State shared between the test and every transport the factory creates.
struct MockTransportState {
    std::deque<ConnectOutcome> connect_outcomes; // empty = Ok
    std::deque<TransportScript> scripts;         // one per successful connect
    std::vector<std::string> tokens;
    int connects = 0;
    int closes = 0;
    int open_transports = 0;
    int max_open_transports = 0;
    std::atomic<bool>* stop_when_drained = nullptr; // raised once a script runs out
};

class MockTransport : public StreamTransport {
public:
    explicit MockTransport(MockTransportState& state) : state_(state) {}

    void connect(const std::string& access_token) override {
        state_.connects++;
        state_.tokens.push_back(access_token);

        ConnectOutcome outcome = ConnectOutcome::Ok;
        if (!state_.connect_outcomes.empty()) {
            outcome = state_.connect_outcomes.front();
            state_.connect_outcomes.pop_front();
        }
        if (outcome == ConnectOutcome::Unauthorized) throw AuthError("HTTP 401");
        if (outcome == ConnectOutcome::Fail) {
            throw TransportError(TransportError::Kind::Disconnected, "connection refused");
        }

        if (!state_.scripts.empty()) {
            script_ = std::move(state_.scripts.front());
            state_.scripts.pop_front();
        }
        open_ = true;
        state_.open_transports++;
        if (state_.open_transports > state_.max_open_transports)
            state_.max_open_transports = state_.open_transports;
    }

    std::optional<std::string> receive(std::chrono::milliseconds /*timeout*/) override {
        if (!open_) throw TransportError(TransportError::Kind::Disconnected, "not open");
        if (script_.items.empty()) {
            if (state_.stop_when_drained) state_.stop_when_drained->store(true);
            return std::nullopt;
        }

        auto item = script_.items.front();
        script_.items.pop_front();
        switch (item.step) {
            case TransportScript::Step::Frame:
                return item.frame;
            case TransportScript::Step::Idle:
                return std::nullopt;
            case TransportScript::Step::Disconnect:
                close();
                throw TransportError(TransportError::Kind::Disconnected, "peer closed");
        }
        return std::nullopt;
    }

    void close() override {
        if (!open_) return;
        open_ = false;
        state_.closes++;
        state_.open_transports--;
    }

    bool is_open() const override { return open_; }

    ~MockTransport() override { close(); }

private:
    MockTransportState& state_;
    TransportScript script_;
    bool open_ = false;
};

inline TransportFactory mock_transport_factory(MockTransportState& state) {
    return [&state]() -> std::unique_ptr<StreamTransport> {
        return std::make_unique<MockTransport>(state);
    };
}

} // namespace pbrelay
