#pragma once
#include "errors.hpp"
#include "sink.hpp"
#include <map>
#include <string>
#include <vector>

namespace pbrelay {

class MockSink : public NotificationSink {
public:
    struct Call {
        std::string op; // "create", "update" or "dismiss"
        uint32_t id = 0;
        Notification notification;
    };

    std::vector<Call> calls;
    std::map<uint32_t, Notification> visible;
    bool fail = false;
    uint32_t next_id = 100;
    bool reassign_on_update = false; // server already closed the old one

    std::string sink_name() const override { return "mock"; }

    uint32_t create(const Notification& n) override {
        if (fail) throw SinkUnavailable("mock sink down");
        uint32_t id = next_id++;
        calls.push_back({"create", id, n});
        visible[id] = n;
        return id;
    }

    uint32_t update(uint32_t id, const Notification& n) override {
        if (fail) throw SinkUnavailable("mock sink down");
        if (reassign_on_update) {
            visible.erase(id);
            id = next_id++;
        }
        calls.push_back({"update", id, n});
        visible[id] = n;
        return id;
    }

    void dismiss(uint32_t id) override {
        if (fail) throw SinkUnavailable("mock sink down");
        calls.push_back({"dismiss", id, {}});
        visible.erase(id);
    }

    size_t count(const std::string& op) const {
        size_t n = 0;
        for (const auto& c : calls) {
            if (c.op == op) n++;
        }
        return n;
    }
};

} // namespace pbrelay
