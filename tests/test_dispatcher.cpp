#include <catch2/catch.hpp>
#include "dispatcher.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "pushbullet_api.hpp"
#include "mock_http_client.hpp"
#include "mock_sink.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <unistd.h>

using namespace pbrelay;

static SinkConfig test_sink_config() {
    SinkConfig cfg;
    cfg.app_name = "Pushbullet";
    cfg.app_icon = "pushbullet";
    cfg.expire_timeout_ms = 4000;
    cfg.icon_cache_dir = "";
    return cfg;
}

static StreamEvent note(const std::string& iden, const std::string& title,
                        const std::string& body) {
    StreamEvent ev;
    ev.type = EventType::Push;
    ev.event_id = "push:" + iden;
    ev.source_device_id = "dev1";
    ev.push.push_type = PushType::Note;
    ev.push.title = title;
    ev.push.body = body;
    return ev;
}

static StreamEvent mirror(const std::string& key, const std::string& title,
                          const std::string& body) {
    StreamEvent ev;
    ev.type = EventType::Mirror;
    ev.event_id = "mirror:" + key + "/" + title + "/" + body;
    ev.source_device_id = "dev1";
    ev.mirror.app_package = "org.thoughtcrime.securesms";
    ev.mirror.app_name = "Signal";
    ev.mirror.notification_key = key;
    ev.mirror.title = title;
    ev.mirror.body = body;
    return ev;
}

static StreamEvent dismissal(const std::string& key) {
    StreamEvent ev;
    ev.type = EventType::Dismiss;
    ev.event_id = "dismiss:" + key;
    ev.dismiss.notification_key = key;
    return ev;
}

// ── Pushes ──────────────────────────────────────────────────────

TEST_CASE("Dispatcher: push creates one notification", "[dispatcher]") {
    DedupStore store(64, 0);
    MockSink sink;
    NotificationDispatcher d(store, sink, test_sink_config());

    REQUIRE(d.dispatch(note("a", "Groceries", "milk")) == DispatchResult::Created);
    REQUIRE(sink.count("create") == 1);

    const auto& n = sink.calls[0].notification;
    REQUIRE(n.title == "Groceries");
    REQUIRE(n.body == "milk");
    REQUIRE(n.app_name == "Pushbullet");
    REQUIRE(n.icon == "pushbullet");
    REQUIRE(n.expire_timeout_ms == 4000);
}

TEST_CASE("Dispatcher: redelivered push is a duplicate", "[dispatcher]") {
    DedupStore store(64, 0);
    MockSink sink;
    NotificationDispatcher d(store, sink, test_sink_config());

    REQUIRE(d.dispatch(note("a", "T", "B")) == DispatchResult::Created);
    REQUIRE(d.dispatch(note("a", "T", "B")) == DispatchResult::Duplicate);
    REQUIRE(sink.calls.size() == 1);
}

TEST_CASE("Dispatcher: push bodies fall back to url or file name", "[dispatcher]") {
    DedupStore store(64, 0);
    MockSink sink;
    NotificationDispatcher d(store, sink, test_sink_config());

    StreamEvent link = note("l", "Article", "");
    link.push.push_type = PushType::Link;
    link.push.url = "https://example.com/a";
    REQUIRE(d.render_push(link).body == "https://example.com/a");

    StreamEvent file = note("f", "", "see attached");
    file.push.push_type = PushType::File;
    file.push.file_name = "scan.pdf";
    Notification n = d.render_push(file);
    REQUIRE(n.title == "scan.pdf");
    REQUIRE(n.body == "see attached");
}

TEST_CASE("Dispatcher: untitled push without api uses the app name", "[dispatcher]") {
    DedupStore store(64, 0);
    MockSink sink;
    NotificationDispatcher d(store, sink, test_sink_config());
    REQUIRE(d.render_push(note("x", "  ", " hi ")).title == "Pushbullet");
    REQUIRE(d.render_push(note("x", "  ", " hi ")).body == "hi");
}

TEST_CASE("Dispatcher: untitled push uses the device nickname", "[dispatcher]") {
    MockHttpClient http;
    http.next_response = {200, R"({"devices":[
        {"iden":"dev1","nickname":"Pixel 8"},
        {"iden":"dev2","model":"SM-G991B"}]})"};
    PushbulletApi api(http, "o.token");

    DedupStore store(64, 0);
    MockSink sink;
    NotificationDispatcher d(store, sink, test_sink_config(), &api);

    REQUIRE(d.render_push(note("x", "", "hello")).title == "Pixel 8");

    StreamEvent other = note("y", "", "hello");
    other.source_device_id = "dev2";
    REQUIRE(d.render_push(other).title == "SM-G991B");

    other.source_device_id = "dev-unknown";
    REQUIRE(d.render_push(other).title == "Pushbullet");
    REQUIRE(http.call_count == 1);
}

TEST_CASE("Dispatcher: device tickle drops the nickname cache", "[dispatcher]") {
    MockHttpClient http;
    http.next_response = {200, R"({"devices":[{"iden":"dev1","nickname":"Old"}]})"};
    PushbulletApi api(http, "o.token");

    DedupStore store(64, 0);
    MockSink sink;
    NotificationDispatcher d(store, sink, test_sink_config(), &api);
    REQUIRE(d.render_push(note("x", "", "b")).title == "Old");

    StreamEvent tickle;
    tickle.type = EventType::DeviceState;
    tickle.device.subtype = "device";
    REQUIRE(d.dispatch(tickle) == DispatchResult::Ignored);

    http.next_response = {200, R"({"devices":[{"iden":"dev1","nickname":"New"}]})"};
    REQUIRE(d.render_push(note("x", "", "b")).title == "New");
    REQUIRE(http.call_count == 2);
}

TEST_CASE("Dispatcher: empty push is ignored", "[dispatcher]") {
    DedupStore store(64, 0);
    MockSink sink;
    SinkConfig cfg = test_sink_config();
    cfg.app_name = "";
    NotificationDispatcher d(store, sink, cfg);

    REQUIRE(d.dispatch(note("e", "", "")) == DispatchResult::Ignored);
    REQUIRE(sink.calls.empty());
}

// ── Mirrors and dismissals ──────────────────────────────────────

TEST_CASE("Dispatcher: mirror title carries the app name", "[dispatcher]") {
    DedupStore store(64, 0);
    MockSink sink;
    NotificationDispatcher d(store, sink, test_sink_config());

    Notification n = d.render_mirror(mirror("k", " Alice ", " See you "));
    REQUIRE(n.title == "[Signal] Alice");
    REQUIRE(n.body == "See you");
    REQUIRE(n.icon == "pushbullet");
}

TEST_CASE("Dispatcher: changed mirror updates in place", "[dispatcher]") {
    DedupStore store(64, 0);
    MockSink sink;
    NotificationDispatcher d(store, sink, test_sink_config());

    REQUIRE(d.dispatch(mirror("dev1|sig||1", "Alice", "1 message")) == DispatchResult::Created);
    REQUIRE(d.dispatch(mirror("dev1|sig||1", "Alice", "2 messages")) == DispatchResult::Updated);
    REQUIRE(d.dispatch(mirror("dev1|sig||1", "Alice", "2 messages")) == DispatchResult::Duplicate);

    REQUIRE(sink.count("create") == 1);
    REQUIRE(sink.count("update") == 1);
    REQUIRE(sink.calls[1].id == sink.calls[0].id);
    REQUIRE(sink.visible.size() == 1);
    REQUIRE(sink.visible.begin()->second.body == "2 messages");
}

TEST_CASE("Dispatcher: dismissal closes the mirrored notification", "[dispatcher]") {
    DedupStore store(64, 0);
    MockSink sink;
    NotificationDispatcher d(store, sink, test_sink_config());

    d.dispatch(mirror("dev1|sig||1", "Alice", "hi"));
    REQUIRE(d.dispatch(dismissal("dev1|sig||1")) == DispatchResult::Dismissed);
    REQUIRE(sink.visible.empty());
    REQUIRE(sink.calls.back().op == "dismiss");
    REQUIRE(sink.calls.back().id == sink.calls.front().id);

    // Second dismissal is a no-op
    REQUIRE(d.dispatch(dismissal("dev1|sig||1")) == DispatchResult::Ignored);
    REQUIRE(sink.count("dismiss") == 1);
}

TEST_CASE("Dispatcher: dismissal before the mirror is ignored", "[dispatcher]") {
    DedupStore store(64, 0);
    MockSink sink;
    NotificationDispatcher d(store, sink, test_sink_config());

    REQUIRE(d.dispatch(dismissal("dev1|sig||9")) == DispatchResult::Ignored);
    REQUIRE(d.dispatch(mirror("dev1|sig||9", "Bob", "yo")) == DispatchResult::Created);
    REQUIRE(sink.visible.size() == 1);
}

TEST_CASE("Dispatcher: mirror after dismissal creates a new notification", "[dispatcher]") {
    DedupStore store(64, 0);
    MockSink sink;
    NotificationDispatcher d(store, sink, test_sink_config());

    d.dispatch(mirror("k", "A", "one"));
    d.dispatch(dismissal("k"));
    REQUIRE(d.dispatch(mirror("k", "A", "two")) == DispatchResult::Created);
    REQUIRE(sink.count("create") == 2);
}

TEST_CASE("Dispatcher: identical mirror re-posted after dismissal shows again", "[dispatcher]") {
    DedupStore store(64, 0);
    MockSink sink;
    NotificationDispatcher d(store, sink, test_sink_config());

    REQUIRE(d.dispatch(mirror("k", "Battery", "low")) == DispatchResult::Created);
    REQUIRE(d.dispatch(dismissal("k")) == DispatchResult::Dismissed);
    REQUIRE(d.dispatch(mirror("k", "Battery", "low")) == DispatchResult::Created);

    REQUIRE(sink.count("create") == 2);
    REQUIRE(sink.visible.size() == 1);
    // Still a duplicate while it is on screen
    REQUIRE(d.dispatch(mirror("k", "Battery", "low")) == DispatchResult::Duplicate);
}

TEST_CASE("Dispatcher: mirror returning to earlier content updates again", "[dispatcher]") {
    DedupStore store(64, 0);
    MockSink sink;
    NotificationDispatcher d(store, sink, test_sink_config());

    REQUIRE(d.dispatch(mirror("k", "Timer", "A")) == DispatchResult::Created);
    REQUIRE(d.dispatch(mirror("k", "Timer", "B")) == DispatchResult::Updated);
    REQUIRE(d.dispatch(mirror("k", "Timer", "A")) == DispatchResult::Updated);

    REQUIRE(sink.visible.size() == 1);
    REQUIRE(sink.visible.begin()->second.body == "A");
}

TEST_CASE("Dispatcher: update records the id the sink reports", "[dispatcher]") {
    DedupStore store(64, 0);
    MockSink sink;
    NotificationDispatcher d(store, sink, test_sink_config());

    d.dispatch(mirror("k", "Alice", "1 message"));
    uint32_t first = sink.calls.back().id;

    sink.reassign_on_update = true;
    REQUIRE(d.dispatch(mirror("k", "Alice", "2 messages")) == DispatchResult::Updated);
    uint32_t second = sink.calls.back().id;
    REQUIRE(second != first);
    REQUIRE(store.lookup_rendered("k") == second);

    REQUIRE(d.dispatch(dismissal("k")) == DispatchResult::Dismissed);
    REQUIRE(sink.calls.back().id == second);
    REQUIRE(sink.visible.empty());
}

TEST_CASE("Dispatcher: non-dismissible mirror is persistent", "[dispatcher]") {
    DedupStore store(64, 0);
    MockSink sink;
    NotificationDispatcher d(store, sink, test_sink_config());

    StreamEvent ongoing = mirror("k", "Navigation", "Turn left");
    ongoing.mirror.dismissible = false;
    REQUIRE(d.render_mirror(ongoing).persistent);
    REQUIRE_FALSE(d.render_mirror(mirror("k", "Alice", "hi")).persistent);
}

// ── Sink failures ───────────────────────────────────────────────

TEST_CASE("Dispatcher: sink failure is reported, not thrown", "[dispatcher]") {
    DedupStore store(64, 0);
    MockSink sink;
    sink.fail = true;
    NotificationDispatcher d(store, sink, test_sink_config());

    EventBus bus;
    std::string reason;
    subscribe<EventDroppedEvent>(bus, [&](const EventDroppedEvent& ev) { reason = ev.reason; });
    d.set_event_bus(&bus);

    REQUIRE(d.dispatch(note("a", "T", "B")) == DispatchResult::SinkFailed);
    REQUIRE(reason == "sink");

    // Not retried: the id was admitted
    sink.fail = false;
    REQUIRE(d.dispatch(note("a", "T", "B")) == DispatchResult::Duplicate);
}

TEST_CASE("Dispatcher: failed dismissal keeps the mapping", "[dispatcher]") {
    DedupStore store(64, 0);
    MockSink sink;
    NotificationDispatcher d(store, sink, test_sink_config());

    d.dispatch(mirror("k", "A", "one"));
    sink.fail = true;
    REQUIRE(d.dispatch(dismissal("k")) == DispatchResult::SinkFailed);
    REQUIRE(store.lookup_rendered("k").has_value());

    sink.fail = false;
    REQUIRE(d.dispatch(dismissal("k")) == DispatchResult::Dismissed);
}

// ── Events ──────────────────────────────────────────────────────

TEST_CASE("Dispatcher: rendered and dismissed events are published", "[dispatcher]") {
    DedupStore store(64, 0);
    MockSink sink;
    NotificationDispatcher d(store, sink, test_sink_config());

    EventBus bus;
    std::vector<bool> updates;
    std::vector<std::string> dismissed;
    subscribe<NotificationRenderedEvent>(bus, [&](const NotificationRenderedEvent& ev) {
        updates.push_back(ev.updated);
    });
    subscribe<NotificationDismissedEvent>(bus, [&](const NotificationDismissedEvent& ev) {
        dismissed.push_back(ev.notification_key);
    });
    d.set_event_bus(&bus);

    d.dispatch(mirror("k", "A", "one"));
    d.dispatch(mirror("k", "A", "two"));
    d.dispatch(dismissal("k"));

    REQUIRE(updates == std::vector<bool>{false, true});
    REQUIRE(dismissed == std::vector<std::string>{"k"});
}

TEST_CASE("Dispatcher: sealed events are not rendered", "[dispatcher]") {
    DedupStore store(64, 0);
    MockSink sink;
    NotificationDispatcher d(store, sink, test_sink_config());

    StreamEvent sealed;
    sealed.type = EventType::Sealed;
    sealed.encrypted = true;
    REQUIRE(d.dispatch(sealed) == DispatchResult::Ignored);
    REQUIRE(sink.calls.empty());
}

// ── Icon cache ──────────────────────────────────────────────────

TEST_CASE("Dispatcher: mirror icon is cached per package", "[dispatcher]") {
    auto dir = std::filesystem::temp_directory_path() /
               ("pbrelay_icons_" + std::to_string(::getpid()));
    SinkConfig cfg = test_sink_config();
    cfg.icon_cache_dir = dir.string();

    DedupStore store(64, 0);
    MockSink sink;
    NotificationDispatcher d(store, sink, cfg);

    StreamEvent ev = mirror("k", "A", "B");
    ev.mirror.app_package = "com.example/app";
    ev.mirror.icon_bytes = "\xff\xd8jpeg";

    Notification n = d.render_mirror(ev);
    REQUIRE(n.icon == (dir / "com.example_app.jpg").string());

    std::ifstream in(n.icon, std::ios::binary);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(content == "\xff\xd8jpeg");

    std::filesystem::remove_all(dir);
}

TEST_CASE("dispatch_result_name: stable names", "[dispatcher]") {
    REQUIRE(std::string(dispatch_result_name(DispatchResult::Created)) == "created");
    REQUIRE(std::string(dispatch_result_name(DispatchResult::SinkFailed)) == "sink-failed");
}
