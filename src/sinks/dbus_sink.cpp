#include "dbus_sink.hpp"
#include "../errors.hpp"
#include "../plugin.hpp"
#include "../util.hpp"

#include <dbus/dbus.h>
#include <iostream>

static pbrelay::SinkRegistrar reg_dbus("dbus",
    [](const pbrelay::Config&) -> std::unique_ptr<pbrelay::NotificationSink> {
        return std::make_unique<pbrelay::DbusSink>();
    });

namespace pbrelay {

static const char* kService = "org.freedesktop.Notifications";
static const char* kPath = "/org/freedesktop/Notifications";
static const char* kInterface = "org.freedesktop.Notifications";

// ── RAII helpers ──────────────────────────────────────────────

struct DbusErrorGuard {
    DBusError err;
    DbusErrorGuard() { dbus_error_init(&err); }
    ~DbusErrorGuard() { dbus_error_free(&err); }
    DbusErrorGuard(const DbusErrorGuard&) = delete;
    DbusErrorGuard& operator=(const DbusErrorGuard&) = delete;

    bool is_set() const { return dbus_error_is_set(&err); }
    std::string message() const {
        return is_set() && err.message ? err.message : "unknown D-Bus error";
    }
};

struct MessageGuard {
    DBusMessage* msg = nullptr;
    explicit MessageGuard(DBusMessage* m) : msg(m) {}
    ~MessageGuard() { if (msg) dbus_message_unref(msg); }
    MessageGuard(const MessageGuard&) = delete;
    MessageGuard& operator=(const MessageGuard&) = delete;
};

DbusSink::~DbusSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    drop_connection();
}

DBusConnection* DbusSink::connection() {
    // Must be called with mutex_ already held.
    if (conn_ && dbus_connection_get_is_connected(conn_)) return conn_;
    drop_connection();

    DbusErrorGuard e;
    conn_ = dbus_bus_get(DBUS_BUS_SESSION, &e.err);
    if (!conn_) {
        throw SinkUnavailable("cannot connect to session bus: " + e.message());
    }
    // Shared bus connections exit the process on disconnect by default
    dbus_connection_set_exit_on_disconnect(conn_, FALSE);
    return conn_;
}

void DbusSink::drop_connection() {
    if (conn_) {
        dbus_connection_unref(conn_);
        conn_ = nullptr;
    }
}

uint32_t DbusSink::notify(uint32_t replaces_id, const Notification& n) {
    std::lock_guard<std::mutex> lock(mutex_);
    DBusConnection* conn = connection();

    MessageGuard call(dbus_message_new_method_call(kService, kPath, kInterface, "Notify"));
    if (!call.msg) throw SinkUnavailable("out of memory building Notify call");

    const char* app_name = n.app_name.c_str();
    const char* icon = n.icon.c_str();
    const char* summary = n.title.c_str();
    const char* body = n.body.c_str();
    dbus_uint32_t replaces = replaces_id;
    dbus_int32_t expire = n.persistent ? 0 : n.expire_timeout_ms;

    DBusMessageIter args;
    DBusMessageIter actions;
    DBusMessageIter hints;
    DBusMessageIter entry;
    DBusMessageIter value;
    const char* resident_key = "resident";
    dbus_bool_t resident = TRUE;
    dbus_message_iter_init_append(call.msg, &args);
    bool ok =
        dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &app_name) &&
        dbus_message_iter_append_basic(&args, DBUS_TYPE_UINT32, &replaces) &&
        dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &icon) &&
        dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &summary) &&
        dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &body) &&
        dbus_message_iter_open_container(&args, DBUS_TYPE_ARRAY, "s", &actions) &&
        dbus_message_iter_close_container(&args, &actions) &&
        dbus_message_iter_open_container(&args, DBUS_TYPE_ARRAY, "{sv}", &hints);
    if (ok && n.persistent) {
        // Keep ongoing phone notifications on screen until the phone dismisses them
        ok = dbus_message_iter_open_container(&hints, DBUS_TYPE_DICT_ENTRY, nullptr, &entry) &&
             dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &resident_key) &&
             dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "b", &value) &&
             dbus_message_iter_append_basic(&value, DBUS_TYPE_BOOLEAN, &resident) &&
             dbus_message_iter_close_container(&entry, &value) &&
             dbus_message_iter_close_container(&hints, &entry);
    }
    ok = ok &&
        dbus_message_iter_close_container(&args, &hints) &&
        dbus_message_iter_append_basic(&args, DBUS_TYPE_INT32, &expire);
    if (!ok) throw SinkUnavailable("out of memory building Notify arguments");

    DbusErrorGuard e;
    MessageGuard reply(dbus_connection_send_with_reply_and_block(
        conn, call.msg, kCallTimeoutMs, &e.err));
    if (!reply.msg) {
        if (!dbus_connection_get_is_connected(conn)) drop_connection();
        throw SinkUnavailable("Notify failed: " + e.message());
    }

    dbus_uint32_t id = 0;
    DbusErrorGuard parse;
    if (!dbus_message_get_args(reply.msg, &parse.err, DBUS_TYPE_UINT32, &id, DBUS_TYPE_INVALID)) {
        throw SinkUnavailable("unexpected Notify reply: " + parse.message());
    }
    return id;
}

uint32_t DbusSink::create(const Notification& notification) {
    return notify(0, notification);
}

uint32_t DbusSink::update(uint32_t notification_id, const Notification& notification) {
    uint32_t id = notify(notification_id, notification);
    if (id != notification_id && verbose()) {
        std::cerr << "[dbus] Server replaced notification " << notification_id
                  << " with " << id << "\n";
    }
    return id;
}

void DbusSink::dismiss(uint32_t notification_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    DBusConnection* conn = connection();

    MessageGuard call(dbus_message_new_method_call(kService, kPath, kInterface,
                                                   "CloseNotification"));
    if (!call.msg) throw SinkUnavailable("out of memory building CloseNotification call");

    dbus_uint32_t id = notification_id;
    if (!dbus_message_append_args(call.msg, DBUS_TYPE_UINT32, &id, DBUS_TYPE_INVALID)) {
        throw SinkUnavailable("out of memory building CloseNotification arguments");
    }

    DbusErrorGuard e;
    MessageGuard reply(dbus_connection_send_with_reply_and_block(
        conn, call.msg, kCallTimeoutMs, &e.err));
    if (!reply.msg) {
        if (!dbus_connection_get_is_connected(conn)) drop_connection();
        throw SinkUnavailable("CloseNotification failed: " + e.message());
    }
}

bool DbusSink::health_check() {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        DBusConnection* conn = connection();
        DbusErrorGuard e;
        bool has_owner = dbus_bus_name_has_owner(conn, kService, &e.err);
        if (e.is_set()) {
            std::cerr << "[dbus] Name lookup failed: " << e.message() << "\n";
            return false;
        }
        return has_owner;
    } catch (const SinkUnavailable& ex) {
        std::cerr << "[dbus] " << ex.what() << "\n";
        return false;
    }
}

} // namespace pbrelay
