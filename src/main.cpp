#include "config.hpp"
#include "crypto.hpp"
#include "dedup_store.hpp"
#include "dispatcher.hpp"
#include "engine.hpp"
#include "errors.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "http.hpp"
#include "plugin.hpp"
#include "pushbullet_api.hpp"
#include "session.hpp"
#include "tls_connection.hpp"
#include "util.hpp"
#include "websocket.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <atomic>
#include <csignal>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: pbrelay [options]\n"
              << "\n"
              << "Relays Pushbullet pushes and mirrored phone notifications to the\n"
              << "desktop notification service.\n"
              << "\n"
              << "Options:\n"
              << "  -d, --debug          Output debugging information\n"
              << "  --sink NAME          Notification sink (";
    auto names = pbrelay::PluginRegistry::instance().sink_names();
    for (size_t i = 0; i < names.size(); i++) {
        std::cout << (i ? ", " : "") << names[i];
    }
    std::cout << ")\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Configuration: " << pbrelay::config_path() << "\n"
              << "\n"
              << "Environment variables:\n"
              << "  PUSHBULLET_ACCESS_TOKEN         Access token (Settings > Account on pushbullet.com)\n"
              << "  PUSHBULLET_ENCRYPTION_PASSWORD  End-to-end encryption password\n"
              << "  PBRELAY_SINK                    Notification sink name\n";
}

static void subscribe_logging(pbrelay::EventBus& bus) {
    pbrelay::subscribe<pbrelay::SessionStateChangedEvent>(bus,
        [](const pbrelay::SessionStateChangedEvent& ev) {
            if (ev.to == pbrelay::SessionState::Connected) {
                std::cerr << "[stream] Connected\n";
            } else if (ev.to == pbrelay::SessionState::Terminated) {
                std::cerr << "[stream] Stream closed\n";
            }
        });

    pbrelay::subscribe<pbrelay::NotificationRenderedEvent>(bus,
        [](const pbrelay::NotificationRenderedEvent& ev) {
            if (!pbrelay::verbose()) return;
            std::cerr << "[relay] " << (ev.updated ? "Updated" : "Shown")
                      << " notification " << ev.notification_id << " for " << ev.event_id << "\n";
        });

    pbrelay::subscribe<pbrelay::NotificationDismissedEvent>(bus,
        [](const pbrelay::NotificationDismissedEvent& ev) {
            if (!pbrelay::verbose()) return;
            std::cerr << "[relay] Dismissed notification " << ev.notification_id << "\n";
        });

    pbrelay::subscribe<pbrelay::EventDroppedEvent>(bus,
        [](const pbrelay::EventDroppedEvent& ev) {
            if (!pbrelay::verbose()) return;
            std::cerr << "[relay] Dropped " << (ev.event_id.empty() ? "frame" : ev.event_id)
                      << " (" << ev.reason << ")\n";
        });
}

// Key for end-to-end encrypted ephemerals; empty when encryption is off.
static pbrelay::Key load_key(pbrelay::Config& config, pbrelay::PushbulletApi& api) {
    if (!config.encryption_enabled()) return {};

    if (config.account.user_iden.empty()) {
        try {
            config.account.user_iden = api.fetch_user_iden();
        } catch (const pbrelay::ApiError& e) {
            std::cerr << "[crypto] Cannot look up the account for end-to-end encryption: "
                      << e.what() << "; encrypted notifications will be dropped\n";
            return {};
        }
        const std::string iden = config.account.user_iden;
        if (!pbrelay::modify_config_json([&iden](nlohmann::json& j) {
                j["account"]["user_iden"] = iden;
            })) {
            std::cerr << "[config] Could not save account id to " << pbrelay::config_path() << "\n";
        }
    }

    pbrelay::Key key = pbrelay::derive_key(config.account.encryption_password,
                                           config.account.user_iden);
    pbrelay::secure_clear(config.account.encryption_password);
    return key;
}

int main(int argc, char* argv[]) try {
    bool debug = false;
    std::string sink_name;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "-d") == 0 || std::strcmp(argv[i], "--debug") == 0) {
            debug = true;
        } else if (std::strcmp(argv[i], "--sink") == 0 && i + 1 < argc) {
            sink_name = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    // Initialize
    pbrelay::http_init();
    auto config = pbrelay::Config::load();

    // Override config with CLI args
    if (debug) config.debug = true;
    if (!sink_name.empty()) config.sink.backend = sink_name;
    pbrelay::set_verbose(config.debug);

    if (config.account.access_token.empty()) {
        std::cerr << "Error: no Pushbullet access token configured.\n"
                  << "Create one at https://www.pushbullet.com/#settings/account and set\n"
                  << "account.access_token in " << pbrelay::config_path()
                  << " or PUSHBULLET_ACCESS_TOKEN.\n";
        pbrelay::http_cleanup();
        return 1;
    }
    try {
        pbrelay::parse_url(config.stream.url);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: stream.url: " << e.what() << "\n";
        pbrelay::http_cleanup();
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
#ifdef SIGPIPE
    std::signal(SIGPIPE, SIG_IGN);
#endif
    pbrelay::http_set_abort_flag(&g_shutdown);
    pbrelay::set_connection_abort_flag(&g_shutdown);

    // Notification sink via plugin registry
    std::unique_ptr<pbrelay::NotificationSink> sink;
    try {
        sink = pbrelay::PluginRegistry::instance().create_sink(config.sink.backend, config);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        pbrelay::http_cleanup();
        return 1;
    }
    if (!sink->health_check()) {
        std::cerr << "[relay] Warning: " << sink->sink_name()
                  << " sink is not reachable yet; notifications may be lost\n";
    }

    pbrelay::PlatformHttpClient http_client;
    pbrelay::PushbulletApi api(http_client, config.account.access_token,
                               config.api.base_url, config.api.timeout_s);

    int rc = 0;
    try {
        pbrelay::Key key = load_key(config, api);

        pbrelay::EventBus bus;
        subscribe_logging(bus);

        pbrelay::DedupStore store(config.dedup.max_entries, config.dedup.retention_seconds);
        pbrelay::NotificationDispatcher dispatcher(store, *sink, config.sink, &api);
        dispatcher.set_event_bus(&bus);

        const pbrelay::StreamConfig stream_config = config.stream;
        pbrelay::StreamSession stream(
            [&stream_config]() -> std::unique_ptr<pbrelay::StreamTransport> {
                return std::make_unique<pbrelay::WebSocketTransport>(
                    stream_config.url, stream_config.connect_timeout_s);
            },
            stream_config, &g_shutdown);
        stream.set_event_bus(&bus);

        pbrelay::RelayEngine engine(stream, dispatcher, std::move(key), &api,
                                    config.api.backfill_limit);
        engine.set_event_bus(&bus);
        engine.run(config.account.access_token);
    } catch (const pbrelay::AuthError& e) {
        std::cerr << "Error: " << e.what() << ".\n"
                  << "Check account.access_token in " << pbrelay::config_path()
                  << " (or PUSHBULLET_ACCESS_TOKEN).\n";
        rc = 2;
    }

    pbrelay::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
