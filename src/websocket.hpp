#pragma once
#include "transport.hpp"
#include "tls_connection.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace pbrelay {

// ── RFC 6455 framing ─────────────────────────────────────────────

enum class WsOpcode : uint8_t {
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xA,
};

struct WsFrame {
    bool fin = true;
    WsOpcode opcode = WsOpcode::Text;
    std::string payload;
};

// Largest message accepted from the server.
constexpr size_t kMaxWsMessageSize = 16 * 1024 * 1024;

// Encode a single frame. A 4-byte mask_key masks the payload (client frames);
// an empty one leaves it unmasked.
std::string encode_ws_frame(WsOpcode opcode, const std::string& payload,
                            const std::string& mask_key, bool fin = true);

// Sec-WebSocket-Accept value expected for a Sec-WebSocket-Key.
std::string ws_accept_key(const std::string& client_key);

// Incremental decoder for server-to-client frames.
// Throws TransportError(Disconnected) on a protocol violation.
class WsFrameParser {
public:
    void feed(const char* data, size_t len);
    void feed(const std::string& data) { feed(data.data(), data.size()); }

    // Next complete frame, or nullopt until more bytes arrive.
    std::optional<WsFrame> next();

    size_t buffered() const { return buffer_.size(); }

private:
    std::string buffer_;
};

// Joins fragmented data frames into whole messages.
class WsMessageAssembler {
public:
    // Returns the message once its final fragment arrived.
    // Throws TransportError(Disconnected) on an out-of-order continuation.
    std::optional<std::string> add(const WsFrame& frame);

    void reset();

private:
    bool in_message_ = false;
    std::string message_;
};

// ── Transport ────────────────────────────────────────────────────

// Pushbullet realtime stream over a WebSocket. The access token is appended
// to the stream URL path and never logged.
class WebSocketTransport : public StreamTransport {
public:
    WebSocketTransport(std::string stream_url, long connect_timeout_s);
    ~WebSocketTransport() override;

    void connect(const std::string& access_token) override;
    std::optional<std::string> receive(std::chrono::milliseconds timeout) override;
    void close() override;
    bool is_open() const override { return conn_.is_open(); }

private:
    void handshake(const ParsedUrl& url);
    void send_frame(WsOpcode opcode, const std::string& payload);
    std::optional<std::string> handle_frame(WsFrame frame);

    std::string stream_url_;
    long connect_timeout_s_;
    TlsConnection conn_;
    WsFrameParser parser_;
    WsMessageAssembler assembler_;
};

} // namespace pbrelay
