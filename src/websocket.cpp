#include "websocket.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <iostream>
#include <stdexcept>

namespace pbrelay {

static const char* kWsGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

static bool is_control(WsOpcode op) {
    return (static_cast<uint8_t>(op) & 0x8) != 0;
}

static std::string random_bytes(size_t n) {
    std::string out(n, '\0');
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&out[0]), static_cast<int>(n)) != 1)
        throw TransportError(TransportError::Kind::Disconnected, "RNG failure");
    return out;
}

static TransportError protocol_error(const std::string& what) {
    return TransportError(TransportError::Kind::Disconnected,
                          "websocket protocol error: " + what);
}

// ── Framing ──────────────────────────────────────────────────────

std::string encode_ws_frame(WsOpcode opcode, const std::string& payload,
                            const std::string& mask_key, bool fin) {
    bool masked = !mask_key.empty();
    if (masked && mask_key.size() != 4)
        throw std::invalid_argument("websocket mask key must be 4 bytes");

    std::string out;
    out.reserve(payload.size() + 14);
    out += static_cast<char>((fin ? 0x80 : 0x00) | static_cast<uint8_t>(opcode));

    uint8_t mask_bit = masked ? 0x80 : 0x00;
    uint64_t len = payload.size();
    if (len < 126) {
        out += static_cast<char>(mask_bit | static_cast<uint8_t>(len));
    } else if (len <= 0xFFFF) {
        out += static_cast<char>(mask_bit | 126);
        out += static_cast<char>((len >> 8) & 0xFF);
        out += static_cast<char>(len & 0xFF);
    } else {
        out += static_cast<char>(mask_bit | 127);
        for (int shift = 56; shift >= 0; shift -= 8)
            out += static_cast<char>((len >> shift) & 0xFF);
    }

    if (!masked) {
        out += payload;
        return out;
    }
    out += mask_key;
    for (size_t i = 0; i < payload.size(); ++i)
        out += static_cast<char>(payload[i] ^ mask_key[i % 4]);
    return out;
}

std::string ws_accept_key(const std::string& client_key) {
    std::string input = client_key + kWsGuid;
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &digest_len, EVP_sha1(), nullptr) != 1)
        throw std::runtime_error("SHA-1 digest failed");
    return base64_encode(std::string(reinterpret_cast<const char*>(digest), digest_len));
}

void WsFrameParser::feed(const char* data, size_t len) {
    buffer_.append(data, len);
}

std::optional<WsFrame> WsFrameParser::next() {
    if (buffer_.size() < 2) return std::nullopt;

    auto byte = [this](size_t i) { return static_cast<uint8_t>(buffer_[i]); };
    uint8_t b0 = byte(0);
    uint8_t b1 = byte(1);

    if (b0 & 0x70) throw protocol_error("reserved bits set");
    if (b1 & 0x80) throw protocol_error("masked server frame");

    WsFrame frame;
    frame.fin = (b0 & 0x80) != 0;
    frame.opcode = static_cast<WsOpcode>(b0 & 0x0F);
    switch (frame.opcode) {
        case WsOpcode::Continuation:
        case WsOpcode::Text:
        case WsOpcode::Binary:
        case WsOpcode::Close:
        case WsOpcode::Ping:
        case WsOpcode::Pong:
            break;
        default:
            throw protocol_error("unknown opcode " + std::to_string(b0 & 0x0F));
    }

    size_t header = 2;
    uint64_t len = b1 & 0x7F;
    if (len == 126) {
        if (buffer_.size() < 4) return std::nullopt;
        len = (static_cast<uint64_t>(byte(2)) << 8) | byte(3);
        header = 4;
    } else if (len == 127) {
        if (buffer_.size() < 10) return std::nullopt;
        len = 0;
        for (size_t i = 2; i < 10; ++i) len = (len << 8) | byte(i);
        header = 10;
    }

    if (is_control(frame.opcode) && (!frame.fin || len > 125))
        throw protocol_error("oversized or fragmented control frame");
    if (len > kMaxWsMessageSize) throw protocol_error("frame too large");

    if (buffer_.size() < header + len) return std::nullopt;
    frame.payload = buffer_.substr(header, static_cast<size_t>(len));
    buffer_.erase(0, header + static_cast<size_t>(len));
    return frame;
}

std::optional<std::string> WsMessageAssembler::add(const WsFrame& frame) {
    if (frame.opcode == WsOpcode::Continuation) {
        if (!in_message_) throw protocol_error("continuation without a message");
    } else {
        if (in_message_) throw protocol_error("new message before the final fragment");
        in_message_ = true;
        message_.clear();
    }

    if (message_.size() + frame.payload.size() > kMaxWsMessageSize)
        throw protocol_error("message too large");
    message_ += frame.payload;

    if (!frame.fin) return std::nullopt;
    in_message_ = false;
    std::string out;
    out.swap(message_);
    return out;
}

void WsMessageAssembler::reset() {
    in_message_ = false;
    message_.clear();
}

// ── WebSocketTransport ───────────────────────────────────────────

WebSocketTransport::WebSocketTransport(std::string stream_url, long connect_timeout_s)
    : stream_url_(std::move(stream_url)), connect_timeout_s_(connect_timeout_s) {}

WebSocketTransport::~WebSocketTransport() {
    conn_.close();
}

void WebSocketTransport::connect(const std::string& access_token) {
    close();

    ParsedUrl url;
    try {
        url = parse_url(stream_url_ + access_token);
    } catch (const std::invalid_argument& e) {
        throw TransportError(TransportError::Kind::Disconnected,
                             std::string("bad stream URL: ") + e.what());
    }

    if (!conn_.connect(url, connect_timeout_s_)) {
        throw TransportError(TransportError::Kind::Disconnected,
                             "cannot connect to " + url.host + ":" + url.port);
    }

    try {
        handshake(url);
    } catch (const std::exception&) {
        conn_.close();
        throw;
    }
}

void WebSocketTransport::handshake(const ParsedUrl& url) {
    std::string key = base64_encode(random_bytes(16));

    std::string req;
    req += "GET " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";
    req += "Upgrade: websocket\r\n";
    req += "Connection: Upgrade\r\n";
    req += "Sec-WebSocket-Key: " + key + "\r\n";
    req += "Sec-WebSocket-Version: 13\r\n";
    req += "User-Agent: pbrelay\r\n\r\n";

    if (!conn_.write_all(req.c_str(), req.size()))
        throw TransportError(TransportError::Kind::Disconnected, "handshake write failed");

    std::string leftover;
    ResponseHead head = read_response_head(conn_, leftover, deadline_in(connect_timeout_s_));
    if (head.timed_out) {
        throw TransportError(TransportError::Kind::Timeout,
                             "no handshake response within " +
                                 std::to_string(connect_timeout_s_) + "s");
    }
    if (head.status == 401 || head.status == 403) {
        throw AuthError("stream rejected the access token (HTTP " +
                        std::to_string(head.status) + ")");
    }
    if (head.status != 101) {
        throw TransportError(TransportError::Kind::Disconnected,
                             head.status == 0
                                 ? std::string("no handshake response")
                                 : "unexpected handshake status " + std::to_string(head.status));
    }
    if (to_lower(head.header("upgrade")) != "websocket" ||
        head.header("sec-websocket-accept") != ws_accept_key(key)) {
        throw TransportError(TransportError::Kind::Disconnected,
                             "handshake accept key mismatch");
    }

    parser_ = WsFrameParser();
    assembler_.reset();
    parser_.feed(leftover);
}

void WebSocketTransport::send_frame(WsOpcode opcode, const std::string& payload) {
    std::string frame = encode_ws_frame(opcode, payload, random_bytes(4));
    if (!conn_.write_all(frame.c_str(), frame.size()))
        throw TransportError(TransportError::Kind::Disconnected, "write failed");
}

std::optional<std::string> WebSocketTransport::handle_frame(WsFrame frame) {
    switch (frame.opcode) {
        case WsOpcode::Ping:
            send_frame(WsOpcode::Pong, frame.payload);
            return std::nullopt;
        case WsOpcode::Pong:
            return std::nullopt;
        case WsOpcode::Close: {
            // Echo the status code back, then drop the socket.
            std::string code = frame.payload.substr(0, 2);
            if (conn_.is_open()) {
                std::string reply = encode_ws_frame(WsOpcode::Close, code, random_bytes(4));
                if (!conn_.write_all(reply.c_str(), reply.size()) && verbose())
                    std::cerr << "[stream] Close reply not sent\n";
            }
            conn_.close();
            int status = code.size() == 2
                ? (static_cast<uint8_t>(code[0]) << 8) | static_cast<uint8_t>(code[1])
                : 1005;
            throw TransportError(TransportError::Kind::Disconnected,
                                 "server closed the stream (" + std::to_string(status) + ")");
        }
        default:
            return assembler_.add(frame);
    }
}

std::optional<std::string> WebSocketTransport::receive(std::chrono::milliseconds timeout) {
    if (!conn_.is_open())
        throw TransportError(TransportError::Kind::Disconnected, "stream not connected");

    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[4096];
    while (true) {
        while (auto frame = parser_.next()) {
            auto message = handle_frame(std::move(*frame));
            if (message) return message;
        }
        if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;

        ssize_t n = conn_.read_slice(buf, sizeof(buf));
        if (n > 0) {
            parser_.feed(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            conn_.close();
            throw TransportError(TransportError::Kind::Disconnected, "stream closed by peer");
        } else if (n != TlsConnection::kWouldBlock) {
            conn_.close();
            throw TransportError(TransportError::Kind::Disconnected, "stream read failed");
        }
    }
}

void WebSocketTransport::close() {
    if (conn_.is_open()) {
        try {
            send_frame(WsOpcode::Close, std::string("\x03\xE8", 2)); // 1000 normal
        } catch (const TransportError& e) {
            if (verbose()) std::cerr << "[stream] " << e.what() << " on close\n";
        }
    }
    conn_.close();
    parser_ = WsFrameParser();
    assembler_.reset();
}

} // namespace pbrelay
