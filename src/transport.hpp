#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace pbrelay {

// One inbound realtime connection. Frames are pulled, never pushed.
class StreamTransport {
public:
    virtual ~StreamTransport() = default;

    // Open the stream for an access token.
    // Throws AuthError on a 401/403 handshake, TransportError otherwise.
    virtual void connect(const std::string& access_token) = 0;

    // Wait up to `timeout` for the next text message.
    // nullopt when the wait elapsed without one; throws TransportError
    // (Disconnected) when the peer closed or the connection failed.
    virtual std::optional<std::string> receive(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

using TransportFactory = std::function<std::unique_ptr<StreamTransport>()>;

} // namespace pbrelay
