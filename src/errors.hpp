#pragma once
#include <stdexcept>
#include <string>

namespace pbrelay {

// Invalid or revoked credential. Terminal: the engine stops and reports it.
class AuthError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Connection-level failure. Recoverable through reconnect with backoff.
class TransportError : public std::runtime_error {
public:
    enum class Kind { Disconnected, Timeout, ShutdownRequested };

    TransportError(Kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

// Frame that cannot be decoded. Logged and dropped.
class MalformedFrame : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Encrypted payload that cannot be opened. Logged and dropped.
class DecryptionFailure : public std::runtime_error {
public:
    enum class Reason { BadKey, AuthenticationFailed };

    DecryptionFailure(Reason reason, const std::string& what)
        : std::runtime_error(what), reason_(reason) {}

    Reason reason() const { return reason_; }

private:
    Reason reason_;
};

// Local notification sink could not be reached. Logged, never retried.
class SinkUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// REST lookup failure. Callers render with partial data.
class ApiError : public std::runtime_error {
public:
    enum class Kind { NotFound, Unavailable };

    ApiError(Kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

} // namespace pbrelay
