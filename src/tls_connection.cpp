// POSIX sockets + OpenSSL connection shared by the REST client and the
// realtime stream transport.
#include "tls_connection.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <stdexcept>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0 // SIGPIPE is ignored process-wide instead
#endif

namespace pbrelay {

static const std::atomic<bool>* g_connection_abort_flag = nullptr;

void set_connection_abort_flag(const std::atomic<bool>* flag) {
    g_connection_abort_flag = flag;
}

static bool abort_requested() {
    return g_connection_abort_flag &&
           g_connection_abort_flag->load(std::memory_order_relaxed);
}

ReadDeadline deadline_in(long seconds) {
    return std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
}

// ── URL parsing ────────────────────────────────────────────────

ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result{};
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::invalid_argument("invalid URL (no scheme)");

    std::string scheme = url.substr(0, scheme_end);
    if (scheme == "https" || scheme == "wss") {
        result.tls = true;
    } else if (scheme == "http" || scheme == "ws") {
        result.tls = false;
    } else {
        throw std::invalid_argument("unsupported URL scheme: " + scheme);
    }

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    if (result.host.empty()) throw std::invalid_argument("invalid URL (no host)");
    return result;
}

// ── Connection ─────────────────────────────────────────────────

TlsConnection::~TlsConnection() {
    close();
}

void TlsConnection::close() {
    if (ssl_) { SSL_shutdown(ssl_); SSL_free(ssl_); ssl_ = nullptr; }
    if (ctx_) { SSL_CTX_free(ctx_); ctx_ = nullptr; }
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

bool TlsConnection::connect(const ParsedUrl& url, long timeout_secs) {
    close();

    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    if (getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res) != 0)
        return false;

    bool connected = false;
    for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
        fd_ = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd_ < 0) continue;

        // Non-blocking connect so we can honour timeout_secs.
        int flags = fcntl(fd_, F_GETFL, 0);
        fcntl(fd_, F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(fd_, ai->ai_addr, ai->ai_addrlen);
        if (rc == 0) {
            fcntl(fd_, F_SETFL, flags);
            connected = true;
        } else if (errno == EINPROGRESS) {
            fd_set wset;
            FD_ZERO(&wset);
            FD_SET(fd_, &wset);
            struct timeval tv{timeout_secs, 0};
            rc = select(fd_ + 1, nullptr, &wset, nullptr, &tv);
            if (rc > 0) {
                int err = 0;
                socklen_t elen = sizeof(err);
                getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &elen);
                if (err == 0) {
                    fcntl(fd_, F_SETFL, flags);
                    connected = true;
                }
            }
        }
        if (!connected) { ::close(fd_); fd_ = -1; }
    }
    freeaddrinfo(res);
    if (!connected) return false;

    if (url.tls) {
        set_socket_timeout(timeout_secs);

        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) { close(); return false; }
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx_);
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

        ssl_ = SSL_new(ctx_);
        if (!ssl_) { close(); return false; }
        SSL_set_fd(ssl_, fd_);
        SSL_set_tlsext_host_name(ssl_, url.host.c_str()); // SNI
        SSL_set1_host(ssl_, url.host.c_str());            // certificate name check

        if (SSL_connect(ssl_) != 1) {
            ERR_clear_error();
            close();
            return false;
        }
    }

    // 1-second slice timeout for body I/O (enables abort-flag polling).
    set_socket_timeout(1);
    return true;
}

ssize_t TlsConnection::read_slice(char* buf, size_t len) {
    if (fd_ < 0) return -1;
    if (abort_requested()) return -1;

    ssize_t n;
    if (ssl_) {
        n = SSL_read(ssl_, buf, static_cast<int>(len));
        if (n > 0) return n;
        int err = SSL_get_error(ssl_, static_cast<int>(n));
        if (err == SSL_ERROR_ZERO_RETURN) return 0;
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
            return kWouldBlock;
        if (err == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK))
            return kWouldBlock; // 1-second slice expired
        if (err == SSL_ERROR_SYSCALL && n == 0) return 0; // unexpected EOF
        return -1;
    }

    n = ::recv(fd_, buf, len, 0);
    if (n > 0) return n;
    if (n == 0) return 0;
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return kWouldBlock;
    return -1;
}

ssize_t TlsConnection::read_some(char* buf, size_t len, ReadDeadline deadline) {
    while (true) {
        if (std::chrono::steady_clock::now() >= deadline) return kTimedOut;
        ssize_t n = read_slice(buf, len);
        if (n == kWouldBlock) continue;
        return n;
    }
}

bool TlsConnection::write_all(const char* buf, size_t len) {
    if (fd_ < 0) return false;
    while (len > 0) {
        ssize_t n;
        if (ssl_) {
            n = SSL_write(ssl_, buf, static_cast<int>(len));
            if (n <= 0) {
                int err = SSL_get_error(ssl_, static_cast<int>(n));
                if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                    continue;
                return false;
            }
        } else {
            n = ::send(fd_, buf, len, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                return false;
            }
        }
        buf += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

void TlsConnection::set_socket_timeout(long secs) {
    struct timeval tv{secs, 0};
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

// ── Response head ──────────────────────────────────────────────

std::string ResponseHead::header(const std::string& lower_name) const {
    auto it = headers.find(lower_name);
    return it == headers.end() ? std::string() : it->second;
}

ReadStatus read_line(TlsConnection& conn, std::string& leftover, std::string& line,
                     ReadDeadline deadline) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return ReadStatus::Ok;
        }
        char buf[4096];
        ssize_t n = conn.read_some(buf, sizeof(buf), deadline);
        if (n == TlsConnection::kTimedOut) return ReadStatus::TimedOut;
        if (n <= 0) return ReadStatus::Closed;
        leftover.append(buf, static_cast<size_t>(n));
    }
}

ResponseHead read_response_head(TlsConnection& conn, std::string& leftover,
                                ReadDeadline deadline) {
    ResponseHead head;
    std::string status_line;
    ReadStatus rs = read_line(conn, leftover, status_line, deadline);
    if (rs != ReadStatus::Ok) {
        head.timed_out = rs == ReadStatus::TimedOut;
        return head;
    }

    // "HTTP/1.1 200 OK": extract the three-digit code
    size_t sp1 = status_line.find(' ');
    if (status_line.compare(0, 5, "HTTP/") != 0 || sp1 == std::string::npos)
        return head;
    std::string code = status_line.substr(sp1 + 1, 3);
    char* end = nullptr;
    long status = std::strtol(code.c_str(), &end, 10);
    if (code.size() != 3 || end != code.c_str() + 3) return head;

    std::string line;
    while ((rs = read_line(conn, leftover, line, deadline)) == ReadStatus::Ok) {
        if (line.empty()) {
            head.status = status; // blank line: end of headers
            return head;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name  = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
            value.erase(0, 1);
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t'))
            value.pop_back();
        for (auto& c : name) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
        head.headers[name] = value;
    }
    head.timed_out = rs == ReadStatus::TimedOut;
    return head; // truncated head
}

} // namespace pbrelay
