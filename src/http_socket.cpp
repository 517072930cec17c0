// Linux HTTP/HTTPS client on top of TlsConnection.
// Implements the same public API as http.cpp (libcurl) with identical
// interface behaviour: http_init/cleanup are no-ops (OpenSSL 1.1+ auto-inits).
#ifdef __linux__

#include "http.hpp"
#include "tls_connection.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace pbrelay {

void http_init() {}
void http_cleanup() {}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    set_connection_abort_flag(flag);
}

// ── Request building ───────────────────────────────────────────

static std::string build_request(const ParsedUrl& url, const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512);
    req += "GET " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
    }
    req += "Connection: close\r\n\r\n";
    return req;
}

// ── Body reading ───────────────────────────────────────────────

// Read exactly n bytes, consuming leftover first.
static ReadStatus read_exactly(TlsConnection& conn, std::string& leftover,
                               size_t n, std::string& out, ReadDeadline deadline) {
    while (n > 0) {
        if (!leftover.empty()) {
            size_t take = std::min(n, leftover.size());
            out.append(leftover, 0, take);
            leftover.erase(0, take);
            n -= take;
            continue;
        }
        char buf[4096];
        ssize_t got = conn.read_some(buf, std::min(n, sizeof(buf)), deadline);
        if (got == TlsConnection::kTimedOut) return ReadStatus::TimedOut;
        if (got <= 0) return ReadStatus::Closed;
        out.append(buf, static_cast<size_t>(got));
        n -= static_cast<size_t>(got);
    }
    return ReadStatus::Ok;
}

static ReadStatus read_until_eof(TlsConnection& conn, std::string& leftover,
                                 std::string& out, ReadDeadline deadline) {
    out += leftover;
    leftover.clear();
    char buf[4096];
    for (;;) {
        ssize_t n = conn.read_some(buf, sizeof(buf), deadline);
        if (n == TlsConnection::kTimedOut) return ReadStatus::TimedOut;
        if (n <= 0) return ReadStatus::Ok;
        out.append(buf, static_cast<size_t>(n));
    }
}

// Accumulate full body (handles chunked + content-length + read-to-close).
// A body cut short by the deadline reports TimedOut.
static ReadStatus read_body(TlsConnection& conn, std::string& leftover,
                            const ResponseHead& head, std::string& body,
                            ReadDeadline deadline) {
    std::string encoding = head.header("transfer-encoding");
    std::string length = head.header("content-length");

    if (encoding.find("chunked") != std::string::npos) {
        std::string size_line;
        ReadStatus rs;
        while ((rs = read_line(conn, leftover, size_line, deadline)) == ReadStatus::Ok) {
            // Chunk size is hex, may have extensions after ';'
            size_t chunk_size = std::strtoul(size_line.c_str(), nullptr, 16);
            if (chunk_size == 0) return ReadStatus::Ok;
            rs = read_exactly(conn, leftover, chunk_size, body, deadline);
            if (rs != ReadStatus::Ok) return rs;
            std::string crlf;
            rs = read_exactly(conn, leftover, 2, crlf, deadline); // trailing \r\n
            if (rs != ReadStatus::Ok) return rs;
        }
        return rs;
    }
    if (!length.empty()) {
        size_t content_length = std::strtoul(length.c_str(), nullptr, 10);
        return read_exactly(conn, leftover, content_length, body, deadline);
    }
    return read_until_eof(conn, leftover, body, deadline);
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::get(const std::string& url,
                                   const std::vector<Header>& headers,
                                   long timeout_seconds) {
    return http_get(url, headers, timeout_seconds);
}

// timeout_seconds bounds the whole exchange: connect, TLS and every read.
HttpResponse http_get(const std::string& url_str,
                      const std::vector<Header>& headers,
                      long timeout_seconds) {
    ParsedUrl url;
    try {
        url = parse_url(url_str);
    } catch (const std::invalid_argument&) {
        return {};
    }

    ReadDeadline deadline = deadline_in(timeout_seconds);
    TlsConnection conn;
    if (!conn.connect(url, timeout_seconds)) return {};

    std::string request = build_request(url, headers);
    if (!conn.write_all(request.c_str(), request.size())) return {};

    std::string leftover;
    ResponseHead head = read_response_head(conn, leftover, deadline);
    if (head.status == 0) return {};

    HttpResponse resp;
    resp.status_code = head.status;
    if (read_body(conn, leftover, head, resp.body, deadline) == ReadStatus::TimedOut) {
        return {};
    }
    return resp;
}

} // namespace pbrelay

#endif // __linux__
