#pragma once
#include <atomic>
#include <chrono>
#include <map>
#include <string>
#include <sys/types.h>

typedef struct ssl_ctx_st SSL_CTX;
typedef struct ssl_st SSL;

namespace pbrelay {

struct ParsedUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

// Accepts http, https, ws and wss. Throws std::invalid_argument.
ParsedUrl parse_url(const std::string& url);

// Set a global abort flag checked by every blocking read (~1s granularity).
void set_connection_abort_flag(const std::atomic<bool>* flag);

// Absolute time after which a blocking read gives up.
using ReadDeadline = std::chrono::steady_clock::time_point;

// Deadline `seconds` from now.
ReadDeadline deadline_in(long seconds);

// RAII TCP connection with optional TLS (OpenSSL).
class TlsConnection {
public:
    // Results of a bounded read attempt
    static constexpr ssize_t kWouldBlock = -2;
    static constexpr ssize_t kTimedOut = -3;

    TlsConnection() = default;
    ~TlsConnection();
    TlsConnection(const TlsConnection&) = delete;
    TlsConnection& operator=(const TlsConnection&) = delete;

    bool connect(const ParsedUrl& url, long timeout_secs);

    // Blocking read; returns >0 on data, 0 on EOF, -1 on error or abort,
    // kTimedOut once the deadline passed. 1-second receive slices loop back
    // so the abort flag and the deadline are honoured.
    ssize_t read_some(char* buf, size_t len, ReadDeadline deadline = ReadDeadline::max());

    // Single 1-second slice; kWouldBlock when it elapsed without data.
    ssize_t read_slice(char* buf, size_t len);

    bool write_all(const char* buf, size_t len);

    bool is_open() const { return fd_ >= 0; }
    void close();

private:
    void set_socket_timeout(long secs);

    int      fd_  = -1;
    SSL_CTX* ctx_ = nullptr;
    SSL*     ssl_ = nullptr;
};

// Status line and headers of an HTTP/1.1 response. Header names are lowercased.
struct ResponseHead {
    long status = 0; // 0 when the connection closed before a status line
    bool timed_out = false;
    std::map<std::string, std::string> headers;

    std::string header(const std::string& lower_name) const;
};

// Outcome of reading a line or a fixed-size block
enum class ReadStatus { Ok, Closed, TimedOut };

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
ReadStatus read_line(TlsConnection& conn, std::string& leftover, std::string& line,
                     ReadDeadline deadline = ReadDeadline::max());

// Read the status line plus headers up to the blank line. Bytes past the
// blank line stay in leftover.
ResponseHead read_response_head(TlsConnection& conn, std::string& leftover,
                                ReadDeadline deadline = ReadDeadline::max());

} // namespace pbrelay
