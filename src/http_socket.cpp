// Linux HTTP/HTTPS client using POSIX sockets + OpenSSL.
// Implements the same public API as http.cpp (libcurl) with identical
// interface behaviour: http_init/cleanup are no-ops (OpenSSL 1.1+ auto-inits).
#ifdef __linux__

#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <string>

namespace qwstream {

void http_init() {}
void http_cleanup() {}

namespace {

using Clock = std::chrono::steady_clock;

// Body reads have no deadline; only the request phase is bounded.
const Clock::time_point kNoDeadline = Clock::time_point::max();

enum class ReadStatus { Ok, Eof, Cancelled };

std::string ssl_error_text() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;

    CancellationToken cancel;
    Clock::time_point deadline = kNoDeadline;
    long timeout_secs = 0;

    explicit Connection(CancellationToken token) : cancel(std::move(token)) {}
    ~Connection() { close(); }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    void close() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); ssl = nullptr; }
        if (ctx) { SSL_CTX_free(ctx); ctx = nullptr; }
        if (fd >= 0) { ::close(fd); fd = -1; }
    }

    // Throws if the request phase ran out of time or was cancelled.
    void check_progress(const char* phase) const {
        if (cancel.cancelled())
            throw HttpError(std::string("request cancelled while ") + phase);
        if (Clock::now() >= deadline)
            throw HttpTimeoutError("timed out after " + std::to_string(timeout_secs) +
                                   "s while " + phase);
    }

    void connect(const ParsedUrl& url) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int gai = getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res);
        if (gai != 0)
            throw HttpError("cannot resolve " + url.host + ": " + gai_strerror(gai));

        int last_errno = 0;
        for (auto* ai = res; ai && fd < 0; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) { last_errno = errno; continue; }

            // Non-blocking connect so the deadline and cancel flag are honoured.
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            bool connected = ::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0;
            if (!connected && errno == EINPROGRESS) {
                try {
                    connected = wait_connected();
                } catch (const HttpError&) {
                    freeaddrinfo(res);
                    throw;
                }
            }
            if (!connected) {
                if (last_errno == 0) last_errno = errno;
                ::close(fd);
                fd = -1;
                continue;
            }
            fcntl(fd, F_SETFL, flags);
        }
        freeaddrinfo(res);
        if (fd < 0)
            throw HttpError("cannot connect to " + url.host + ":" + url.port + ": " +
                            std::strerror(last_errno));

        // 1-second slice timeout for all later I/O (deadline and cancel polling).
        set_socket_timeout(1);

        if (url.tls) start_tls(url.host);
    }

    // Read some bytes; returns >0 on data, 0 on EOF, -1 once cancelled.
    // A 1-second slice expiry (EAGAIN) loops back to re-check cancel and deadline.
    ssize_t read_some(char* buf, size_t len) {
        while (true) {
            if (cancel.cancelled()) return -1;
            if (Clock::now() >= deadline)
                throw HttpTimeoutError("timed out after " + std::to_string(timeout_secs) +
                                       "s waiting for the response");

            if (ssl) {
                int n = SSL_read(ssl, buf, static_cast<int>(len));
                if (n > 0) return n;
                int err = SSL_get_error(ssl, n);
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    continue;
                if (err == SSL_ERROR_SYSCALL &&
                    (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
                    continue; // 1-second slice expired
                if (err == SSL_ERROR_SYSCALL && n == 0) return 0; // EOF without close_notify
                throw HttpError("TLS read failed: " + ssl_error_text());
            }

            ssize_t n = ::recv(fd, buf, len, 0);
            if (n > 0) return n;
            if (n == 0) return 0;
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            throw HttpError(std::string("read failed: ") + std::strerror(errno));
        }
    }

    void write_all(const char* buf, size_t len) {
        while (len > 0) {
            check_progress("sending the request");
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    throw HttpError("TLS write failed: " + ssl_error_text());
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    throw HttpError(std::string("write failed: ") + std::strerror(errno));
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
    }

private:
    bool wait_connected() {
        while (true) {
            check_progress("connecting");
            struct pollfd pfd{fd, POLLOUT, 0};
            int rc = ::poll(&pfd, 1, 1000);
            if (rc < 0 && errno != EINTR) return false;
            if (rc <= 0) continue;
            int err = 0;
            socklen_t elen = sizeof(err);
            getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
            errno = err;
            return err == 0;
        }
    }

    void start_tls(const std::string& host) {
        ctx = SSL_CTX_new(TLS_client_method());
        if (!ctx) throw HttpError("TLS setup failed: " + ssl_error_text());
        SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx);
        SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
        SSL_CTX_set_options(ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif

        ssl = SSL_new(ctx);
        if (!ssl) throw HttpError("TLS setup failed: " + ssl_error_text());
        SSL_set_fd(ssl, fd);
        SSL_set_tlsext_host_name(ssl, host.c_str()); // SNI
        SSL_set1_host(ssl, host.c_str());

        while (true) {
            check_progress("negotiating TLS");
            int rc = SSL_connect(ssl);
            if (rc == 1) return;
            int err = SSL_get_error(ssl, rc);
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) continue;
            if (err == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK))
                continue;
            throw HttpError("TLS handshake with " + host + " failed: " + ssl_error_text());
        }
    }

    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
};

// ── Request building ───────────────────────────────────────────

std::string build_request(const std::string& method,
                          const ParsedUrl& url,
                          const std::string& body,
                          const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += method + " " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";

    bool has_content_length = false;
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
        if (h.first == "Content-Length") has_content_length = true;
    }
    if (!has_content_length)
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Append whatever the socket has to `leftover`.
ReadStatus fill(Connection& conn, std::string& leftover) {
    char buf[4096];
    ssize_t n = conn.read_some(buf, sizeof(buf));
    if (n < 0) return ReadStatus::Cancelled;
    if (n == 0) return ReadStatus::Eof;
    leftover.append(buf, static_cast<size_t>(n));
    return ReadStatus::Ok;
}

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
ReadStatus read_line(Connection& conn, std::string& leftover, std::string& line) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return ReadStatus::Ok;
        }
        ReadStatus st = fill(conn, leftover);
        if (st != ReadStatus::Ok) return st;
    }
}

struct ResponseHead {
    long status = 0;
    bool chunked = false;
    bool has_length = false;
    size_t content_length = 0;
};

std::string require_line(Connection& conn, std::string& leftover) {
    std::string line;
    ReadStatus st = read_line(conn, leftover, line);
    if (st == ReadStatus::Cancelled)
        throw HttpError("request cancelled while waiting for the response");
    if (st == ReadStatus::Eof)
        throw HttpError("connection closed before the response headers were complete");
    return line;
}

// Parse status line + headers; skips interim 1xx responses.
ResponseHead read_head(Connection& conn, std::string& leftover) {
    while (true) {
        ResponseHead head;
        std::string status_line = require_line(conn, leftover);

        // "HTTP/1.1 200 OK": extract the three-digit code
        size_t sp1 = status_line.find(' ');
        if (status_line.rfind("HTTP/", 0) != 0 || sp1 == std::string::npos ||
            status_line.size() < sp1 + 4)
            throw HttpError("malformed status line: " + status_line);
        char* end = nullptr;
        std::string code = status_line.substr(sp1 + 1, 3);
        head.status = std::strtol(code.c_str(), &end, 10);
        if (end != code.c_str() + 3)
            throw HttpError("malformed status line: " + status_line);

        while (true) {
            std::string line = require_line(conn, leftover);
            if (line.empty()) break; // blank line → end of headers

            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;

            std::string name  = line.substr(0, colon);
            std::string value = line.substr(colon + 1);
            while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
                value.erase(0, 1);

            for (auto& c : name)  c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
            for (auto& c : value) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));

            if (name == "transfer-encoding") {
                head.chunked = (value.find("chunked") != std::string::npos);
            } else if (name == "content-length") {
                char* len_end = nullptr;
                unsigned long long n = std::strtoull(value.c_str(), &len_end, 10);
                if (len_end != value.c_str()) {
                    head.has_length = true;
                    head.content_length = static_cast<size_t>(n);
                }
            }
        }

        if (head.status >= 100 && head.status < 200) continue;
        return head;
    }
}

bool response_has_body(const ResponseHead& head) {
    if (head.status == 204 || head.status == 304) return false;
    if (head.chunked) return true;
    return !(head.has_length && head.content_length == 0);
}

// ── Pull-based body reader (dechunks if needed) ────────────────

class SocketBodyReader : public BodyReader {
public:
    SocketBodyReader(std::unique_ptr<Connection> conn, std::string leftover,
                     const ResponseHead& head)
        : conn_(std::move(conn)), leftover_(std::move(leftover)),
          mode_(head.chunked ? Mode::Chunked
                             : head.has_length ? Mode::Length : Mode::UntilClose),
          remaining_(head.chunked ? 0 : head.content_length) {}

    ~SocketBodyReader() override { close(); }

    bool read(std::string& chunk) override {
        chunk.clear();
        if (!conn_) return false;

        switch (mode_) {
            case Mode::Chunked:
                if (remaining_ == 0 && !next_chunk_header()) return false;
                return take(chunk, "connection closed in the middle of a chunk");
            case Mode::Length:
                if (remaining_ == 0) { close(); return false; }
                return take(chunk, "connection closed before the end of the body");
            case Mode::UntilClose:
                if (leftover_.empty()) {
                    ReadStatus st = fill(*conn_, leftover_);
                    if (st != ReadStatus::Ok) { close(); return false; }
                }
                chunk.swap(leftover_);
                return true;
        }
        return false;
    }

    void close() override {
        if (conn_) {
            conn_->close();
            conn_.reset();
        }
    }

private:
    enum class Mode { Chunked, Length, UntilClose };

    // Parse the next chunk-size line. Returns false at the terminating
    // zero-size chunk or on cancellation.
    bool next_chunk_header() {
        std::string line;
        if (!first_chunk_) {
            // CRLF that ends the previous chunk's data
            if (!line_or_close(line)) return false;
            if (!line.empty()) throw HttpError("malformed chunked body");
        }
        first_chunk_ = false;

        if (!line_or_close(line)) return false;
        char* end = nullptr;
        unsigned long long size = std::strtoull(line.c_str(), &end, 16);
        if (end == line.c_str())
            throw HttpError("malformed chunk size: " + line);
        if (size == 0) {
            // Optional trailer section up to the final blank line; EOF here is harmless
            while (read_line(*conn_, leftover_, line) == ReadStatus::Ok && !line.empty()) {}
            close();
            return false;
        }
        remaining_ = static_cast<size_t>(size);
        return true;
    }

    bool line_or_close(std::string& line) {
        ReadStatus st = read_line(*conn_, leftover_, line);
        if (st == ReadStatus::Cancelled) { close(); return false; }
        if (st == ReadStatus::Eof)
            throw HttpError("connection closed before the end of the chunked body");
        return true;
    }

    // Hand over up to remaining_ bytes, reading from the socket if needed.
    bool take(std::string& chunk, const char* eof_error) {
        if (leftover_.empty()) {
            ReadStatus st = fill(*conn_, leftover_);
            if (st == ReadStatus::Cancelled) { close(); return false; }
            if (st == ReadStatus::Eof) throw HttpError(eof_error);
        }
        size_t n = std::min(remaining_, leftover_.size());
        chunk.assign(leftover_, 0, n);
        leftover_.erase(0, n);
        remaining_ -= n;
        return true;
    }

    std::unique_ptr<Connection> conn_;
    std::string leftover_;
    Mode mode_;
    size_t remaining_;
    bool first_chunk_ = true;
};

} // namespace

// ── Public API ─────────────────────────────────────────────────

StreamResponse SocketHttpClient::stream_post(const std::string& url,
                                             const std::string& body,
                                             const std::vector<Header>& headers,
                                             long timeout_seconds,
                                             const CancellationToken& cancel) {
    ParsedUrl parsed_url = parse_url(url);

    auto conn = std::make_unique<Connection>(cancel);
    conn->timeout_secs = timeout_seconds;
    conn->deadline = Clock::now() + std::chrono::seconds(timeout_seconds);
    conn->connect(parsed_url);

    std::string request = build_request("POST", parsed_url, body, headers);
    conn->write_all(request.c_str(), request.size());

    std::string leftover;
    ResponseHead head = read_head(*conn, leftover);

    // Response has begun: the body is open-ended
    conn->deadline = kNoDeadline;

    StreamResponse resp;
    resp.status_code = head.status;
    if (response_has_body(head)) {
        resp.body = std::make_unique<SocketBodyReader>(std::move(conn), std::move(leftover), head);
    }
    return resp;
}

} // namespace qwstream

#endif // __linux__
