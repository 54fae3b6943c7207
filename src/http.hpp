#pragma once
#include "cancellation.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <cstddef>

namespace qwstream {

// Initialize HTTP subsystem (call once at startup).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl on macOS.
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

using Header = std::pair<std::string, std::string>;

// Transport failure: connect, write, read or a malformed HTTP response.
class HttpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The response did not begin within the initiation timeout.
class HttpTimeoutError : public HttpError {
public:
    using HttpError::HttpError;
};

// Response body opened for incremental, pull-based reading.
class BodyReader {
public:
    virtual ~BodyReader() = default;

    // Read the next chunk of body bytes into `chunk`. Returns false at the
    // end of the body, or once the request's cancellation token fired.
    // Throws HttpError when the connection fails mid-body.
    virtual bool read(std::string& chunk) = 0;

    // Release the connection. Later reads return false.
    virtual void close() = 0;
};

struct StreamResponse {
    long status_code = 0;
    std::unique_ptr<BodyReader> body; // null when the response has no body
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Send a POST and return as soon as the status line and headers are in.
    // Connect, request write and header read share `timeout_seconds`; the
    // body that follows is read without a deadline. The cancellation token
    // is polled at one-second granularity for the lifetime of the request.
    // Throws HttpTimeoutError on timeout, HttpError on other failures.
    virtual StreamResponse stream_post(const std::string& url,
                                       const std::string& body,
                                       const std::vector<Header>& headers,
                                       long timeout_seconds,
                                       const CancellationToken& cancel) = 0;
};

// Append a body to `out` until it ends or max_bytes are collected. Returns
// false if the transport failed part-way; `out` keeps what arrived.
bool read_body_text(BodyReader& body, std::string& out, size_t max_bytes = 64 * 1024);

struct ParsedUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

// Split an http:// or https:// URL. Throws HttpError if it is malformed.
ParsedUrl parse_url(const std::string& url);

// Platform-specific concrete implementations.
// Only one is compiled per build target (CMakeLists.txt gates the source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketHttpClient : public HttpClient {
public:
    StreamResponse stream_post(const std::string& url,
                               const std::string& body,
                               const std::vector<Header>& headers,
                               long timeout_seconds,
                               const CancellationToken& cancel) override;
};
using PlatformHttpClient = SocketHttpClient;

#else

// macOS: libcurl
class CurlHttpClient : public HttpClient {
public:
    StreamResponse stream_post(const std::string& url,
                               const std::string& body,
                               const std::vector<Header>& headers,
                               long timeout_seconds,
                               const CancellationToken& cancel) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

} // namespace qwstream
