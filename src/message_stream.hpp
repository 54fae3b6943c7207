#pragma once
#include "cancellation.hpp"
#include "http.hpp"
#include "log.hpp"
#include "stream/frame_splitter.hpp"
#include "stream/stream_message.hpp"
#include "stream/utf8_decoder.hpp"
#include <deque>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace qwstream {

// Thrown by MessageStream::next() after a mid-stream transport failure has
// already been reported as a "Stream error: ..." message.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class SessionState { Idle, Requesting, Streaming, Draining, Failed, Closed };

inline const char* session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Requesting: return "requesting";
        case SessionState::Streaming: return "streaming";
        case SessionState::Draining: return "draining";
        case SessionState::Failed: return "failed";
        case SessionState::Closed: return "closed";
    }
    return "closed";
}

// Everything needed to open one streaming POST.
struct StreamRequest {
    std::string url;
    std::string body;
    std::vector<Header> headers;
    long timeout_seconds = 30;
    std::string delimiter = kMessageBoundary;
    std::string label;            // short name used in log lines
    std::string validation_error; // non-empty: fail without a network call
};

// Lazily produced sequence of messages from one query session.
// The request is sent on the first call to next(); each later call pulls at
// most one chunk from the transport. Movable, not copyable; a moved-from
// stream is closed and yields nothing.
class MessageStream {
public:
    MessageStream(HttpClient& http, Logger& log, StreamRequest request,
                  CancellationToken cancel = {});
    ~MessageStream();

    MessageStream(MessageStream&& other);
    MessageStream& operator=(MessageStream&& other);
    MessageStream(const MessageStream&) = delete;
    MessageStream& operator=(const MessageStream&) = delete;

    // Next message, or nullopt once the session is over or was cancelled.
    // Throws TransportError on the call after a "Stream error" message.
    std::optional<StreamMessage> next();

    // Stop the session and release the connection. Idempotent.
    void cancel();

    const CancellationToken& cancellation_token() const { return cancel_; }
    SessionState state() const { return state_; }
    bool failed() const { return failure_.has_value(); }
    bool cancelled() const { return cancel_.cancelled(); }

private:
    void start();
    void read_chunk();
    void drain_remainder();
    void consume_payload(const std::string& payload);
    void fail(const std::string& message);
    void on_transport_failure(const std::string& what);
    void release();
    void abandon();
    bool terminal() const {
        return state_ == SessionState::Failed || state_ == SessionState::Closed;
    }

    HttpClient* http_;
    Logger* log_;
    StreamRequest request_;
    CancellationToken cancel_;
    StreamResponse response_;
    Utf8StreamDecoder decoder_;
    std::string text_;
    std::deque<StreamMessage> ready_;
    SessionState state_ = SessionState::Idle;
    std::optional<std::string> failure_;
    bool failure_reported_ = false;
};

} // namespace qwstream
