#include "message_stream.hpp"
#include "stream/error_body.hpp"
#include "stream/frame_splitter.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>
#include <utility>

namespace qwstream {

static constexpr size_t kExcerptChars = 100;

MessageStream::MessageStream(HttpClient& http, Logger& log, StreamRequest request,
                             CancellationToken cancel)
    : http_(&http), log_(&log), request_(std::move(request)), cancel_(std::move(cancel)) {}

MessageStream::MessageStream(MessageStream&& other)
    : http_(other.http_),
      log_(other.log_),
      request_(std::move(other.request_)),
      cancel_(std::move(other.cancel_)),
      response_(std::move(other.response_)),
      decoder_(std::move(other.decoder_)),
      text_(std::move(other.text_)),
      ready_(std::move(other.ready_)),
      state_(other.state_),
      failure_(std::move(other.failure_)),
      failure_reported_(other.failure_reported_) {
    other.abandon();
}

MessageStream& MessageStream::operator=(MessageStream&& other) {
    if (this == &other) return *this;
    release();
    http_ = other.http_;
    log_ = other.log_;
    request_ = std::move(other.request_);
    cancel_ = std::move(other.cancel_);
    response_ = std::move(other.response_);
    decoder_ = std::move(other.decoder_);
    text_ = std::move(other.text_);
    ready_ = std::move(other.ready_);
    state_ = other.state_;
    failure_ = std::move(other.failure_);
    failure_reported_ = other.failure_reported_;
    other.abandon();
    return *this;
}

MessageStream::~MessageStream() {
    release();
}

std::optional<StreamMessage> MessageStream::next() {
    for (;;) {
        if (cancel_.cancelled()) {
            release();
            ready_.clear();
            if (!terminal()) state_ = SessionState::Closed;
            return std::nullopt;
        }

        if (!ready_.empty()) {
            StreamMessage msg = std::move(ready_.front());
            ready_.pop_front();
            return msg;
        }

        switch (state_) {
            case SessionState::Idle:
                start();
                break;
            case SessionState::Streaming:
                read_chunk();
                break;
            case SessionState::Draining:
                drain_remainder();
                break;
            case SessionState::Requesting:
            case SessionState::Failed:
            case SessionState::Closed:
                if (failure_ && !failure_reported_) {
                    failure_reported_ = true;
                    throw TransportError(*failure_);
                }
                return std::nullopt;
        }
    }
}

void MessageStream::cancel() {
    cancel_.cancel();
    release();
    ready_.clear();
    if (!terminal()) state_ = SessionState::Closed;
}

void MessageStream::start() {
    if (!request_.validation_error.empty()) {
        log_->warn(request_.label, request_.validation_error);
        fail(request_.validation_error);
        return;
    }
    if (request_.delimiter.empty()) {
        log_->warn(request_.label, "empty message boundary");
        fail("Message boundary must not be empty");
        return;
    }

    state_ = SessionState::Requesting;
    log_->debug(request_.label, "POST " + request_.url);
    try {
        response_ = http_->stream_post(request_.url, request_.body, request_.headers,
                                       request_.timeout_seconds, cancel_);
    } catch (const HttpTimeoutError& e) {
        log_->error(request_.label, e.what());
        fail("Request timed out after " + std::to_string(request_.timeout_seconds) + " seconds");
        return;
    } catch (const HttpError& e) {
        if (cancel_.cancelled()) {
            state_ = SessionState::Closed;
            return;
        }
        log_->error(request_.label, e.what());
        fail(e.what());
        return;
    }

    log_->debug(request_.label, "HTTP " + std::to_string(response_.status_code));

    if (response_.status_code < 200 || response_.status_code >= 300) {
        std::string body;
        if (response_.body) {
            if (!read_body_text(*response_.body, body))
                log_->debug(request_.label, "error body cut short");
        }
        std::string message = extract_error_message(body, response_.status_code);
        log_->warn(request_.label, "HTTP " + std::to_string(response_.status_code) + ": " + message);
        release();
        fail(message);
        return;
    }

    if (!response_.body) {
        fail("No response body");
        return;
    }
    state_ = SessionState::Streaming;
}

void MessageStream::read_chunk() {
    std::string chunk;
    bool more = false;
    try {
        more = response_.body->read(chunk);
    } catch (const std::exception& e) {
        on_transport_failure(e.what());
        return;
    }

    if (!more) {
        if (cancel_.cancelled()) return; // next() closes the session
        state_ = SessionState::Draining;
        return;
    }

    // text_ holds no complete delimiter yet, so only its last
    // delimiter.size() - 1 bytes can start one.
    const std::string& delimiter = request_.delimiter;
    size_t resume = text_.size() >= delimiter.size() ? text_.size() - delimiter.size() + 1 : 0;
    text_ += decoder_.decode(chunk);
    if (text_.find(delimiter, resume) == std::string::npos) return;

    FrameSplit split = split_frames(text_, delimiter, resume);
    text_ = std::move(split.remainder);
    for (const auto& payload : frame_payloads(split.frames)) {
        consume_payload(payload);
    }
}

void MessageStream::drain_remainder() {
    text_ += decoder_.flush();
    std::string rest = trim(text_);
    text_.clear();
    release();
    state_ = SessionState::Closed;
    if (rest.empty()) return;

    try {
        ready_.push_back(parse_stream_message(rest));
    } catch (const std::exception& e) {
        log_->warn(request_.label, std::string("unparseable final frame: ") + e.what());
        ready_.push_back(StreamMessage::error("Failed to parse final server response"));
    }
}

void MessageStream::consume_payload(const std::string& payload) {
    try {
        ready_.push_back(parse_stream_message(payload));
    } catch (const std::exception& e) {
        log_->warn(request_.label, std::string("unparseable frame: ") + e.what());
        ready_.push_back(StreamMessage::error("Failed to parse server response: " +
                                              utf8_truncate(payload, kExcerptChars) + "..."));
    }
}

void MessageStream::fail(const std::string& message) {
    ready_.push_back(StreamMessage::error(message));
    state_ = SessionState::Failed;
}

void MessageStream::on_transport_failure(const std::string& what) {
    log_->error(request_.label, "stream read failed: " + what);
    release();
    ready_.push_back(StreamMessage::error("Stream error: " + what));
    failure_ = what;
    state_ = SessionState::Closed;
}

// Leave a moved-from stream closed with a flag of its own, so cancelling it
// cannot reach the session it handed over.
void MessageStream::abandon() {
    http_ = nullptr;
    cancel_ = CancellationToken();
    response_ = StreamResponse();
    decoder_ = Utf8StreamDecoder();
    text_.clear();
    ready_.clear();
    state_ = SessionState::Closed;
    failure_.reset();
    failure_reported_ = false;
}

void MessageStream::release() {
    if (response_.body) {
        response_.body->close();
        response_.body.reset();
    }
}

} // namespace qwstream
