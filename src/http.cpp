// libcurl HTTP client (non-Linux targets). Uses the multi interface so the
// response body can be pulled one chunk at a time: the write callback keeps
// a single pending chunk and pauses the transfer until it has been taken.
#ifndef __linux__

#include "http.hpp"

#include <curl/curl.h>
#include <chrono>
#include <string>

namespace qwstream {

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

namespace {

using Clock = std::chrono::steady_clock;

curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        list = curl_slist_append(list, entry.c_str());
    }
    return list;
}

// ── RAII curl transfer driven through a multi handle ──────────

class CurlTransfer {
public:
    explicit CurlTransfer(CancellationToken cancel)
        : cancel_(std::move(cancel)), multi_(curl_multi_init()), curl_(curl_easy_init()) {}

    ~CurlTransfer() { close(); }
    CurlTransfer(const CurlTransfer&) = delete;
    CurlTransfer& operator=(const CurlTransfer&) = delete;

    explicit operator bool() const { return multi_ != nullptr && curl_ != nullptr; }

    void setup(const std::string& url, const std::string& body,
               const std::vector<Header>& headers, long timeout_seconds) {
        request_body_ = body;
        hlist_ = build_headers(headers);
        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, hlist_);
        curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, timeout_seconds);
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, request_body_.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request_body_.size()));
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, &CurlTransfer::write_callback);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, &CurlTransfer::header_callback);
        curl_easy_setopt(curl_, CURLOPT_HEADERDATA, this);
        curl_multi_add_handle(multi_, curl_);
        attached_ = true;
    }

    // Drive the transfer until the response headers are complete.
    void wait_for_headers(long timeout_seconds) {
        auto deadline = Clock::now() + std::chrono::seconds(timeout_seconds);
        while (!headers_done_ && !finished_) {
            if (cancel_.cancelled())
                throw HttpError("request cancelled while waiting for the response");
            if (Clock::now() >= deadline)
                throw HttpTimeoutError("timed out after " + std::to_string(timeout_seconds) +
                                       "s waiting for the response");
            pump();
        }
        if (finished_ && result_ != CURLE_OK) {
            if (result_ == CURLE_OPERATION_TIMEDOUT)
                throw HttpTimeoutError(curl_easy_strerror(result_));
            throw HttpError(curl_easy_strerror(result_));
        }
    }

    long status_code() const {
        long code = 0;
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &code);
        return code;
    }

    bool has_body() const {
        long code = status_code();
        if (code == 204 || code == 304) return false;
        curl_off_t length = -1;
        curl_easy_getinfo(curl_, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
        return length != 0;
    }

    bool read(std::string& chunk) {
        chunk.clear();
        if (closed_) return false;
        if (paused_) {
            paused_ = false;
            curl_easy_pause(curl_, CURLPAUSE_CONT);
        }
        while (pending_.empty() && !finished_) {
            if (cancel_.cancelled()) {
                close();
                return false;
            }
            pump();
        }
        if (!pending_.empty()) {
            chunk.swap(pending_);
            return true;
        }
        if (result_ != CURLE_OK) {
            CURLcode res = result_;
            close();
            throw HttpError(curl_easy_strerror(res));
        }
        close();
        return false;
    }

    void close() {
        if (closed_) return;
        closed_ = true;
        if (attached_) curl_multi_remove_handle(multi_, curl_);
        attached_ = false;
        curl_slist_free_all(hlist_);
        hlist_ = nullptr;
        if (curl_) curl_easy_cleanup(curl_);
        curl_ = nullptr;
        if (multi_) curl_multi_cleanup(multi_);
        multi_ = nullptr;
    }

private:
    // One step of the transfer; waits at most one second for socket activity
    // so the cancel flag is polled at the same granularity as on Linux.
    void pump() {
        int running = 0;
        CURLMcode mc = curl_multi_perform(multi_, &running);
        if (mc != CURLM_OK) {
            finished_ = true;
            result_ = CURLE_RECV_ERROR;
            return;
        }

        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_, &queued)) {
            if (msg->msg == CURLMSG_DONE) {
                finished_ = true;
                result_ = msg->data.result;
            }
        }
        if (!finished_ && pending_.empty())
            curl_multi_poll(multi_, nullptr, 0, 1000, nullptr);
    }

    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlTransfer*>(userdata);
        size_t total = size * nmemb;
        if (!self->pending_.empty()) {
            // Consumer has not taken the previous chunk yet
            self->paused_ = true;
            return CURL_WRITEFUNC_PAUSE;
        }
        self->pending_.assign(ptr, total);
        return total;
    }

    static size_t header_callback(char* ptr, size_t size, size_t nitems, void* userdata) {
        auto* self = static_cast<CurlTransfer*>(userdata);
        size_t total = size * nitems;
        std::string line(ptr, total);
        if (line.rfind("HTTP/", 0) == 0) {
            // A new status line (also after an interim 1xx response)
            self->headers_done_ = false;
            self->interim_ = line.size() > 9 && line[9] == '1';
        } else if (line == "\r\n" || line == "\n") {
            if (!self->interim_) self->headers_done_ = true;
        }
        return total;
    }

    CancellationToken cancel_;
    CURLM* multi_ = nullptr;
    CURL* curl_ = nullptr;
    curl_slist* hlist_ = nullptr;
    std::string request_body_;
    std::string pending_;
    bool attached_ = false;
    bool headers_done_ = false;
    bool interim_ = false;
    bool paused_ = false;
    bool finished_ = false;
    bool closed_ = false;
    CURLcode result_ = CURLE_OK;
};

class CurlBodyReader : public BodyReader {
public:
    explicit CurlBodyReader(std::unique_ptr<CurlTransfer> transfer)
        : transfer_(std::move(transfer)) {}

    bool read(std::string& chunk) override { return transfer_->read(chunk); }
    void close() override { transfer_->close(); }

private:
    std::unique_ptr<CurlTransfer> transfer_;
};

} // namespace

// ── Public API ────────────────────────────────────────────────

StreamResponse CurlHttpClient::stream_post(const std::string& url,
                                           const std::string& body,
                                           const std::vector<Header>& headers,
                                           long timeout_seconds,
                                           const CancellationToken& cancel) {
    parse_url(url); // reject malformed URLs with the same error as on Linux

    auto transfer = std::make_unique<CurlTransfer>(cancel);
    if (!*transfer) throw HttpError("failed to initialise libcurl");
    transfer->setup(url, body, headers, timeout_seconds);
    transfer->wait_for_headers(timeout_seconds);

    StreamResponse resp;
    resp.status_code = transfer->status_code();
    if (transfer->has_body()) {
        resp.body = std::make_unique<CurlBodyReader>(std::move(transfer));
    }
    return resp;
}

} // namespace qwstream

#endif // !__linux__
