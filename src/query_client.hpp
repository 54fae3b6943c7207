#pragma once
#include "cancellation.hpp"
#include "config.hpp"
#include "http.hpp"
#include "log.hpp"
#include "message_stream.hpp"
#include <optional>
#include <string>
#include <vector>

namespace qwstream {

struct ConversationTurn {
    std::string role; // "user" or "assistant"
    std::string content;
};

struct QueryRequest {
    std::string database;
    std::string query;
    std::vector<ConversationTurn> history;
    std::vector<std::string> results;        // earlier final answers, sent as "result"
    std::optional<std::string> instructions;
};

struct ConfirmRequest {
    std::string sql_query;                // operation_id of the confirmation message
    std::string confirmation = "CONFIRM"; // or "CANCEL"
    std::vector<std::string> chat;
};

// Opens streaming query sessions against the graph query service.
class QueryClient {
public:
    QueryClient(const Config& config, HttpClient& http, Logger& log);

    // POST <base>/graphs/<database>; the request is sent on the first next().
    MessageStream begin_query(const QueryRequest& request, CancellationToken cancel = {});

    // POST <base>/graphs/<database>/confirm to answer a confirmation-required
    // message.
    MessageStream confirm_operation(const std::string& database, const ConfirmRequest& request,
                                    CancellationToken cancel = {});

    // Consume a whole stream. A mid-stream transport failure is rethrown as
    // TransportError after its error message has been collected.
    static std::vector<StreamMessage> drain(MessageStream& stream);

    // Same, appending to `out` so the messages before a TransportError are kept.
    static void drain(MessageStream& stream, std::vector<StreamMessage>& out);

    // Request body for begin_query
    static nlohmann::json query_body(const QueryRequest& request);
    static nlohmann::json confirm_body(const ConfirmRequest& request);

    std::string graph_url(const std::string& database) const;

private:
    std::vector<Header> request_headers() const;
    StreamRequest make_request(std::string url, std::string body, std::string label,
                               std::string validation_error) const;

    Config config_;
    HttpClient& http_;
    Logger& log_;
};

} // namespace qwstream
