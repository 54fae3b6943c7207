#include "query_client.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>
#include <utility>

using json = nlohmann::json;

namespace qwstream {

QueryClient::QueryClient(const Config& config, HttpClient& http, Logger& log)
    : config_(config), http_(http), log_(log) {}

std::string QueryClient::graph_url(const std::string& database) const {
    return strip_trailing_slashes(config_.base_url) + "/graphs/" + url_encode(database);
}

std::vector<Header> QueryClient::request_headers() const {
    std::vector<Header> headers = {{"Content-Type", "application/json"}};
    if (!config_.api_token.empty())
        headers.emplace_back("Authorization", "Bearer " + config_.api_token);
    if (!config_.cookie.empty())
        headers.emplace_back("Cookie", config_.cookie);
    return headers;
}

json QueryClient::query_body(const QueryRequest& request) {
    json chat = json::array();
    for (const auto& turn : request.history) {
        chat.push_back(turn.content);
    }
    chat.push_back(request.query);

    json body = {{"chat", chat}};
    if (!request.results.empty()) body["result"] = request.results;
    if (request.instructions && !request.instructions->empty())
        body["instructions"] = *request.instructions;
    return body;
}

json QueryClient::confirm_body(const ConfirmRequest& request) {
    return {
        {"sql_query", request.sql_query},
        {"confirmation", request.confirmation},
        {"chat", request.chat}
    };
}

StreamRequest QueryClient::make_request(std::string url, std::string body, std::string label,
                                        std::string validation_error) const {
    StreamRequest req;
    req.url = std::move(url);
    req.body = std::move(body);
    req.headers = request_headers();
    req.timeout_seconds = static_cast<long>(config_.initiation_timeout_seconds);
    req.delimiter = config_.boundary.empty() ? std::string(kMessageBoundary) : config_.boundary;
    req.label = std::move(label);
    req.validation_error = std::move(validation_error);
    return req;
}

MessageStream QueryClient::begin_query(const QueryRequest& request, CancellationToken cancel) {
    std::string invalid;
    if (trim(request.database).empty())
        invalid = "Database identifier is required";
    else if (trim(request.query).empty())
        invalid = "Query text is required";

    std::string url = invalid.empty() ? graph_url(request.database) : std::string();
    std::string body = invalid.empty() ? query_body(request).dump() : std::string();
    return MessageStream(http_, log_,
                         make_request(std::move(url), std::move(body), "query", std::move(invalid)),
                         std::move(cancel));
}

MessageStream QueryClient::confirm_operation(const std::string& database,
                                             const ConfirmRequest& request,
                                             CancellationToken cancel) {
    std::string invalid;
    if (trim(database).empty())
        invalid = "Database identifier is required";
    else if (request.sql_query.empty())
        invalid = "Operation identifier (sql_query) is required";
    else if (request.confirmation != "CONFIRM" && request.confirmation != "CANCEL")
        invalid = "Confirmation must be CONFIRM or CANCEL";

    std::string url = invalid.empty() ? graph_url(database) + "/confirm" : std::string();
    std::string body = invalid.empty() ? confirm_body(request).dump() : std::string();
    return MessageStream(http_, log_,
                         make_request(std::move(url), std::move(body), "confirm", std::move(invalid)),
                         std::move(cancel));
}

void QueryClient::drain(MessageStream& stream, std::vector<StreamMessage>& out) {
    while (auto msg = stream.next()) {
        out.push_back(std::move(*msg));
    }
}

std::vector<StreamMessage> QueryClient::drain(MessageStream& stream) {
    std::vector<StreamMessage> messages;
    drain(stream, messages);
    return messages;
}

} // namespace qwstream
