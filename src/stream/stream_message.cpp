#include "stream_message.hpp"

#include <stdexcept>
#include <unordered_map>

using json = nlohmann::json;

namespace qwstream {

MessageKind classify_message_type(const std::string& type) {
    static const std::unordered_map<std::string, MessageKind> kinds = {
        {"content", MessageKind::Content},
        {"ai_response", MessageKind::Content},
        {"sql_query", MessageKind::Content},
        {"query_result", MessageKind::Content},
        {"followup_questions", MessageKind::Content},
        {"final_result", MessageKind::Content},
        {"status", MessageKind::Status},
        {"progress", MessageKind::Status},
        {"reasoning", MessageKind::Status},
        {"reasoning_step", MessageKind::Status},
        {"schema_refresh", MessageKind::Status},
        {"healing_attempt", MessageKind::Status},
        {"healing_success", MessageKind::Status},
        {"operation_cancelled", MessageKind::Status},
        {"confirmation-required", MessageKind::ConfirmationRequired},
        {"confirmation", MessageKind::ConfirmationRequired},
        {"destructive_confirmation", MessageKind::ConfirmationRequired},
        {"error", MessageKind::Error},
        {"done", MessageKind::Done},
    };
    auto it = kinds.find(type);
    return it != kinds.end() ? it->second : MessageKind::Other;
}

static std::optional<std::string> string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

StreamMessage StreamMessage::error(const std::string& description) {
    StreamMessage msg;
    msg.kind = MessageKind::Error;
    msg.type = "error";
    msg.content = description;
    msg.payload = {{"type", "error"}, {"content", description}};
    return msg;
}

StreamMessage stream_message_from_json(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("stream message is not a JSON object");
    }
    auto type = string_field(j, "type");
    if (!type) {
        throw std::invalid_argument("stream message has no string \"type\" field");
    }

    StreamMessage msg;
    msg.type = *type;
    msg.kind = classify_message_type(msg.type);

    // Some server messages carry their text in "message" instead of "content"
    if (auto content = string_field(j, "content")) {
        msg.content = *content;
    } else if (auto message = string_field(j, "message")) {
        msg.content = *message;
    }

    if (msg.kind == MessageKind::ConfirmationRequired) {
        if (auto id = string_field(j, "confirmation_id")) {
            msg.operation_id = *id;
        } else if (auto sql = string_field(j, "sql_query")) {
            msg.operation_id = *sql;
        }
    }

    auto fr = j.find("final_response");
    msg.final_response = fr != j.end() && fr->is_boolean() && fr->get<bool>();
    msg.payload = j;
    return msg;
}

StreamMessage parse_stream_message(const std::string& text) {
    return stream_message_from_json(json::parse(text));
}

} // namespace qwstream
