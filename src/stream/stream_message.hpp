#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace qwstream {

enum class MessageKind { Content, Status, ConfirmationRequired, Error, Done, Other };

inline const char* kind_to_string(MessageKind kind) {
    switch (kind) {
        case MessageKind::Content: return "content";
        case MessageKind::Status: return "status";
        case MessageKind::ConfirmationRequired: return "confirmation-required";
        case MessageKind::Error: return "error";
        case MessageKind::Done: return "done";
        case MessageKind::Other: return "other";
    }
    return "other";
}

// Map a wire "type" string onto a kind. The service uses several names for
// the same kind (e.g. "ai_response" and "content"); unknown names are Other.
MessageKind classify_message_type(const std::string& type);

// One decoded unit of a query session.
struct StreamMessage {
    MessageKind kind = MessageKind::Other;
    std::string type;                        // wire type, as received
    std::string content;                     // "content", else "message"
    std::optional<std::string> operation_id; // echo back via ConfirmRequest
    bool final_response = false;
    nlohmann::json payload;                  // full object, kind-specific fields included

    bool is_error() const { return kind == MessageKind::Error; }

    // Synthetic error message produced by the client itself
    static StreamMessage error(const std::string& description);
};

// Build a message from a decoded JSON value. Throws std::invalid_argument
// unless it is an object with a string "type".
StreamMessage stream_message_from_json(const nlohmann::json& j);

// Parse one frame of text. Throws nlohmann::json::parse_error on invalid
// JSON, std::invalid_argument on a valid document of the wrong shape.
StreamMessage parse_stream_message(const std::string& text);

} // namespace qwstream
