#include "error_body.hpp"
#include "../util.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace qwstream {

static const char* const kErrorFields[] = {"error", "detail", "message"};

// Text for one error field value; empty when the value carries nothing.
static std::string field_text(const json& value) {
    if (value.is_null()) return "";
    if (value.is_string()) return trim(value.get<std::string>());
    if (value.is_array()) {
        std::string joined;
        for (const auto& item : value) {
            std::string part;
            if (item.is_object() && item.contains("msg") && item["msg"].is_string()) {
                part = item["msg"].get<std::string>();
            } else if (item.is_string()) {
                part = item.get<std::string>();
            } else {
                part = item.dump();
            }
            if (part.empty()) continue;
            if (!joined.empty()) joined += "; ";
            joined += part;
        }
        return joined;
    }
    return value.dump();
}

std::string extract_error_message(const std::string& body, long status_code) {
    json parsed = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_object()) {
        for (const char* field : kErrorFields) {
            auto it = parsed.find(field);
            if (it == parsed.end()) continue;
            std::string text = field_text(*it);
            if (!text.empty()) return text;
        }
    }

    std::string raw = trim(body);
    if (!raw.empty()) return raw;
    return "Request failed with status " + std::to_string(status_code);
}

} // namespace qwstream
