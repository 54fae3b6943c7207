#pragma once
#include <string>

namespace qwstream {

// Human-readable message for a non-success HTTP response.
// Tries, in order: JSON object fields "error", "detail", "message" (first
// present and non-empty wins; a FastAPI-style list of {"msg": ...} entries
// is joined with "; "), then the trimmed raw body, then
// "Request failed with status <code>".
std::string extract_error_message(const std::string& body, long status_code);

} // namespace qwstream
