// Platform-neutral pieces of the HTTP layer, shared by http_socket.cpp
// (Linux) and http.cpp (libcurl).
#include "http.hpp"

namespace qwstream {

ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result{};
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw HttpError("invalid URL: " + url);

    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https")
        throw HttpError("unsupported URL scheme: " + scheme);
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.rfind(':');
    if (colon != std::string::npos && host_port.find(']', colon) == std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    // [::1] style IPv6 literal
    if (result.host.size() > 2 && result.host.front() == '[' && result.host.back() == ']')
        result.host = result.host.substr(1, result.host.size() - 2);

    if (result.host.empty())
        throw HttpError("invalid URL (no host): " + url);
    if (result.port.empty() ||
        result.port.find_first_not_of("0123456789") != std::string::npos)
        throw HttpError("invalid URL (bad port): " + url);
    return result;
}

bool read_body_text(BodyReader& body, std::string& out, size_t max_bytes) {
    std::string chunk;
    try {
        while (out.size() < max_bytes && body.read(chunk)) {
            out += chunk;
        }
    } catch (const HttpError&) {
        if (out.size() > max_bytes) out.resize(max_bytes);
        return false;
    }
    if (out.size() > max_bytes) out.resize(max_bytes);
    return true;
}

} // namespace qwstream
