#pragma once
#include "log.hpp"
#include "stream/frame_splitter.hpp"
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace qwstream {

struct Config {
    std::string base_url = "http://localhost:5000";
    std::string boundary = kMessageBoundary;
    uint32_t initiation_timeout_seconds = 30;
    std::string api_token; // sent as Authorization: Bearer
    std::string cookie;    // sent verbatim as the Cookie header
    std::string log_level = "warn";

    // Load from ~/.qwstream/config.json + env vars. Never throws: a missing
    // or malformed file leaves the defaults in place.
    static Config load(Logger* log = nullptr);

    // Build from an already parsed document, ignoring fields of the wrong type
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Path of the config file (HOME-relative)
    static std::string path();

    // Apply QWSTREAM_* environment overrides
    void apply_env();
};

} // namespace qwstream
