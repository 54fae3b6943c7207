#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>

namespace qwstream {

nlohmann::json Config::defaults_json() {
    return {
        {"base_url", "http://localhost:5000"},
        {"boundary", kMessageBoundary},
        {"initiation_timeout_seconds", 30},
        {"api_token", ""},
        {"cookie", ""},
        {"log_level", "warn"}
    };
}

std::string Config::path() {
    return expand_home("~/.qwstream/config.json");
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("base_url") && j["base_url"].is_string())
        cfg.base_url = j["base_url"].get<std::string>();
    // An empty boundary would match everywhere
    if (j.contains("boundary") && j["boundary"].is_string() &&
        !j["boundary"].get<std::string>().empty())
        cfg.boundary = j["boundary"].get<std::string>();
    if (j.contains("initiation_timeout_seconds") &&
        j["initiation_timeout_seconds"].is_number_unsigned() &&
        j["initiation_timeout_seconds"].get<uint32_t>() > 0)
        cfg.initiation_timeout_seconds = j["initiation_timeout_seconds"].get<uint32_t>();
    if (j.contains("api_token") && j["api_token"].is_string())
        cfg.api_token = j["api_token"].get<std::string>();
    if (j.contains("cookie") && j["cookie"].is_string())
        cfg.cookie = j["cookie"].get<std::string>();
    if (j.contains("log_level") && j["log_level"].is_string())
        cfg.log_level = j["log_level"].get<std::string>();
    return cfg;
}

void Config::apply_env() {
    if (const char* v = std::getenv("QWSTREAM_BASE_URL"))
        base_url = v;
    if (const char* v = std::getenv("QWSTREAM_API_TOKEN"))
        api_token = v;
    if (const char* v = std::getenv("QWSTREAM_COOKIE"))
        cookie = v;
    if (const char* v = std::getenv("QWSTREAM_LOG_LEVEL"))
        log_level = v;
}

Config Config::load(Logger* log) {
    std::string config_path = path();
    nlohmann::json j = defaults_json();

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            j = merge_defaults(nlohmann::json::parse(file), defaults_json());
        } catch (const nlohmann::json::exception& e) {
            // Config file is malformed, fall back to defaults
            if (log) log->warn("config", "Ignoring " + config_path + ": " + e.what());
            j = defaults_json();
        }
    } else if (log) {
        log->debug("config", "No config file at " + config_path + ", using defaults");
    }

    Config cfg = from_json(j);
    // Environment variables always override config file
    cfg.apply_env();
    return cfg;
}

} // namespace qwstream
