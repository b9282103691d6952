#pragma once
#include <string>
#include <cstdint>
#include <vector>
#include <utility>
#include <nlohmann/json.hpp>

namespace fetchkit {

struct CacheConfig {
    uint32_t ttl_ms = 1000;
    uint32_t sweep_interval_ms = 2000;
};

struct SseConfig {
    std::string separator = "\n\n";
    std::string data_prefix = "data:";
    std::string done_signal = "[DONE]";
};

struct Config {
    std::string base_url;
    uint32_t timeout_ms = 10000; // 0 disables the request timeout
    uint32_t retry = 0;
    uint32_t max_concurrency = 4;
    std::vector<std::pair<std::string, std::string>> headers; // sent with every request

    CacheConfig cache;
    SseConfig sse;

    // Load from path (default ~/.fetchkit/config.json) + env vars.
    // A missing or malformed file yields the defaults.
    static Config load(const std::string& path = "~/.fetchkit/config.json");

    // Build from already parsed JSON. Invalid fields are logged and skipped.
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // FETCHKIT_BASE_URL, FETCHKIT_TIMEOUT_MS, FETCHKIT_RETRY
    void apply_env();
};

} // namespace fetchkit
