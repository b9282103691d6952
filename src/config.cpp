#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace fetchkit {

nlohmann::json Config::defaults_json() {
    return {
        {"base_url", ""},
        {"timeout_ms", 10000},
        {"retry", 0},
        {"max_concurrency", 4},
        {"headers", nlohmann::json::object()},
        {"cache", {
            {"ttl_ms", 1000},
            {"sweep_interval_ms", 2000}
        }},
        {"sse", {
            {"separator", "\n\n"},
            {"data_prefix", "data:"},
            {"done_signal", "[DONE]"}
        }}
    };
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

static void invalid(const std::string& key, const nlohmann::json& value) {
    std::cerr << "[config] Ignoring invalid value for " << key << ": "
              << value.dump() << "\n";
}

// Read an unsigned field; `min` rejects values that are too small
static void read_uint(const nlohmann::json& obj, const std::string& key,
                      const std::string& name, uint32_t min, uint32_t& out) {
    if (!obj.contains(key)) return;
    const auto& v = obj[key];
    if (v.is_number_unsigned() && v.get<uint64_t>() <= UINT32_MAX && v.get<uint32_t>() >= min) {
        out = v.get<uint32_t>();
    } else {
        invalid(name, v);
    }
}

static void read_string(const nlohmann::json& obj, const std::string& key,
                        const std::string& name, bool allow_empty, std::string& out) {
    if (!obj.contains(key)) return;
    const auto& v = obj[key];
    if (v.is_string() && (allow_empty || !v.get<std::string>().empty())) {
        out = v.get<std::string>();
    } else {
        invalid(name, v);
    }
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) {
        invalid("config", j);
        return cfg;
    }

    read_string(j, "base_url", "base_url", true, cfg.base_url);
    read_uint(j, "timeout_ms", "timeout_ms", 0, cfg.timeout_ms);
    read_uint(j, "retry", "retry", 0, cfg.retry);
    read_uint(j, "max_concurrency", "max_concurrency", 1, cfg.max_concurrency);

    if (j.contains("headers")) {
        const auto& h = j["headers"];
        if (h.is_object()) {
            for (auto& [name, value] : h.items()) {
                if (value.is_string())
                    cfg.headers.emplace_back(name, value.get<std::string>());
                else
                    invalid("headers." + name, value);
            }
        } else {
            invalid("headers", h);
        }
    }

    if (j.contains("cache") && j["cache"].is_object()) {
        auto& c = j["cache"];
        read_uint(c, "ttl_ms", "cache.ttl_ms", 1, cfg.cache.ttl_ms);
        read_uint(c, "sweep_interval_ms", "cache.sweep_interval_ms", 1,
                  cfg.cache.sweep_interval_ms);
    }

    if (j.contains("sse") && j["sse"].is_object()) {
        auto& s = j["sse"];
        read_string(s, "separator", "sse.separator", false, cfg.sse.separator);
        read_string(s, "data_prefix", "sse.data_prefix", true, cfg.sse.data_prefix);
        read_string(s, "done_signal", "sse.done_signal", false, cfg.sse.done_signal);
    }

    return cfg;
}

static bool parse_env_uint(const char* name, const char* value, uint32_t& out) {
    try {
        size_t used = 0;
        unsigned long n = std::stoul(value, &used);
        if (used != std::char_traits<char>::length(value) || n > UINT32_MAX)
            throw std::invalid_argument(value);
        out = static_cast<uint32_t>(n);
        return true;
    } catch (const std::exception&) {
        std::cerr << "[config] Ignoring invalid " << name << "=" << value << "\n";
        return false;
    }
}

void Config::apply_env() {
    if (const char* v = std::getenv("FETCHKIT_BASE_URL"))
        base_url = v;
    if (const char* v = std::getenv("FETCHKIT_TIMEOUT_MS"))
        parse_env_uint("FETCHKIT_TIMEOUT_MS", v, timeout_ms);
    if (const char* v = std::getenv("FETCHKIT_RETRY"))
        parse_env_uint("FETCHKIT_RETRY", v, retry);
}

Config Config::load(const std::string& path) {
    std::string config_path = expand_home(path);
    nlohmann::json j = defaults_json();

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            j = merge_defaults(nlohmann::json::parse(file), defaults_json());
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config " << config_path
                      << ", using defaults: " << e.what() << "\n";
            j = defaults_json();
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    cfg.apply_env();
    return cfg;
}

} // namespace fetchkit
