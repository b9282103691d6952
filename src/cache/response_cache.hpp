#pragma once
#include "../event_loop.hpp"
#include "../http.hpp"
#include "../task.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>

namespace fetchkit {

using CachedResult = TaskResult<HttpResponse>;

struct CacheEntry {
    std::chrono::steady_clock::time_point captured;
    nlohmann::json params;
    CachedResult result;
    std::optional<std::chrono::milliseconds> ttl; // overrides the cache default
};

struct CacheOptions {
    std::chrono::milliseconds ttl{1000};
    std::chrono::milliseconds sweep_interval{2000};
};

// In-memory response cache keyed by URL. An entry only matches when the
// request parameters are deep-equal to the ones it was stored with.
// Expired entries are dropped on access and by a periodic sweep running
// on the owning loop for the lifetime of the cache.
class ResponseCache {
public:
    using Clock = std::chrono::steady_clock;

    explicit ResponseCache(EventLoop& loop, CacheOptions options = {});
    ~ResponseCache();

    ResponseCache(const ResponseCache&) = delete;
    ResponseCache& operator=(const ResponseCache&) = delete;

    // Look up a cached result. Returns nullopt on miss, expiry or
    // parameter mismatch.
    std::optional<CachedResult> get(const std::string& url, const nlohmann::json& params);

    // Store a result, replacing whatever was cached for `url`.
    void set(const std::string& url, const nlohmann::json& params, CachedResult result,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    // Default TTL for entries without an override. Values below 1 ms are
    // rejected and the previous TTL is kept.
    void set_ttl(std::chrono::milliseconds ttl);
    std::chrono::milliseconds ttl() const { return ttl_; }

    // Remove all expired entries. Returns how many were removed.
    size_t sweep();

    size_t size() const { return entries_.size(); }
    void clear();

private:
    bool expired(const CacheEntry& entry, Clock::time_point now) const;

    EventLoop& loop_;
    std::chrono::milliseconds ttl_{1000};
    EventLoop::TimerId sweep_timer_ = 0;
    std::unordered_map<std::string, CacheEntry> entries_;
};

} // namespace fetchkit
