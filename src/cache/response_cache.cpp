#include "response_cache.hpp"
#include <iostream>

namespace fetchkit {

static constexpr std::chrono::milliseconds kMinTtl{1};
static constexpr std::chrono::milliseconds kDefaultSweep{2000};

ResponseCache::ResponseCache(EventLoop& loop, CacheOptions options)
    : loop_(loop) {
    set_ttl(options.ttl);

    auto interval = options.sweep_interval;
    if (interval < kMinTtl) {
        std::cerr << "[cache] Sweep interval must be at least 1 ms, using "
                  << kDefaultSweep.count() << " ms\n";
        interval = kDefaultSweep;
    }
    // The sweep must not keep the loop running on its own
    sweep_timer_ = loop_.set_interval(interval, [this]() { sweep(); }, false);
}

ResponseCache::~ResponseCache() {
    loop_.cancel_timer(sweep_timer_);
}

bool ResponseCache::expired(const CacheEntry& entry, Clock::time_point now) const {
    auto ttl = entry.ttl.value_or(ttl_);
    return (now - entry.captured) > ttl;
}

std::optional<CachedResult> ResponseCache::get(const std::string& url,
                                               const nlohmann::json& params) {
    auto it = entries_.find(url);
    if (it == entries_.end()) return std::nullopt;

    if (expired(it->second, Clock::now())) {
        entries_.erase(it);
        return std::nullopt;
    }

    // Same URL with different parameters is a miss, never a merge
    if (it->second.params != params) return std::nullopt;

    return it->second.result;
}

void ResponseCache::set(const std::string& url, const nlohmann::json& params,
                        CachedResult result, std::optional<std::chrono::milliseconds> ttl) {
    if (ttl && *ttl < kMinTtl) {
        std::cerr << "[cache] Ignoring invalid TTL " << ttl->count()
                  << " ms for " << url << ", using default\n";
        ttl.reset();
    }
    entries_.insert_or_assign(url, CacheEntry{Clock::now(), params, std::move(result), ttl});
}

void ResponseCache::set_ttl(std::chrono::milliseconds ttl) {
    if (ttl < kMinTtl) {
        std::cerr << "[cache] TTL must be at least 1 ms, keeping "
                  << ttl_.count() << " ms\n";
        return;
    }
    ttl_ = ttl;
}

size_t ResponseCache::sweep() {
    auto now = Clock::now();
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (expired(it->second, now)) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void ResponseCache::clear() {
    entries_.clear();
}

} // namespace fetchkit
