#include <catch2/catch.hpp>
#include "cache/response_cache.hpp"
#include <chrono>
#include <thread>

using namespace fetchkit;
using namespace std::chrono_literals;

static CachedResult ok_response(const std::string& body) {
    HttpResponse resp;
    resp.status_code = 200;
    resp.body = body;
    return CachedResult::fulfilled(resp);
}

struct CacheFixture {
    EventLoop loop;
    ResponseCache cache{loop, CacheOptions{50ms, 20ms}};
};

// ── Basic get/set ────────────────────────────────────────────

TEST_CASE("ResponseCache: miss on empty cache", "[cache]") {
    CacheFixture f;
    REQUIRE_FALSE(f.cache.get("/users", nullptr).has_value());
}

TEST_CASE("ResponseCache: hit after set", "[cache]") {
    CacheFixture f;
    nlohmann::json params = {{"page", 1}};
    f.cache.set("/users", params, ok_response("[1,2]"));

    auto hit = f.cache.get("/users", params);
    REQUIRE(hit.has_value());
    REQUIRE(hit->ok());
    REQUIRE(hit->value().body == "[1,2]");
}

TEST_CASE("ResponseCache: different params miss", "[cache]") {
    CacheFixture f;
    f.cache.set("/users", {{"page", 1}}, ok_response("first"));

    REQUIRE_FALSE(f.cache.get("/users", {{"page", 2}}).has_value());
    REQUIRE_FALSE(f.cache.get("/users", nullptr).has_value());
    // A mismatch does not evict the entry
    REQUIRE(f.cache.get("/users", {{"page", 1}}).has_value());
}

TEST_CASE("ResponseCache: params compare deeply", "[cache]") {
    CacheFixture f;
    nlohmann::json stored = {{"filter", {{"tags", {"a", "b"}}, {"limit", 10}}}};
    f.cache.set("/search", stored, ok_response("x"));

    nlohmann::json same = nlohmann::json::parse(R"({"filter":{"limit":10,"tags":["a","b"]}})");
    REQUIRE(f.cache.get("/search", same).has_value());

    nlohmann::json reordered = nlohmann::json::parse(R"({"filter":{"limit":10,"tags":["b","a"]}})");
    REQUIRE_FALSE(f.cache.get("/search", reordered).has_value());
}

TEST_CASE("ResponseCache: different url misses", "[cache]") {
    CacheFixture f;
    f.cache.set("/a", nullptr, ok_response("a"));
    REQUIRE_FALSE(f.cache.get("/b", nullptr).has_value());
}

TEST_CASE("ResponseCache: set replaces existing entry", "[cache]") {
    CacheFixture f;
    f.cache.set("/a", {{"v", 1}}, ok_response("one"));
    f.cache.set("/a", {{"v", 2}}, ok_response("two"));

    REQUIRE(f.cache.size() == 1);
    REQUIRE_FALSE(f.cache.get("/a", {{"v", 1}}).has_value());
    REQUIRE(f.cache.get("/a", {{"v", 2}})->value().body == "two");
}

TEST_CASE("ResponseCache: stores rejected results as-is", "[cache]") {
    CacheFixture f;
    f.cache.set("/fail", nullptr, CachedResult::rejected(HttpError(500, "oops")));
    auto hit = f.cache.get("/fail", nullptr);
    REQUIRE(hit.has_value());
    REQUIRE_FALSE(hit->ok());
    REQUIRE_THROWS_AS(hit->value(), HttpError);
}

// ── Expiry ───────────────────────────────────────────────────

TEST_CASE("ResponseCache: entry expires after ttl", "[cache]") {
    CacheFixture f;
    f.cache.set("/a", nullptr, ok_response("a"));
    REQUIRE(f.cache.get("/a", nullptr).has_value());

    std::this_thread::sleep_for(80ms);
    REQUIRE_FALSE(f.cache.get("/a", nullptr).has_value());
    // Expired entries are dropped on access
    REQUIRE(f.cache.size() == 0);
}

TEST_CASE("ResponseCache: per-entry ttl overrides default", "[cache]") {
    CacheFixture f;
    f.cache.set("/short", nullptr, ok_response("s"), 10ms);
    f.cache.set("/long", nullptr, ok_response("l"), 5000ms);

    std::this_thread::sleep_for(80ms);
    REQUIRE_FALSE(f.cache.get("/short", nullptr).has_value());
    REQUIRE(f.cache.get("/long", nullptr).has_value());
}

TEST_CASE("ResponseCache: invalid per-entry ttl uses default", "[cache]") {
    CacheFixture f;
    f.cache.set("/a", nullptr, ok_response("a"), 0ms);
    REQUIRE(f.cache.get("/a", nullptr).has_value());
    std::this_thread::sleep_for(80ms);
    REQUIRE_FALSE(f.cache.get("/a", nullptr).has_value());
}

TEST_CASE("ResponseCache: sweep removes expired entries", "[cache]") {
    CacheFixture f;
    f.cache.set("/old", nullptr, ok_response("old"));
    std::this_thread::sleep_for(80ms);
    f.cache.set("/new", nullptr, ok_response("new"));

    REQUIRE(f.cache.size() == 2);
    REQUIRE(f.cache.sweep() == 1);
    REQUIRE(f.cache.size() == 1);
    REQUIRE(f.cache.get("/new", nullptr).has_value());
}

TEST_CASE("ResponseCache: periodic sweep runs on the loop", "[cache]") {
    CacheFixture f;
    f.cache.set("/a", nullptr, ok_response("a"));
    f.cache.set("/b", {{"x", 1}}, ok_response("b"));
    REQUIRE(f.cache.size() == 2);

    f.loop.run_for(150ms);
    REQUIRE(f.cache.size() == 0);
}

TEST_CASE("ResponseCache: sweep timer does not keep the loop alive", "[cache]") {
    CacheFixture f;
    auto start = std::chrono::steady_clock::now();
    f.loop.run();
    REQUIRE(std::chrono::steady_clock::now() - start < 1s);
}

TEST_CASE("ResponseCache: destruction stops the sweep", "[cache]") {
    EventLoop loop;
    {
        ResponseCache cache(loop, CacheOptions{50ms, 10ms});
        REQUIRE(loop.pending_timers() == 1);
    }
    REQUIRE(loop.pending_timers() == 0);
}

// ── TTL configuration ────────────────────────────────────────

TEST_CASE("ResponseCache: set_ttl updates default", "[cache]") {
    CacheFixture f;
    f.cache.set_ttl(5000ms);
    REQUIRE(f.cache.ttl() == 5000ms);
    f.cache.set("/a", nullptr, ok_response("a"));
    std::this_thread::sleep_for(80ms);
    REQUIRE(f.cache.get("/a", nullptr).has_value());
}

TEST_CASE("ResponseCache: invalid ttl keeps previous value", "[cache]") {
    CacheFixture f;
    f.cache.set_ttl(0ms);
    REQUIRE(f.cache.ttl() == 50ms);
    f.cache.set_ttl(-5ms);
    REQUIRE(f.cache.ttl() == 50ms);
}

TEST_CASE("ResponseCache: default options", "[cache]") {
    EventLoop loop;
    ResponseCache cache(loop);
    REQUIRE(cache.ttl() == 1000ms);
}

TEST_CASE("ResponseCache: clear removes everything", "[cache]") {
    CacheFixture f;
    f.cache.set("/a", nullptr, ok_response("a"));
    f.cache.set("/b", nullptr, ok_response("b"));
    f.cache.clear();
    REQUIRE(f.cache.size() == 0);
}
