#pragma once
#include "cache/response_cache.hpp"
#include "event_loop.hpp"
#include "http.hpp"
#include "stream/sse_processor.hpp"
#include "task.hpp"
#include "tools/concurrent.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fetchkit {

struct Config;

enum class ResponseType { Json, Text };

using ProgressCallback = std::function<void(double fraction)>; // -1 = size unknown

// Raw frame payloads extracted from the latest chunk, and every one so far
using RawMessageCallback = std::function<void(const std::vector<std::string>& current,
                                              const std::vector<std::string>& all)>;

struct RequestOptions {
    std::string method = "GET";
    std::string url;                        // appended to the base URL
    std::optional<std::string> base_url;    // overrides the client default
    nlohmann::json query;                   // object encoded as query string
    nlohmann::json body;                    // null = none, string = raw, else JSON
    std::vector<Header> headers;            // merged over the client defaults
    std::optional<std::chrono::milliseconds> timeout; // zero disables
    std::optional<uint32_t> retry;
    ResponseType response_type = ResponseType::Json;
    ProgressCallback on_progress;
};

struct SseOptions {
    std::string method = "GET";
    std::string url;
    std::optional<std::string> base_url;
    nlohmann::json query;
    nlohmann::json body;
    std::vector<Header> headers;
    // Decoding options; on_message receives every frame. The framing
    // strings in here are replaced by the overrides below or the client
    // configuration.
    StreamProcessorConfig processor;
    std::optional<std::string> separator;
    std::optional<std::string> data_prefix;
    std::optional<std::string> done_signal;
    // Called once per received chunk, even when it completed no frame
    RawMessageCallback on_raw_message;
    ProgressCallback on_progress;
    std::function<void(std::exception_ptr error)> on_error;
};

struct ClientConfig {
    std::string base_url;
    std::vector<Header> headers;
    std::chrono::milliseconds timeout{10000};
    uint32_t retry = 0;
    size_t max_concurrency = 4;
    CacheOptions cache;
    std::string separator = "\n\n";
    std::string data_prefix = "data:";
    std::string done_signal = "[DONE]";

    static ClientConfig from(const Config& config);
};

// Lets the caller abandon an in-flight request or stream. Cancelling
// rejects the completion with CancelledError; after settlement it is a no-op.
class RequestHandle {
public:
    RequestHandle() = default;
    explicit RequestHandle(std::function<void()> cancel)
        : cancel_(std::make_shared<std::function<void()>>(std::move(cancel))) {}

    void cancel() const {
        if (cancel_ && *cancel_) (*cancel_)();
    }

private:
    std::shared_ptr<std::function<void()>> cancel_;
};

// Request-issuing layer. Every completion is delivered on the loop thread.
class Client {
public:
    Client(EventLoop& loop, Transport& transport, ClientConfig config = {});

    // Issue a request with timeout and retry. Status >= 400 is an HttpError.
    RequestHandle request(RequestOptions options, Settle<HttpResponse> on_done);

    // Serve from the response cache when the URL and parameters (body, or
    // query for GET/HEAD) match a fresh entry; otherwise request and cache
    // the successful response. Concurrent identical misses each issue
    // their own request.
    RequestHandle cache_request(RequestOptions options,
                                std::optional<std::chrono::milliseconds> cache_ttl,
                                Settle<HttpResponse> on_done);

    // Run a batch with bounded concurrency; results keep the batch order.
    void request_all(std::vector<RequestOptions> batch,
                     std::optional<size_t> max_concurrency,
                     AllSettled<HttpResponse> on_done);

    // Open an SSE stream. Frames go to options.processor.on_message as they
    // arrive; on_done receives the accumulated state once the body ends.
    RequestHandle fetch_sse(SseOptions options, Settle<StreamSnapshot> on_done);

    ResponseCache& cache() { return cache_; }
    const ClientConfig& config() const { return config_; }

private:
    HttpRequest build_request(const std::string& method, const std::string& url,
                              const std::optional<std::string>& base_url,
                              const nlohmann::json& query, const nlohmann::json& body,
                              const std::vector<Header>& headers) const;

    EventLoop& loop_;
    Transport& transport_;
    ClientConfig config_;
    ResponseCache cache_;
};

} // namespace fetchkit
