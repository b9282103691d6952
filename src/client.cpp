#include "client.hpp"
#include "config.hpp"
#include "tools/retry.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

namespace fetchkit {

ClientConfig ClientConfig::from(const Config& config) {
    ClientConfig c;
    c.base_url = config.base_url;
    c.headers = config.headers;
    c.timeout = std::chrono::milliseconds(config.timeout_ms);
    c.retry = config.retry;
    c.max_concurrency = config.max_concurrency;
    c.cache.ttl = std::chrono::milliseconds(config.cache.ttl_ms);
    c.cache.sweep_interval = std::chrono::milliseconds(config.cache.sweep_interval_ms);
    c.separator = config.sse.separator;
    c.data_prefix = config.sse.data_prefix;
    c.done_signal = config.sse.done_signal;
    return c;
}

static std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

static bool has_body(const std::string& method) {
    return method != "GET" && method != "HEAD";
}

// Add or replace a header (names compare case-insensitively)
static void put_header(std::vector<Header>& headers, const Header& header) {
    for (auto& h : headers) {
        if (iequals(h.first, header.first)) {
            h.second = header.second;
            return;
        }
    }
    headers.push_back(header);
}

static bool has_header(const std::vector<Header>& headers, const std::string& name) {
    for (const auto& h : headers) {
        if (iequals(h.first, name)) return true;
    }
    return false;
}

// Content-Length as a number, 0 when missing or malformed
static double content_length(const std::vector<Header>& headers) {
    for (const auto& h : headers) {
        if (!iequals(h.first, "Content-Length")) continue;
        char* end = nullptr;
        double value = std::strtod(h.second.c_str(), &end);
        return (end && *end == '\0' && value > 0) ? value : 0;
    }
    return 0;
}

Client::Client(EventLoop& loop, Transport& transport, ClientConfig config)
    : loop_(loop), transport_(transport), config_(std::move(config)),
      cache_(loop, config_.cache) {
    if (config_.max_concurrency == 0) {
        std::cerr << "[client] max_concurrency must be at least 1, using 4\n";
        config_.max_concurrency = 4;
    }
}

HttpRequest Client::build_request(const std::string& method, const std::string& url,
                                  const std::optional<std::string>& base_url,
                                  const nlohmann::json& query, const nlohmann::json& body,
                                  const std::vector<Header>& headers) const {
    HttpRequest req;
    req.method = to_upper(method);
    req.url = compose_url(base_url.value_or(config_.base_url), url, query);
    req.headers = config_.headers;
    for (const auto& h : headers) put_header(req.headers, h);

    if (has_body(req.method) && !body.is_null()) {
        if (body.is_string()) {
            req.body = body.get<std::string>();
        } else {
            req.body = body.dump();
            if (!has_header(req.headers, "Content-Type"))
                req.headers.emplace_back("Content-Type", "application/json");
        }
    }
    return req;
}

// ── request ───────────────────────────────────────────────────

namespace {

struct RequestState {
    bool settled = false;
    std::optional<TransferId> transfer;
    std::optional<EventLoop::TimerId> timer;
};

struct BodyState {
    long status = 0;
    std::vector<Header> headers;
    std::string body;
    double total = 0;
};

} // namespace

RequestHandle Client::request(RequestOptions options, Settle<HttpResponse> on_done) {
    HttpRequest req = build_request(options.method, options.url, options.base_url,
                                    options.query, options.body, options.headers);
    auto timeout = options.timeout.value_or(config_.timeout);
    uint32_t retry = options.retry.value_or(config_.retry);
    ResponseType type = options.response_type;
    ProgressCallback on_progress = options.on_progress;

    auto state = std::make_shared<RequestState>();

    // First settlement wins: success, final failure, timeout or cancel
    Settle<HttpResponse> finish = [this, state, on_done](TaskResult<HttpResponse> result) {
        if (state->settled) return;
        state->settled = true;
        if (state->timer) loop_.cancel_timer(*state->timer);
        if (!result.ok() && state->transfer) transport_.cancel(*state->transfer);
        on_done(std::move(result));
    };

    Task<HttpResponse> attempt = [this, state, req, type, on_progress](Settle<HttpResponse> settle) {
        if (state->settled) {
            settle(TaskResult<HttpResponse>::rejected(CancelledError("Request already settled")));
            return;
        }
        auto body = std::make_shared<BodyState>();

        TransferHandlers handlers;
        handlers.on_response = [body](long status, const std::vector<Header>& headers) {
            body->status = status;
            body->headers = headers;
            body->total = content_length(headers);
        };
        handlers.on_data = [body, on_progress](const std::string& chunk) {
            body->body += chunk;
            if (on_progress && body->total > 0) {
                on_progress(std::min(1.0, static_cast<double>(body->body.size()) / body->total));
            }
        };
        handlers.on_complete = [body, type, on_progress, settle](std::exception_ptr error) {
            if (error) {
                settle(TaskResult<HttpResponse>::rejected(error));
                return;
            }
            if (body->status >= 400) {
                settle(TaskResult<HttpResponse>::rejected(HttpError(body->status, body->body)));
                return;
            }
            if (on_progress && body->total <= 0) on_progress(-1);

            HttpResponse resp;
            resp.status_code = body->status;
            resp.headers = std::move(body->headers);
            resp.body = std::move(body->body);
            if (type == ResponseType::Json && !trim(resp.body).empty()) {
                try {
                    resp.data = nlohmann::json::parse(resp.body);
                } catch (const nlohmann::json::parse_error&) {
                    settle(TaskResult<HttpResponse>::rejected(std::current_exception()));
                    return;
                }
            }
            settle(TaskResult<HttpResponse>::fulfilled(std::move(resp)));
        };

        state->transfer = transport_.start(req, std::move(handlers));
    };

    if (timeout.count() > 0) {
        std::string url = req.url;
        state->timer = loop_.set_timeout(timeout, [state, finish, url]() {
            state->timer.reset();
            std::cerr << "[client] " << url << " timed out\n";
            finish(TaskResult<HttpResponse>::rejected(TimeoutError(url)));
        });
    }

    // Without retries the attempt's own error is reported, not a RetryError
    if (retry >= 1) {
        retry_task<HttpResponse>(std::move(attempt), retry, finish);
    } else {
        start_task<HttpResponse>(attempt, finish);
    }

    return RequestHandle([finish]() {
        finish(TaskResult<HttpResponse>::rejected(CancelledError()));
    });
}

// ── cache_request ─────────────────────────────────────────────

RequestHandle Client::cache_request(RequestOptions options,
                                    std::optional<std::chrono::milliseconds> cache_ttl,
                                    Settle<HttpResponse> on_done) {
    std::string method = to_upper(options.method);
    nlohmann::json params = has_body(method) ? options.body : options.query;
    std::string key = options.base_url.value_or(config_.base_url) + options.url;

    auto once = settle_once<HttpResponse>(std::move(on_done));

    if (auto cached = cache_.get(key, params)) {
        // Deliver asynchronously, like a fresh response would be
        loop_.post([once, result = *cached]() { once(result); });
        return RequestHandle([once]() {
            once(TaskResult<HttpResponse>::rejected(CancelledError()));
        });
    }

    return request(std::move(options),
        [this, key, params, cache_ttl, once](TaskResult<HttpResponse> result) {
            if (result.ok()) cache_.set(key, params, result, cache_ttl);
            once(std::move(result));
        });
}

// ── request_all ───────────────────────────────────────────────

void Client::request_all(std::vector<RequestOptions> batch,
                         std::optional<size_t> max_concurrency,
                         AllSettled<HttpResponse> on_done) {
    std::vector<Task<HttpResponse>> tasks;
    tasks.reserve(batch.size());
    for (auto& options : batch) {
        tasks.push_back([this, options = std::move(options)](Settle<HttpResponse> settle) {
            request(options, std::move(settle));
        });
    }
    run_concurrent<HttpResponse>(std::move(tasks),
                                 max_concurrency.value_or(config_.max_concurrency),
                                 std::move(on_done));
}

// ── fetch_sse ─────────────────────────────────────────────────

namespace {

struct StreamState {
    bool settled = false;
    TransferId transfer = 0;
    std::unique_ptr<StreamProcessor> processor;
    StreamSnapshot last;
    std::vector<std::string> raw_frames;
    size_t loaded = 0;
    double total = 0;
};

} // namespace

RequestHandle Client::fetch_sse(SseOptions options, Settle<StreamSnapshot> on_done) {
    std::vector<Header> headers{{"Accept", "text/event-stream"}};
    for (const auto& h : options.headers) put_header(headers, h);
    HttpRequest req = build_request(options.method, options.url, options.base_url,
                                    options.query, options.body, headers);

    auto state = std::make_shared<StreamState>();

    StreamProcessorConfig pc = std::move(options.processor);
    pc.separator = options.separator.value_or(config_.separator);
    pc.data_prefix = options.data_prefix.value_or(config_.data_prefix);
    pc.done_signal = options.done_signal.value_or(config_.done_signal);
    MessageCallback user_on_message = std::move(pc.on_message);
    pc.on_message = [state, user_on_message](const StreamSnapshot& snap) {
        state->last = snap;
        if (user_on_message) user_on_message(snap);
    };
    state->processor = std::make_unique<StreamProcessor>(std::move(pc));

    auto on_error = options.on_error;
    auto on_progress = options.on_progress;
    auto on_raw_message = options.on_raw_message;
    auto fail = [state, on_error, on_done](std::exception_ptr error) {
        if (state->settled) return;
        state->settled = true;
        state->processor->abort();
        if (on_error) on_error(error);
        on_done(TaskResult<StreamSnapshot>::rejected(error));
    };

    TransferHandlers handlers;
    handlers.on_response = [this, state, fail](long status, const std::vector<Header>& hdrs) {
        if (status >= 400) {
            transport_.cancel(state->transfer);
            fail(std::make_exception_ptr(HttpError(status, "")));
            return;
        }
        state->total = content_length(hdrs);
    };
    handlers.on_data = [state, on_progress, on_raw_message](const std::string& chunk) {
        if (state->settled) return;
        state->loaded += chunk.size();
        StreamSnapshot snap = state->processor->process_chunk(chunk);
        if (on_raw_message) {
            state->raw_frames.insert(state->raw_frames.end(),
                                     snap.current_frames.begin(), snap.current_frames.end());
            on_raw_message(snap.current_frames, state->raw_frames);
        }
        if (on_progress) {
            on_progress(state->total > 0
                ? std::min(1.0, static_cast<double>(state->loaded) / state->total)
                : -1);
        }
    };
    handlers.on_complete = [state, fail, on_done, on_raw_message](std::exception_ptr error) {
        if (state->settled) return;
        if (error) {
            fail(error);
            return;
        }
        auto rest = state->processor->flush();
        if (rest && on_raw_message && !rest->current_frames.empty()) {
            state->raw_frames.insert(state->raw_frames.end(),
                                     rest->current_frames.begin(), rest->current_frames.end());
            on_raw_message(rest->current_frames, state->raw_frames);
        }
        state->settled = true;

        StreamSnapshot result = state->last;
        result.all_content = state->processor->all_content();
        result.all_json = state->processor->all_json();
        result.is_end = state->processor->is_end();
        on_done(TaskResult<StreamSnapshot>::fulfilled(std::move(result)));
    };

    state->transfer = transport_.start(req, std::move(handlers));

    return RequestHandle([this, state, on_done]() {
        if (state->settled) return;
        state->settled = true;
        transport_.cancel(state->transfer);
        state->processor->abort();
        on_done(TaskResult<StreamSnapshot>::rejected(CancelledError()));
    });
}

} // namespace fetchkit
