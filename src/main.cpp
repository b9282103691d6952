#include "client.hpp"
#include "config.hpp"
#include "event_loop.hpp"
#include "http.hpp"
#include "tools/retry.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <atomic>
#include <csignal>
#include <chrono>
#include <memory>
#include <optional>
#include <vector>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: fetchkit [options] URL...\n"
              << "\n"
              << "Options:\n"
              << "  --sse                Stream the response as server-sent events\n"
              << "  --method NAME        HTTP method (default: GET)\n"
              << "  -d, --data BODY      Request body (sent as JSON when it parses)\n"
              << "  -H, --header 'K: V'  Extra request header (repeatable)\n"
              << "  --retry N            Retry failed requests N more times\n"
              << "  --timeout MS         Request timeout in milliseconds (0 = none)\n"
              << "  --concurrency N      Requests in flight at once (default: 4)\n"
              << "  --config PATH        Config file (default: ~/.fetchkit/config.json)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  FETCHKIT_BASE_URL    Prefix for every URL\n"
              << "  FETCHKIT_TIMEOUT_MS  Default request timeout\n"
              << "  FETCHKIT_RETRY       Default retry count\n";
}

// Non-negative count no larger than kMaxRetries
static std::optional<uint32_t> parse_count(const char* flag, const char* value) {
    try {
        size_t used = 0;
        unsigned long long n = std::stoull(value, &used);
        if (!std::strchr(value, '-') && used == std::strlen(value) && n <= fetchkit::kMaxRetries)
            return static_cast<uint32_t>(n);
    } catch (const std::exception&) {
        // reported below
    }
    std::cerr << "Invalid value for " << flag << ": " << value << "\n";
    return std::nullopt;
}

static nlohmann::json parse_body(const std::string& data) {
    if (data.empty()) return nullptr;
    try {
        return nlohmann::json::parse(data);
    } catch (const nlohmann::json::parse_error&) {
        return data;
    }
}

// Cancel the given handles once SIGINT/SIGTERM arrives
static void watch_shutdown(fetchkit::EventLoop& loop,
                           std::shared_ptr<std::vector<fetchkit::RequestHandle>> handles) {
    loop.set_interval(std::chrono::milliseconds(100), [handles]() {
        if (!g_shutdown.load()) return;
        for (const auto& h : *handles) h.cancel();
        handles->clear();
    }, false);
}

static int run_sse(fetchkit::EventLoop& loop, fetchkit::Client& client,
                   const std::string& url, const std::string& method,
                   const nlohmann::json& body, const std::vector<fetchkit::Header>& headers) {
    fetchkit::SseOptions options;
    options.method = method;
    options.url = url;
    options.body = body;
    options.headers = headers;
    options.processor.on_message = [](const fetchkit::StreamSnapshot& snap) {
        if (snap.current_json.empty()) {
            std::cout << snap.current_content << "\n";
        } else {
            for (const auto& value : snap.current_json) std::cout << value.dump() << "\n";
        }
        std::cout << std::flush;
    };

    int rc = 1;
    auto handles = std::make_shared<std::vector<fetchkit::RequestHandle>>();
    handles->push_back(client.fetch_sse(std::move(options),
        [&rc](fetchkit::TaskResult<fetchkit::StreamSnapshot> result) {
            if (result.ok()) {
                if (!result.value().is_end)
                    std::cerr << "[sse] Stream closed without done signal\n";
                rc = 0;
            } else {
                std::cerr << "Error: " << result.error_message() << "\n";
            }
        }));
    watch_shutdown(loop, handles);
    loop.run();
    return rc;
}

static int run_requests(fetchkit::EventLoop& loop, fetchkit::Client& client,
                        const std::vector<std::string>& urls, const std::string& method,
                        const nlohmann::json& body, const std::vector<fetchkit::Header>& headers,
                        std::optional<size_t> concurrency) {
    std::vector<fetchkit::RequestOptions> batch;
    for (const auto& url : urls) {
        fetchkit::RequestOptions options;
        options.method = method;
        options.url = url;
        options.body = body;
        options.headers = headers;
        options.response_type = fetchkit::ResponseType::Text;
        batch.push_back(std::move(options));
    }

    int rc = 0;
    bool done = false;
    client.request_all(std::move(batch), concurrency,
        [&](std::vector<fetchkit::TaskResult<fetchkit::HttpResponse>> results) {
            for (size_t i = 0; i < results.size(); i++) {
                if (urls.size() > 1) std::cout << "==> " << urls[i] << " <==\n";
                if (results[i].ok()) {
                    std::cout << results[i].value().body << "\n";
                } else {
                    std::cerr << "Error: " << results[i].error_message() << "\n";
                    rc = 1;
                }
            }
            done = true;
        });

    // Interrupting a batch stops the loop; in-flight transfers are dropped
    loop.set_interval(std::chrono::milliseconds(100), [&loop]() {
        if (g_shutdown.load()) loop.stop();
    }, false);
    loop.run();
    if (!done) {
        std::cerr << "Interrupted\n";
        return 130;
    }
    return rc;
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    bool sse = false;
    std::string method = "GET";
    std::string data;
    std::string config_path = "~/.fetchkit/config.json";
    std::vector<fetchkit::Header> headers;
    std::optional<uint32_t> retry;
    std::optional<uint32_t> timeout_ms;
    std::optional<size_t> concurrency;
    std::vector<std::string> urls;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--sse") == 0) {
            sse = true;
        } else if (std::strcmp(argv[i], "--method") == 0 && i + 1 < argc) {
            method = argv[++i];
        } else if ((std::strcmp(argv[i], "-d") == 0 || std::strcmp(argv[i], "--data") == 0) && i + 1 < argc) {
            data = argv[++i];
            if (method == "GET") method = "POST";
        } else if ((std::strcmp(argv[i], "-H") == 0 || std::strcmp(argv[i], "--header") == 0) && i + 1 < argc) {
            std::string h = argv[++i];
            auto colon = h.find(':');
            if (colon == std::string::npos) {
                std::cerr << "Invalid header: " << h << "\n";
                return 1;
            }
            headers.emplace_back(fetchkit::trim(h.substr(0, colon)),
                                 fetchkit::trim(h.substr(colon + 1)));
        } else if (std::strcmp(argv[i], "--retry") == 0 && i + 1 < argc) {
            retry = parse_count("--retry", argv[++i]);
            if (!retry) return 1;
        } else if (std::strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
            timeout_ms = parse_count("--timeout", argv[++i]);
            if (!timeout_ms) return 1;
        } else if (std::strcmp(argv[i], "--concurrency") == 0 && i + 1 < argc) {
            auto n = parse_count("--concurrency", argv[++i]);
            if (!n) return 1;
            concurrency = *n;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        } else {
            urls.emplace_back(argv[i]);
        }
    }

    if (urls.empty()) {
        print_usage();
        return 1;
    }
    if (sse && urls.size() > 1) {
        std::cerr << "--sse takes exactly one URL\n";
        return 1;
    }

    // Initialize
    fetchkit::http_init();
    auto config = fetchkit::Config::load(config_path);

    // Override config with CLI args
    if (retry) config.retry = *retry;
    if (timeout_ms) config.timeout_ms = *timeout_ms;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int rc;
    {
        fetchkit::EventLoop loop;
        fetchkit::CurlTransport transport(loop);
        fetchkit::Client client(loop, transport, fetchkit::ClientConfig::from(config));

        nlohmann::json body = parse_body(data);
        if (sse) {
            rc = run_sse(loop, client, urls.front(), method, body, headers);
        } else {
            rc = run_requests(loop, client, urls, method, body, headers, concurrency);
        }
    }

    fetchkit::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
