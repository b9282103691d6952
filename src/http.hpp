#pragma once
#include "event_loop.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fetchkit {

// Initialize HTTP subsystem (call once at startup).
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

using Header = std::pair<std::string, std::string>;

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<Header> headers;
    std::string body;
};

struct HttpResponse {
    long status_code = 0;
    std::vector<Header> headers;
    std::string body;
    nlohmann::json data; // parsed body when a JSON response was requested

    // Case-insensitive header lookup (empty if absent)
    std::string header(const std::string& name) const;
};

// Callbacks for one transfer, invoked on the loop thread in this order:
// on_response once, on_data zero or more times, on_complete once.
// Nothing is invoked after the transfer is cancelled.
struct TransferHandlers {
    std::function<void(long status, const std::vector<Header>& headers)> on_response;
    std::function<void(const std::string& chunk)> on_data;
    // Null error = body fully received
    std::function<void(std::exception_ptr error)> on_complete;
};

using TransferId = uint64_t;

// Abstract transport (injectable for testing)
class Transport {
public:
    virtual ~Transport() = default;

    virtual TransferId start(const HttpRequest& request, TransferHandlers handlers) = 0;

    // Abort a transfer. Unknown or finished ids are ignored.
    virtual void cancel(TransferId id) = 0;
};

// libcurl multi-interface transport driven by an EventLoop
class CurlTransport : public Transport, public IoSource {
public:
    explicit CurlTransport(EventLoop& loop);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    TransferId start(const HttpRequest& request, TransferHandlers handlers) override;
    void cancel(TransferId id) override;

    bool active() const override { return !transfers_.empty(); }
    void poll(std::chrono::milliseconds timeout) override;

    struct Transfer;

private:
    void attach(TransferId id);
    void finish_completed();
    void remove(TransferId id);

    EventLoop& loop_;
    void* multi_;
    std::unordered_map<TransferId, std::unique_ptr<Transfer>> transfers_;
    TransferId next_id_ = 1;
    bool in_perform_ = false;
    std::exception_ptr callback_error_;
};

} // namespace fetchkit
