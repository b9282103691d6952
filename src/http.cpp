#include "http.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <curl/curl.h>
#include <iostream>
#include <stdexcept>
#include <string>

namespace fetchkit {

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

std::string HttpResponse::header(const std::string& name) const {
    for (const auto& h : headers) {
        if (iequals(h.first, name)) return h.second;
    }
    return {};
}

// ── RAII curl handle with per-transfer state ──────────────────

struct CurlTransport::Transfer {
    TransferId id = 0;
    CURL* curl = curl_easy_init();
    curl_slist* hlist = nullptr;
    std::string body; // CURLOPT_POSTFIELDS does not copy
    TransferHandlers handlers;
    std::vector<Header> response_headers;
    bool response_sent = false;
    bool cancelled = false;
    std::exception_ptr* callback_error = nullptr;

    Transfer() = default;
    ~Transfer() {
        curl_slist_free_all(hlist);
        if (curl) curl_easy_cleanup(curl);
    }
    Transfer(const Transfer&) = delete;
    Transfer& operator=(const Transfer&) = delete;

    void send_response() {
        if (response_sent) return;
        response_sent = true;
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        if (handlers.on_response) handlers.on_response(status, response_headers);
    }
};

static curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        list = curl_slist_append(list, entry.c_str());
    }
    return list;
}

static size_t header_callback(char* ptr, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    auto* t = static_cast<CurlTransport::Transfer*>(userdata);
    std::string line = trim(std::string(ptr, total));

    // A new status line starts a new header block (redirects, 100-continue)
    if (starts_with(line, "HTTP/")) {
        t->response_headers.clear();
        return total;
    }
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        t->response_headers.emplace_back(trim(line.substr(0, colon)),
                                         trim(line.substr(colon + 1)));
    }
    return total;
}

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* t = static_cast<CurlTransport::Transfer*>(userdata);
    if (t->cancelled) return 0;

    // Handler exceptions must not unwind through libcurl
    try {
        t->send_response();
        if (!t->cancelled && t->handlers.on_data) {
            t->handlers.on_data(std::string(ptr, total));
        }
    } catch (...) {
        *t->callback_error = std::current_exception();
        t->cancelled = true;
        return 0;
    }
    return total;
}

static void setup_method(CURL* curl, const HttpRequest& request, const std::string& body) {
    if (request.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else if (request.method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }
}

// ── CurlTransport ─────────────────────────────────────────────

CurlTransport::CurlTransport(EventLoop& loop)
    : loop_(loop), multi_(curl_multi_init()) {
    if (!multi_) throw std::runtime_error("curl_multi_init failed");
    loop_.add_source(this);
}

CurlTransport::~CurlTransport() {
    loop_.remove_source(this);
    auto* multi = static_cast<CURLM*>(multi_);
    for (auto& [id, t] : transfers_) {
        curl_multi_remove_handle(multi, t->curl);
    }
    transfers_.clear();
    curl_multi_cleanup(multi);
}

TransferId CurlTransport::start(const HttpRequest& request, TransferHandlers handlers) {
    TransferId id = next_id_++;
    auto t = std::make_unique<Transfer>();
    t->id = id;
    t->handlers = std::move(handlers);
    t->callback_error = &callback_error_;

    if (!t->curl) {
        auto on_complete = t->handlers.on_complete;
        loop_.post([on_complete]() {
            if (on_complete) {
                on_complete(std::make_exception_ptr(TransportError("curl_easy_init failed")));
            }
        });
        return id;
    }

    t->body = request.body;
    t->hlist = build_headers(request.headers);
    curl_easy_setopt(t->curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(t->curl, CURLOPT_HTTPHEADER, t->hlist);
    curl_easy_setopt(t->curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(t->curl, CURLOPT_NOSIGNAL, 1L);
    setup_method(t->curl, request, t->body);
    curl_easy_setopt(t->curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(t->curl, CURLOPT_HEADERDATA, t.get());
    curl_easy_setopt(t->curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(t->curl, CURLOPT_WRITEDATA, t.get());
    curl_easy_setopt(t->curl, CURLOPT_PRIVATE, t.get());

    transfers_.emplace(id, std::move(t));
    if (in_perform_) {
        // libcurl rejects multi calls from inside its own callbacks
        loop_.post([this, id]() { attach(id); });
    } else {
        attach(id);
    }
    return id;
}

void CurlTransport::attach(TransferId id) {
    auto it = transfers_.find(id);
    if (it == transfers_.end() || it->second->cancelled) return;

    CURLMcode rc = curl_multi_add_handle(static_cast<CURLM*>(multi_), it->second->curl);
    if (rc == CURLM_OK) return;

    auto on_complete = it->second->handlers.on_complete;
    std::string msg = curl_multi_strerror(rc);
    transfers_.erase(it);
    loop_.post([on_complete, msg]() {
        if (on_complete) on_complete(std::make_exception_ptr(TransportError(msg)));
    });
}

void CurlTransport::cancel(TransferId id) {
    auto it = transfers_.find(id);
    if (it == transfers_.end() || it->second->cancelled) return;
    it->second->cancelled = true;
    if (in_perform_) {
        // Handles cannot be removed from inside a libcurl callback
        loop_.post([this, id]() { remove(id); });
    } else {
        remove(id);
    }
}

void CurlTransport::remove(TransferId id) {
    auto it = transfers_.find(id);
    if (it == transfers_.end()) return;
    curl_multi_remove_handle(static_cast<CURLM*>(multi_), it->second->curl);
    transfers_.erase(it);
}

void CurlTransport::poll(std::chrono::milliseconds timeout) {
    auto* multi = static_cast<CURLM*>(multi_);
    int running = 0;

    in_perform_ = true;
    curl_multi_perform(multi, &running);
    if (running > 0) {
        curl_multi_poll(multi, nullptr, 0, static_cast<int>(timeout.count()), nullptr);
        curl_multi_perform(multi, &running);
    }
    in_perform_ = false;

    if (callback_error_) {
        auto error = callback_error_;
        callback_error_ = nullptr;
        std::rethrow_exception(error);
    }
    finish_completed();
}

void CurlTransport::finish_completed() {
    auto* multi = static_cast<CURLM*>(multi_);
    int queued = 0;
    while (CURLMsg* msg = curl_multi_info_read(multi, &queued)) {
        if (msg->msg != CURLMSG_DONE) continue;

        char* priv = nullptr;
        curl_easy_getinfo(msg->easy_handle, CURLINFO_PRIVATE, &priv);
        CURLcode code = msg->data.result;
        auto* raw = reinterpret_cast<Transfer*>(priv);
        if (!raw) continue;

        auto it = transfers_.find(raw->id);
        if (it == transfers_.end()) continue;
        std::unique_ptr<Transfer> t = std::move(it->second);
        transfers_.erase(it);
        curl_multi_remove_handle(multi, t->curl);

        if (t->cancelled) continue;
        if (code != CURLE_OK) {
            std::cerr << "[curl] Transfer " << t->id << " failed: "
                      << curl_easy_strerror(code) << "\n";
            if (t->handlers.on_complete) {
                t->handlers.on_complete(std::make_exception_ptr(
                    TransportError(curl_easy_strerror(code))));
            }
            continue;
        }
        t->send_response();
        if (t->handlers.on_complete) t->handlers.on_complete(nullptr);
    }
}

} // namespace fetchkit
