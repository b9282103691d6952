#pragma once
#include <stdexcept>
#include <string>
#include <exception>
#include <cstdint>

namespace fetchkit {

// Non-success HTTP status (>= 400)
class HttpError : public std::runtime_error {
public:
    HttpError(long status, std::string body);

    long status() const { return status_; }
    const std::string& body() const { return body_; }

    // Human readable reason for common status codes (empty if unknown)
    static std::string status_text(long status);

private:
    long status_;
    std::string body_;
};

// Network-level failure reported by a transport
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Request did not settle before its timeout
class TimeoutError : public std::runtime_error {
public:
    explicit TimeoutError(const std::string& url)
        : std::runtime_error(url + " request timeout"), url_(url) {}

    long code() const { return 408; }
    const std::string& url() const { return url_; }

private:
    std::string url_;
};

// Caller cancelled the operation
class CancelledError : public std::runtime_error {
public:
    explicit CancelledError(const std::string& what = "Request canceled by user")
        : std::runtime_error(what) {}
};

// Rejection reason that was not a std::exception
class TaskError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// All retry attempts failed
class RetryError : public std::runtime_error {
public:
    RetryError(uint32_t attempts, std::exception_ptr last_error);

    uint32_t attempts() const { return attempts_; }
    std::exception_ptr last_error() const { return last_error_; }

private:
    uint32_t attempts_;
    std::exception_ptr last_error_;
};

// Message of a stored exception ("unknown error" if it is not a std::exception)
std::string error_message(std::exception_ptr error);

// Guarantee the error is a non-null std::exception, wrapping anything else
std::exception_ptr normalize_error(std::exception_ptr error);

} // namespace fetchkit
