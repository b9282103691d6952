#include "errors.hpp"
#include <utility>

namespace fetchkit {

static std::string http_error_message(long status, const std::string& body) {
    std::string msg = "HTTP error! status: " + std::to_string(status);
    std::string text = HttpError::status_text(status);
    if (!text.empty()) msg += " (" + text + ")";
    if (!body.empty()) msg += ": " + body.substr(0, 200);
    return msg;
}

HttpError::HttpError(long status, std::string body)
    : std::runtime_error(http_error_message(status, body)),
      status_(status), body_(std::move(body)) {}

std::string HttpError::status_text(long status) {
    switch (status) {
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 408: return "Request Timeout";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return {};
    }
}

RetryError::RetryError(uint32_t attempts, std::exception_ptr last_error)
    : std::runtime_error("Task failed after " + std::to_string(attempts) +
                         " attempts. Last error: " + error_message(last_error)),
      attempts_(attempts), last_error_(std::move(last_error)) {}

std::string error_message(std::exception_ptr error) {
    if (!error) return "unknown error";
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

std::exception_ptr normalize_error(std::exception_ptr error) {
    if (!error) {
        return std::make_exception_ptr(TaskError("rejected without a reason"));
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception&) {
        return error;
    } catch (...) {
        return std::make_exception_ptr(TaskError("rejected with a non-exception value"));
    }
}

} // namespace fetchkit
