#pragma once
#include "errors.hpp"
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

namespace fetchkit {

enum class TaskStatus { Fulfilled, Rejected };

// Settled outcome of a deferred operation: a value or an error.
template<typename T>
class TaskResult {
public:
    static TaskResult fulfilled(T value) {
        TaskResult r;
        r.value_ = std::move(value);
        return r;
    }

    static TaskResult rejected(std::exception_ptr error) {
        TaskResult r;
        r.error_ = normalize_error(std::move(error));
        return r;
    }

    template<typename E>
    static TaskResult rejected(E error) {
        return rejected(std::make_exception_ptr(std::move(error)));
    }

    TaskStatus status() const {
        return value_ ? TaskStatus::Fulfilled : TaskStatus::Rejected;
    }
    bool ok() const { return value_.has_value(); }

    // Rethrows the stored error when rejected
    const T& value() const {
        if (!value_) std::rethrow_exception(error_);
        return *value_;
    }

    T take() {
        if (!value_) std::rethrow_exception(error_);
        return std::move(*value_);
    }

    std::exception_ptr error() const { return error_; }
    std::string error_message() const { return fetchkit::error_message(error_); }

private:
    TaskResult() = default;

    std::optional<T> value_;
    std::exception_ptr error_;
};

// Completion callback of a deferred operation
template<typename T>
using Settle = std::function<void(TaskResult<T>)>;

// Zero-argument deferred operation: when invoked it starts its work and
// settles exactly once, possibly synchronously.
template<typename T>
using Task = std::function<void(Settle<T>)>;

// Wrap a completion so that only the first settlement is delivered.
template<typename T>
Settle<T> settle_once(Settle<T> settle) {
    auto done = std::make_shared<bool>(false);
    return [done, settle = std::move(settle)](TaskResult<T> result) {
        if (*done) return;
        *done = true;
        settle(std::move(result));
    };
}

// Invoke a task, turning a synchronous throw into a rejection.
template<typename T>
void start_task(const Task<T>& task, Settle<T> settle) {
    auto once = settle_once<T>(std::move(settle));
    try {
        task(once);
    } catch (...) {
        once(TaskResult<T>::rejected(std::current_exception()));
    }
}

} // namespace fetchkit
