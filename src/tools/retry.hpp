#pragma once
#include "../task.hpp"
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>

namespace fetchkit {

// Largest retry count; one more attempt than this must still fit in uint32_t
inline constexpr uint32_t kMaxRetries = std::numeric_limits<uint32_t>::max() - 1;

namespace detail {

template<typename T>
struct RetryState {
    Task<T> task;
    uint32_t max_attempts = 1;
    uint32_t attempts = 0;
    bool running = false;
    bool again = false;
    Settle<T> on_done;
};

// Issue attempts until one is still pending or the retry settled. A task
// that fails synchronously re-enters here; the running flag turns that into
// another loop iteration instead of a nested call.
template<typename T>
void retry_run(const std::shared_ptr<RetryState<T>>& state) {
    if (state->running) {
        state->again = true;
        return;
    }
    state->running = true;
    do {
        state->again = false;
        state->attempts++;
        start_task<T>(state->task, [state](TaskResult<T> result) {
            if (result.ok()) {
                state->on_done(std::move(result));
                return;
            }
            if (state->attempts >= state->max_attempts) {
                state->on_done(TaskResult<T>::rejected(
                    RetryError(state->attempts, result.error())));
                return;
            }
            std::cerr << "[retry] Attempt " << state->attempts << "/" << state->max_attempts
                      << " failed: " << result.error_message() << ". Retrying...\n";
            retry_run<T>(state);
        });
    } while (state->again);
    state->running = false;
}

} // namespace detail

// Run `task`, re-invoking it on failure up to `retries` more times.
// retries == 0 means exactly one attempt. Attempts follow each other with
// no delay; put any backoff inside the task itself. Once every attempt has
// failed, `on_done` receives a RetryError with the attempt count and the
// last error.
template<typename T>
void retry_task(Task<T> task, uint32_t retries, Settle<T> on_done) {
    if (retries > kMaxRetries) {
        std::cerr << "[retry] retries must be at most " << kMaxRetries << ", using "
                  << kMaxRetries << "\n";
        retries = kMaxRetries;
    }
    auto state = std::make_shared<detail::RetryState<T>>();
    state->task = std::move(task);
    state->max_attempts = retries + 1;
    state->on_done = std::move(on_done);
    detail::retry_run<T>(state);
}

} // namespace fetchkit
