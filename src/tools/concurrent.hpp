#pragma once
#include "../task.hpp"
#include <cstddef>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <vector>

namespace fetchkit {

template<typename T>
using AllSettled = std::function<void(std::vector<TaskResult<T>>)>;

namespace detail {

template<typename T>
struct ConcurrentState {
    std::vector<Task<T>> tasks;
    std::vector<std::optional<TaskResult<T>>> results;
    size_t limit = 1;
    size_t next = 0;
    size_t running = 0;
    size_t settled = 0;
    bool pumping = false;
    AllSettled<T> on_done;
};

template<typename T>
void concurrent_finish(const std::shared_ptr<ConcurrentState<T>>& state) {
    std::vector<TaskResult<T>> out;
    out.reserve(state->results.size());
    for (auto& r : state->results) out.push_back(std::move(*r));
    state->results.clear();
    state->on_done(std::move(out));
}

// Launch tasks until the limit is reached. Tasks that settle synchronously
// re-enter here; the pumping flag turns that into another loop iteration.
template<typename T>
void concurrent_pump(const std::shared_ptr<ConcurrentState<T>>& state) {
    if (state->pumping) return;
    state->pumping = true;
    while (state->running < state->limit && state->next < state->tasks.size()) {
        size_t index = state->next++;
        state->running++;
        Task<T> task = std::move(state->tasks[index]);
        start_task<T>(task, [state, index](TaskResult<T> result) {
            state->results[index] = std::move(result);
            state->running--;
            state->settled++;
            if (state->settled == state->results.size()) {
                concurrent_finish(state);
            } else {
                concurrent_pump(state);
            }
        });
    }
    state->pumping = false;
}

} // namespace detail

// Run every task with at most `max_concurrency` in flight. `on_done` is
// called once, after all tasks settled, with result[i] belonging to
// tasks[i]. A failing task never stops the others.
template<typename T>
void run_concurrent(std::vector<Task<T>> tasks, size_t max_concurrency, AllSettled<T> on_done) {
    if (tasks.empty()) {
        on_done({});
        return;
    }
    if (max_concurrency == 0) {
        std::cerr << "[concurrent] max_concurrency must be at least 1, using 1\n";
        max_concurrency = 1;
    }

    auto state = std::make_shared<detail::ConcurrentState<T>>();
    state->results.resize(tasks.size());
    state->tasks = std::move(tasks);
    state->limit = max_concurrency;
    state->on_done = std::move(on_done);
    detail::concurrent_pump(state);
}

} // namespace fetchkit
