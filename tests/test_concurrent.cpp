#include <catch2/catch.hpp>
#include "tools/concurrent.hpp"
#include "event_loop.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fetchkit;
using namespace std::chrono_literals;

namespace {

// Tracks how many tasks are running at once
struct Gauge {
    int running = 0;
    int peak = 0;
    std::vector<int> started;
};

// Task that settles with `value` after `delay` on the loop
Task<int> delayed(EventLoop& loop, Gauge& gauge, int value, std::chrono::milliseconds delay,
                  bool fail = false) {
    return [&loop, &gauge, value, delay, fail](Settle<int> settle) {
        gauge.started.push_back(value);
        gauge.running++;
        gauge.peak = std::max(gauge.peak, gauge.running);
        loop.set_timeout(delay, [&gauge, value, fail, settle]() {
            gauge.running--;
            if (fail) {
                settle(TaskResult<int>::rejected(std::runtime_error("task " + std::to_string(value))));
            } else {
                settle(TaskResult<int>::fulfilled(value));
            }
        });
    };
}

} // namespace

// ── Ordering and limits ──────────────────────────────────────────

TEST_CASE("run_concurrent: results keep task order", "[concurrent]") {
    EventLoop loop;
    Gauge gauge;
    std::vector<Task<int>> tasks;
    // Later tasks finish first
    for (int i = 0; i < 6; i++) {
        tasks.push_back(delayed(loop, gauge, i, std::chrono::milliseconds(30 - i * 5)));
    }

    std::vector<TaskResult<int>> results;
    bool done = false;
    run_concurrent<int>(std::move(tasks), 3, [&](std::vector<TaskResult<int>> r) {
        results = std::move(r);
        done = true;
    });
    loop.run();

    REQUIRE(done);
    REQUIRE(results.size() == 6);
    for (int i = 0; i < 6; i++) {
        REQUIRE(results[i].ok());
        REQUIRE(results[i].value() == i);
    }
}

TEST_CASE("run_concurrent: never exceeds the limit", "[concurrent]") {
    for (size_t limit : {1u, 2u, 4u}) {
        EventLoop loop;
        Gauge gauge;
        std::vector<Task<int>> tasks;
        for (int i = 0; i < 8; i++) tasks.push_back(delayed(loop, gauge, i, 5ms));

        size_t count = 0;
        run_concurrent<int>(std::move(tasks), limit, [&](std::vector<TaskResult<int>> r) {
            count = r.size();
        });
        loop.run();

        REQUIRE(count == 8);
        REQUIRE(gauge.peak == static_cast<int>(limit));
    }
}

TEST_CASE("run_concurrent: limit above task count runs everything at once", "[concurrent]") {
    EventLoop loop;
    Gauge gauge;
    std::vector<Task<int>> tasks;
    for (int i = 0; i < 3; i++) tasks.push_back(delayed(loop, gauge, i, 5ms));

    run_concurrent<int>(std::move(tasks), 10, [](std::vector<TaskResult<int>>) {});
    REQUIRE(gauge.running == 3);
    loop.run();
    REQUIRE(gauge.peak == 3);
}

TEST_CASE("run_concurrent: tasks start in index order", "[concurrent]") {
    EventLoop loop;
    Gauge gauge;
    std::vector<Task<int>> tasks;
    for (int i = 0; i < 5; i++) tasks.push_back(delayed(loop, gauge, i, 2ms));

    run_concurrent<int>(std::move(tasks), 2, [](std::vector<TaskResult<int>>) {});
    loop.run();
    REQUIRE(gauge.started == std::vector<int>{0, 1, 2, 3, 4});
}

TEST_CASE("run_concurrent: zero limit is treated as one", "[concurrent]") {
    EventLoop loop;
    Gauge gauge;
    std::vector<Task<int>> tasks;
    for (int i = 0; i < 3; i++) tasks.push_back(delayed(loop, gauge, i, 2ms));

    size_t count = 0;
    run_concurrent<int>(std::move(tasks), 0, [&](std::vector<TaskResult<int>> r) {
        count = r.size();
    });
    loop.run();
    REQUIRE(count == 3);
    REQUIRE(gauge.peak == 1);
}

// ── Failures ─────────────────────────────────────────────────────

TEST_CASE("run_concurrent: failures are captured per task", "[concurrent]") {
    EventLoop loop;
    Gauge gauge;
    std::vector<Task<int>> tasks;
    tasks.push_back(delayed(loop, gauge, 0, 5ms));
    tasks.push_back(delayed(loop, gauge, 1, 1ms, true));
    tasks.push_back(delayed(loop, gauge, 2, 3ms));

    std::vector<TaskResult<int>> results;
    run_concurrent<int>(std::move(tasks), 2, [&](std::vector<TaskResult<int>> r) {
        results = std::move(r);
    });
    loop.run();

    REQUIRE(results.size() == 3);
    REQUIRE(results[0].status() == TaskStatus::Fulfilled);
    REQUIRE(results[1].status() == TaskStatus::Rejected);
    REQUIRE(results[1].error_message() == "task 1");
    REQUIRE(results[2].value() == 2);
}

TEST_CASE("run_concurrent: synchronous throw becomes a rejection", "[concurrent]") {
    std::vector<Task<int>> tasks;
    tasks.push_back([](Settle<int>) { throw std::invalid_argument("bad input"); });
    tasks.push_back([](Settle<int> settle) { settle(TaskResult<int>::fulfilled(7)); });

    std::vector<TaskResult<int>> results;
    run_concurrent<int>(std::move(tasks), 1, [&](std::vector<TaskResult<int>> r) {
        results = std::move(r);
    });

    REQUIRE(results.size() == 2);
    REQUIRE_FALSE(results[0].ok());
    REQUIRE_THROWS_AS(results[0].value(), std::invalid_argument);
    REQUIRE(results[1].value() == 7);
}

TEST_CASE("run_concurrent: non-standard rejection is normalized", "[concurrent]") {
    std::vector<Task<int>> tasks;
    tasks.push_back([](Settle<int> settle) {
        settle(TaskResult<int>::rejected(std::make_exception_ptr(42)));
    });
    tasks.push_back([](Settle<int> settle) {
        settle(TaskResult<int>::rejected(std::exception_ptr()));
    });

    std::vector<TaskResult<int>> results;
    run_concurrent<int>(std::move(tasks), 2, [&](std::vector<TaskResult<int>> r) {
        results = std::move(r);
    });

    REQUIRE(results.size() == 2);
    REQUIRE_THROWS_AS(results[0].value(), TaskError);
    REQUIRE_THROWS_AS(results[1].value(), TaskError);
}

// ── Edge cases ───────────────────────────────────────────────────

TEST_CASE("run_concurrent: empty input completes immediately", "[concurrent]") {
    bool done = false;
    run_concurrent<int>({}, 4, [&](std::vector<TaskResult<int>> r) {
        REQUIRE(r.empty());
        done = true;
    });
    REQUIRE(done);
}

TEST_CASE("run_concurrent: synchronous tasks all complete", "[concurrent]") {
    std::vector<Task<int>> tasks;
    for (int i = 0; i < 100; i++) {
        tasks.push_back([i](Settle<int> settle) { settle(TaskResult<int>::fulfilled(i * 2)); });
    }

    std::vector<TaskResult<int>> results;
    run_concurrent<int>(std::move(tasks), 3, [&](std::vector<TaskResult<int>> r) {
        results = std::move(r);
    });

    REQUIRE(results.size() == 100);
    REQUIRE(results[99].value() == 198);
}

TEST_CASE("run_concurrent: task settling twice counts once", "[concurrent]") {
    std::vector<Task<int>> tasks;
    tasks.push_back([](Settle<int> settle) {
        settle(TaskResult<int>::fulfilled(1));
        settle(TaskResult<int>::fulfilled(2));
    });
    tasks.push_back([](Settle<int> settle) { settle(TaskResult<int>::fulfilled(3)); });

    int calls = 0;
    std::vector<TaskResult<int>> results;
    run_concurrent<int>(std::move(tasks), 1, [&](std::vector<TaskResult<int>> r) {
        calls++;
        results = std::move(r);
    });

    REQUIRE(calls == 1);
    REQUIRE(results[0].value() == 1);
    REQUIRE(results[1].value() == 3);
}
