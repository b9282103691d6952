#include <catch2/catch.hpp>
#include "tools/retry.hpp"
#include "event_loop.hpp"
#include <chrono>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

using namespace fetchkit;
using namespace std::chrono_literals;

// Task failing `failures` times before succeeding with "ok"
static Task<std::string> flaky(int& calls, int failures) {
    return [&calls, failures](Settle<std::string> settle) {
        calls++;
        if (calls <= failures) {
            settle(TaskResult<std::string>::rejected(
                std::runtime_error("failure " + std::to_string(calls))));
        } else {
            settle(TaskResult<std::string>::fulfilled("ok"));
        }
    };
}

// ── Success paths ────────────────────────────────────────────────

TEST_CASE("retry_task: success on first attempt", "[retry]") {
    int calls = 0;
    std::optional<TaskResult<std::string>> result;
    retry_task<std::string>(flaky(calls, 0), 3, [&](TaskResult<std::string> r) { result = r; });

    REQUIRE(calls == 1);
    REQUIRE(result.has_value());
    REQUIRE(result->value() == "ok");
}

TEST_CASE("retry_task: n failures then success takes n+1 calls", "[retry]") {
    for (int n = 1; n <= 4; n++) {
        int calls = 0;
        std::optional<TaskResult<std::string>> result;
        retry_task<std::string>(flaky(calls, n), static_cast<uint32_t>(n),
                                [&](TaskResult<std::string> r) { result = r; });

        REQUIRE(calls == n + 1);
        REQUIRE(result->ok());
        REQUIRE(result->value() == "ok");
    }
}

TEST_CASE("retry_task: stops retrying after success", "[retry]") {
    int calls = 0;
    std::optional<TaskResult<std::string>> result;
    retry_task<std::string>(flaky(calls, 1), 5, [&](TaskResult<std::string> r) { result = r; });

    REQUIRE(calls == 2);
    REQUIRE(result->ok());
}

// ── Exhaustion ───────────────────────────────────────────────────

TEST_CASE("retry_task: always failing reports attempt count", "[retry]") {
    int calls = 0;
    std::optional<TaskResult<std::string>> result;
    retry_task<std::string>(flaky(calls, 100), 3, [&](TaskResult<std::string> r) { result = r; });

    REQUIRE(calls == 4);
    REQUIRE(result.has_value());
    REQUIRE_FALSE(result->ok());

    try {
        result->value();
        FAIL("expected RetryError");
    } catch (const RetryError& e) {
        REQUIRE(e.attempts() == 4);
        REQUIRE(error_message(e.last_error()) == "failure 4");
        REQUIRE(std::string(e.what()) ==
                "Task failed after 4 attempts. Last error: failure 4");
    }
}

TEST_CASE("retry_task: zero retries means one attempt", "[retry]") {
    int calls = 0;
    std::optional<TaskResult<std::string>> result;
    retry_task<std::string>(flaky(calls, 1), 0, [&](TaskResult<std::string> r) { result = r; });

    REQUIRE(calls == 1);
    REQUIRE_THROWS_AS(result->value(), RetryError);
}

TEST_CASE("retry_task: synchronous throw is retried", "[retry]") {
    int calls = 0;
    Task<int> task = [&calls](Settle<int> settle) {
        if (++calls < 3) throw std::logic_error("not yet");
        settle(TaskResult<int>::fulfilled(calls));
    };

    std::optional<TaskResult<int>> result;
    retry_task<int>(task, 2, [&](TaskResult<int> r) { result = r; });
    REQUIRE(calls == 3);
    REQUIRE(result->value() == 3);
}

TEST_CASE("retry_task: non-standard error is wrapped", "[retry]") {
    Task<int> task = [](Settle<int> settle) {
        settle(TaskResult<int>::rejected(std::make_exception_ptr(std::string("raw"))));
    };

    std::optional<TaskResult<int>> result;
    retry_task<int>(task, 1, [&](TaskResult<int> r) { result = r; });

    try {
        result->value();
        FAIL("expected RetryError");
    } catch (const RetryError& e) {
        REQUIRE(e.attempts() == 2);
        REQUIRE_THROWS_AS(std::rethrow_exception(e.last_error()), TaskError);
    }
}

// ── Asynchronous tasks ───────────────────────────────────────────

TEST_CASE("retry_task: retries tasks settling on the loop", "[retry]") {
    EventLoop loop;
    int calls = 0;
    Task<int> task = [&](Settle<int> settle) {
        int attempt = ++calls;
        loop.set_timeout(2ms, [attempt, settle]() {
            if (attempt < 3) {
                settle(TaskResult<int>::rejected(std::runtime_error("later")));
            } else {
                settle(TaskResult<int>::fulfilled(attempt * 10));
            }
        });
    };

    std::optional<TaskResult<int>> result;
    retry_task<int>(task, 5, [&](TaskResult<int> r) { result = r; });
    REQUIRE_FALSE(result.has_value());

    loop.run();
    REQUIRE(calls == 3);
    REQUIRE(result->value() == 30);
}

// ── Limits ───────────────────────────────────────────────────────

TEST_CASE("retry_task: many synchronous failures do not recurse", "[retry]") {
    const uint32_t retries = 100000;
    uint32_t calls = 0;
    Task<int> task = [&calls](Settle<int> settle) {
        calls++;
        settle(TaskResult<int>::rejected(std::runtime_error("always")));
    };

    std::optional<TaskResult<int>> result;
    int done = 0;
    retry_task<int>(task, retries, [&](TaskResult<int> r) {
        done++;
        result = r;
    });

    REQUIRE(calls == retries + 1);
    REQUIRE(done == 1);
    try {
        result->value();
        FAIL("expected RetryError");
    } catch (const RetryError& e) {
        REQUIRE(e.attempts() == retries + 1);
    }
}

TEST_CASE("retry_task: largest retry count still retries", "[retry]") {
    int calls = 0;
    std::optional<TaskResult<std::string>> result;
    retry_task<std::string>(flaky(calls, 2), std::numeric_limits<uint32_t>::max(),
                            [&](TaskResult<std::string> r) { result = r; });

    REQUIRE(calls == 3);
    REQUIRE(result->ok());
    REQUIRE(result->value() == "ok");
}
