#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <set>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fetchkit {

// Something the loop must wait on besides timers (e.g. network sockets).
class IoSource {
public:
    virtual ~IoSource() = default;

    // True while the source has outstanding work that keeps the loop alive
    virtual bool active() const = 0;

    // Wait up to `timeout` for activity and dispatch any ready callbacks
    virtual void poll(std::chrono::milliseconds timeout) = 0;
};

// Single-threaded cooperative executor. All handlers run on the thread
// that calls run(); nothing here is thread-safe.
class EventLoop {
public:
    using Clock = std::chrono::steady_clock;
    using Handler = std::function<void()>;
    using TimerId = uint64_t;

    EventLoop() = default;
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Run handler on the next loop turn
    void post(Handler handler);

    TimerId set_timeout(std::chrono::milliseconds delay, Handler handler);

    // Repeating timer. A timer without keep_alive does not prevent run()
    // from returning.
    TimerId set_interval(std::chrono::milliseconds period, Handler handler,
                         bool keep_alive = true);

    // Returns true if the timer was still pending
    bool cancel_timer(TimerId id);

    void add_source(IoSource* source);
    void remove_source(IoSource* source);

    // Run until there is no posted work, no keep-alive timer and no active
    // source, or until stop() is called. Returns the number of handlers run.
    size_t run();

    // Run for a fixed wall-clock duration, firing every due timer
    size_t run_for(std::chrono::milliseconds duration);

    // Run until predicate holds, the loop drains, or max_duration elapses.
    // Returns the final value of the predicate.
    bool run_until(const std::function<bool()>& predicate,
                   std::chrono::milliseconds max_duration = std::chrono::seconds(10));

    void stop() { stop_requested_ = true; }

    size_t pending_timers() const { return timers_.size(); }

private:
    struct Timer {
        Handler handler;
        std::chrono::milliseconds period{0}; // zero = one-shot
        bool keep_alive = true;
    };

    using Deadline = std::pair<Clock::time_point, TimerId>;

    TimerId add_timer(std::chrono::milliseconds delay, Timer timer);
    size_t run_posted();
    size_t run_due_timers();
    bool has_live_work() const;
    void wait(Clock::time_point limit);

    std::deque<Handler> posted_;
    std::set<Deadline> queue_;
    std::unordered_map<TimerId, std::pair<Clock::time_point, Timer>> timers_;
    std::vector<IoSource*> sources_;
    TimerId next_timer_id_ = 1;
    bool stop_requested_ = false;
};

} // namespace fetchkit
