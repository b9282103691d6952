#include "event_loop.hpp"
#include <algorithm>
#include <thread>

namespace fetchkit {

// Upper bound for a single source poll when no timer is pending
static constexpr std::chrono::milliseconds kMaxIdleWait{1000};

void EventLoop::post(Handler handler) {
    posted_.push_back(std::move(handler));
}

EventLoop::TimerId EventLoop::set_timeout(std::chrono::milliseconds delay, Handler handler) {
    Timer timer;
    timer.handler = std::move(handler);
    return add_timer(delay, std::move(timer));
}

EventLoop::TimerId EventLoop::set_interval(std::chrono::milliseconds period, Handler handler,
                                           bool keep_alive) {
    Timer timer;
    timer.handler = std::move(handler);
    timer.period = std::max(period, std::chrono::milliseconds(1));
    timer.keep_alive = keep_alive;
    return add_timer(timer.period, std::move(timer));
}

EventLoop::TimerId EventLoop::add_timer(std::chrono::milliseconds delay, Timer timer) {
    TimerId id = next_timer_id_++;
    auto deadline = Clock::now() + std::max(delay, std::chrono::milliseconds(0));
    queue_.insert({deadline, id});
    timers_.emplace(id, std::make_pair(deadline, std::move(timer)));
    return id;
}

bool EventLoop::cancel_timer(TimerId id) {
    auto it = timers_.find(id);
    if (it == timers_.end()) return false;
    queue_.erase({it->second.first, id});
    timers_.erase(it);
    return true;
}

void EventLoop::add_source(IoSource* source) {
    if (std::find(sources_.begin(), sources_.end(), source) == sources_.end())
        sources_.push_back(source);
}

void EventLoop::remove_source(IoSource* source) {
    sources_.erase(std::remove(sources_.begin(), sources_.end(), source), sources_.end());
}

size_t EventLoop::run_posted() {
    // Handlers posted while draining run on the next turn
    std::deque<Handler> batch;
    batch.swap(posted_);
    size_t count = 0;
    while (!batch.empty()) {
        Handler handler = std::move(batch.front());
        batch.pop_front();
        handler();
        ++count;
    }
    return count;
}

size_t EventLoop::run_due_timers() {
    auto now = Clock::now();
    size_t count = 0;
    while (!queue_.empty() && queue_.begin()->first <= now) {
        TimerId id = queue_.begin()->second;
        queue_.erase(queue_.begin());

        auto it = timers_.find(id);
        if (it == timers_.end()) continue;

        Handler handler;
        if (it->second.second.period.count() > 0) {
            // Reschedule before running so the handler may cancel itself
            handler = it->second.second.handler;
            auto next = now + it->second.second.period;
            it->second.first = next;
            queue_.insert({next, id});
        } else {
            handler = std::move(it->second.second.handler);
            timers_.erase(it);
        }
        handler();
        ++count;
    }
    return count;
}

bool EventLoop::has_live_work() const {
    if (!posted_.empty()) return true;
    for (const auto& [id, entry] : timers_) {
        if (entry.second.keep_alive) return true;
    }
    for (const auto* source : sources_) {
        if (source->active()) return true;
    }
    return false;
}

void EventLoop::wait(Clock::time_point limit) {
    auto now = Clock::now();
    std::chrono::milliseconds timeout{0};
    if (posted_.empty()) {
        auto next = limit;
        if (!queue_.empty()) next = std::min(next, queue_.begin()->first);
        if (next > now) {
            auto remaining = next - now;
            timeout = remaining > kMaxIdleWait
                ? kMaxIdleWait
                : std::chrono::ceil<std::chrono::milliseconds>(remaining);
        }
    }

    bool polled = false;
    // Copy: a source callback may add or remove sources
    auto sources = sources_;
    for (auto* source : sources) {
        if (!source->active()) continue;
        source->poll(polled ? std::chrono::milliseconds(0) : timeout);
        polled = true;
    }
    if (!polled && timeout.count() > 0) {
        std::this_thread::sleep_for(timeout);
    }
}

size_t EventLoop::run() {
    stop_requested_ = false;
    size_t count = 0;
    while (!stop_requested_) {
        count += run_posted();
        count += run_due_timers();
        if (stop_requested_ || !has_live_work()) break;
        wait(Clock::time_point::max());
    }
    return count;
}

size_t EventLoop::run_for(std::chrono::milliseconds duration) {
    stop_requested_ = false;
    auto end = Clock::now() + duration;
    size_t count = 0;
    while (!stop_requested_) {
        count += run_posted();
        count += run_due_timers();
        if (stop_requested_ || Clock::now() >= end) break;
        wait(end);
    }
    return count;
}

bool EventLoop::run_until(const std::function<bool()>& predicate,
                          std::chrono::milliseconds max_duration) {
    stop_requested_ = false;
    auto end = Clock::now() + max_duration;
    while (!stop_requested_) {
        if (predicate()) return true;
        run_posted();
        run_due_timers();
        if (predicate()) return true;
        if (stop_requested_ || !has_live_work() || Clock::now() >= end) break;
        wait(end);
    }
    return predicate();
}

} // namespace fetchkit
