#pragma once

#include "scheduler.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace Encore::test {

// Fast-forwardable scheduler: timers only fire from advance()
class FakeScheduler : public Scheduler {
public:
    TimerHandle schedule_once(std::chrono::milliseconds delay, Callback callback) override {
        auto state = std::make_shared<TimerState>();
        uint64_t id = next_id_++;
        timers_.push_back(Timer{id, now_ + delay.count(), state, std::move(callback)});
        delays_.push_back(delay);

        state->cancel = [this, id]() {
            timers_.erase(std::remove_if(timers_.begin(), timers_.end(),
                [id](const Timer& t) { return t.id == id; }), timers_.end());
        };
        return TimerHandle(state);
    }

    int64_t now() const override { return now_; }

    // Move time forward, firing due timers in deadline order
    void advance(std::chrono::milliseconds amount) {
        int64_t target = now_ + amount.count();
        while (true) {
            auto next = std::min_element(timers_.begin(), timers_.end(),
                [](const Timer& a, const Timer& b) {
                    return a.due != b.due ? a.due < b.due : a.id < b.id;
                });
            if (next == timers_.end() || next->due > target) break;

            Timer timer = *next;
            timers_.erase(next);
            now_ = timer.due;
            timer.state->finished = true;
            timer.state->cancel = nullptr;
            if (timer.callback) timer.callback();
        }
        now_ = target;
    }

    size_t pending_count() const { return timers_.size(); }

    // Delay of every timer ever scheduled, in scheduling order
    const std::vector<std::chrono::milliseconds>& scheduled_delays() const { return delays_; }
    void clear_scheduled_delays() { delays_.clear(); }

private:
    struct Timer {
        uint64_t id;
        int64_t due;
        std::shared_ptr<TimerState> state;
        Callback callback;
    };

    int64_t now_ = 0;
    uint64_t next_id_ = 1;
    std::vector<Timer> timers_;
    std::vector<std::chrono::milliseconds> delays_;
};

} // namespace Encore::test
