#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace Encore {

/**
 * Shared bookkeeping behind a TimerHandle.
 * `finished` is set once the timer fired or was cancelled.
 */
struct TimerState {
    bool finished = false;
    std::function<void()> cancel;
};

/**
 * Cancellable handle to a one-shot timer.
 * Cancelling a fired, cancelled or empty handle does nothing.
 */
class TimerHandle {
public:
    TimerHandle() = default;
    explicit TimerHandle(std::shared_ptr<TimerState> state) : state_(std::move(state)) {}

    void cancel();

    bool is_pending() const {
        return state_ && !state_->finished;
    }

private:
    std::shared_ptr<TimerState> state_;
};

/**
 * Source of one-shot timers and monotonic time
 */
class Scheduler {
public:
    using Callback = std::function<void()>;

    virtual ~Scheduler() = default;

    virtual TimerHandle schedule_once(std::chrono::milliseconds delay, Callback callback) = 0;

    /**
     * Monotonic milliseconds, arbitrary epoch
     */
    virtual int64_t now() const = 0;
};

/**
 * Run fn from the default main context as soon as it is idle
 */
void run_on_main_loop(std::function<void()> fn);

/**
 * Scheduler backed by the GLib main loop (g_timeout_add_full)
 */
class GLibScheduler : public Scheduler {
public:
    TimerHandle schedule_once(std::chrono::milliseconds delay, Callback callback) override;
    int64_t now() const override;
};

} // namespace Encore
