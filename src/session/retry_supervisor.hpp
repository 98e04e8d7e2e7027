#pragma once

#include "../scheduler.hpp"
#include <chrono>
#include <functional>

namespace Encore {

/**
 * Bounded exponential backoff around the load sequence.
 * Retry n (1-based) runs after 2^(n-1) seconds.
 */
class RetrySupervisor {
public:
    struct Decision {
        bool scheduled = false;             // false: attempts exhausted
        int attempt = 0;
        std::chrono::milliseconds delay{0};
    };

    RetrySupervisor(Scheduler& scheduler, int max_attempts);
    ~RetrySupervisor();

    RetrySupervisor(const RetrySupervisor&) = delete;
    RetrySupervisor& operator=(const RetrySupervisor&) = delete;

    /**
     * Handle a failed load. Schedules `replay` unless the attempts are
     * exhausted, in which case the counter returns to 0.
     */
    Decision on_failure(std::function<void()> replay);

    /**
     * Cancel any pending retry and forget previous attempts
     */
    void reset();

    /**
     * Cancel the pending retry, keeping the attempt count
     */
    void cancel();

    void set_max_attempts(int max_attempts) { max_attempts_ = max_attempts; }

    int attempt() const { return attempt_; }
    int max_attempts() const { return max_attempts_; }
    bool has_pending() const { return timer_.is_pending(); }

    static std::chrono::milliseconds delay_for_attempt(int attempt);

private:
    Scheduler& scheduler_;
    int attempt_ = 0;
    int max_attempts_;
    TimerHandle timer_;
};

} // namespace Encore
