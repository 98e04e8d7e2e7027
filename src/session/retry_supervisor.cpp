#include "retry_supervisor.hpp"
#include <glib.h>

namespace Encore {

RetrySupervisor::RetrySupervisor(Scheduler& scheduler, int max_attempts)
    : scheduler_(scheduler), max_attempts_(max_attempts) {
}

RetrySupervisor::~RetrySupervisor() {
    timer_.cancel();
}

std::chrono::milliseconds RetrySupervisor::delay_for_attempt(int attempt) {
    if (attempt < 1) attempt = 1;
    return std::chrono::milliseconds(1000LL << (attempt - 1));
}

RetrySupervisor::Decision RetrySupervisor::on_failure(std::function<void()> replay) {
    timer_.cancel();

    if (attempt_ >= max_attempts_) {
        g_warning("Giving up after %d load attempts", attempt_);
        attempt_ = 0;
        return Decision{};
    }

    attempt_++;
    Decision decision;
    decision.scheduled = true;
    decision.attempt = attempt_;
    decision.delay = delay_for_attempt(attempt_);

    g_info("Retrying load in %lld ms (attempt %d of %d)",
           static_cast<long long>(decision.delay.count()), attempt_, max_attempts_);
    timer_ = scheduler_.schedule_once(decision.delay, std::move(replay));
    return decision;
}

void RetrySupervisor::reset() {
    timer_.cancel();
    attempt_ = 0;
}

void RetrySupervisor::cancel() {
    timer_.cancel();
}

} // namespace Encore
