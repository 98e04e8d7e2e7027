#include "scheduler.hpp"
#include <glib.h>

namespace Encore {

void TimerHandle::cancel() {
    if (!state_ || state_->finished) return;
    state_->finished = true;
    if (state_->cancel) {
        auto cancel = std::move(state_->cancel);
        state_->cancel = nullptr;
        cancel();
    }
}

namespace {

struct TimeoutData {
    std::shared_ptr<TimerState> state;
    Scheduler::Callback callback;
};

gboolean on_timeout(gpointer user_data) {
    auto* data = static_cast<TimeoutData*>(user_data);

    // GLib removes the source when we return G_SOURCE_REMOVE,
    // so the handle must not try to remove it again
    data->state->finished = true;
    data->state->cancel = nullptr;

    if (data->callback) {
        data->callback();
    }
    return G_SOURCE_REMOVE;
}

void free_timeout_data(gpointer user_data) {
    delete static_cast<TimeoutData*>(user_data);
}

} // namespace

void run_on_main_loop(std::function<void()> fn) {
    auto *data = new std::function<void()>(std::move(fn));
    g_idle_add_full(G_PRIORITY_DEFAULT,
        [](gpointer user_data) -> gboolean {
            (*static_cast<std::function<void()>*>(user_data))();
            return G_SOURCE_REMOVE;
        },
        data,
        [](gpointer user_data) {
            delete static_cast<std::function<void()>*>(user_data);
        });
}

TimerHandle GLibScheduler::schedule_once(std::chrono::milliseconds delay, Callback callback) {
    auto state = std::make_shared<TimerState>();
    auto* data = new TimeoutData{state, std::move(callback)};

    guint interval = delay.count() > 0 ? static_cast<guint>(delay.count()) : 0;
    guint source_id = g_timeout_add_full(G_PRIORITY_DEFAULT, interval,
                                         on_timeout, data, free_timeout_data);

    state->cancel = [source_id]() {
        g_source_remove(source_id);
    };
    return TimerHandle(state);
}

int64_t GLibScheduler::now() const {
    return g_get_monotonic_time() / 1000;
}

} // namespace Encore
