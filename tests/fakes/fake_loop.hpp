#pragma once

#include <deque>
#include <functional>

namespace Encore::test {

// Stand-in for the main loop: completions queue up until run() drains them
class FakeLoop {
public:
    void post(std::function<void()> fn) {
        queue_.push_back(std::move(fn));
    }

    // Run queued completions, including ones they queue, until idle
    void run() {
        while (!queue_.empty()) {
            auto fn = std::move(queue_.front());
            queue_.pop_front();
            fn();
        }
    }

    // Drop everything queued without running it
    void discard() { queue_.clear(); }

    size_t pending() const { return queue_.size(); }

private:
    std::deque<std::function<void()>> queue_;
};

} // namespace Encore::test
