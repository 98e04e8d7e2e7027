#include <gtest/gtest.h>
#include "session/retry_supervisor.hpp"
#include "fakes/fake_scheduler.hpp"

using namespace std::chrono_literals;

namespace Encore::test {

class RetrySupervisorTest : public ::testing::Test {
protected:
    FakeScheduler scheduler_;
    RetrySupervisor retry_{scheduler_, 3};
    int replays_ = 0;

    RetrySupervisor::Decision fail() {
        return retry_.on_failure([this]() { replays_++; });
    }
};

TEST_F(RetrySupervisorTest, DelayDoublesPerAttempt) {
    EXPECT_EQ(RetrySupervisor::delay_for_attempt(1), 1000ms);
    EXPECT_EQ(RetrySupervisor::delay_for_attempt(2), 2000ms);
    EXPECT_EQ(RetrySupervisor::delay_for_attempt(3), 4000ms);
    EXPECT_EQ(RetrySupervisor::delay_for_attempt(4), 8000ms);
}

TEST_F(RetrySupervisorTest, SchedulesUntilMaxAttemptsThenGivesUp) {
    for (int attempt = 1; attempt <= 3; attempt++) {
        RetrySupervisor::Decision decision = fail();
        ASSERT_TRUE(decision.scheduled);
        EXPECT_EQ(decision.attempt, attempt);
        EXPECT_EQ(decision.delay, RetrySupervisor::delay_for_attempt(attempt));
        EXPECT_TRUE(retry_.has_pending());
        scheduler_.advance(decision.delay);
        EXPECT_EQ(replays_, attempt);
    }

    RetrySupervisor::Decision terminal = fail();
    EXPECT_FALSE(terminal.scheduled);
    EXPECT_FALSE(retry_.has_pending());
    EXPECT_EQ(retry_.attempt(), 0);

    scheduler_.advance(60s);
    EXPECT_EQ(replays_, 3);
}

TEST_F(RetrySupervisorTest, ReplayWaitsForTheFullDelay) {
    fail();
    scheduler_.advance(999ms);
    EXPECT_EQ(replays_, 0);
    scheduler_.advance(1ms);
    EXPECT_EQ(replays_, 1);
}

TEST_F(RetrySupervisorTest, ResetCancelsPendingRetryAndAttempts) {
    fail();
    fail();
    EXPECT_EQ(retry_.attempt(), 2);

    retry_.reset();
    EXPECT_EQ(retry_.attempt(), 0);
    EXPECT_FALSE(retry_.has_pending());

    scheduler_.advance(10s);
    EXPECT_EQ(replays_, 0);

    RetrySupervisor::Decision decision = fail();
    EXPECT_EQ(decision.attempt, 1);
    EXPECT_EQ(decision.delay, 1000ms);
}

TEST_F(RetrySupervisorTest, CancelIsIdempotent) {
    fail();
    retry_.cancel();
    size_t pending = scheduler_.pending_count();
    int attempt = retry_.attempt();

    retry_.cancel();
    EXPECT_EQ(scheduler_.pending_count(), pending);
    EXPECT_EQ(retry_.attempt(), attempt);
    EXPECT_FALSE(retry_.has_pending());
}

TEST_F(RetrySupervisorTest, ZeroMaxAttemptsFailsImmediately) {
    retry_.set_max_attempts(0);
    EXPECT_FALSE(fail().scheduled);
    EXPECT_EQ(scheduler_.pending_count(), 0u);
}

TEST(TimerHandleTest, CancellingFiredOrEmptyHandleIsNoOp) {
    FakeScheduler scheduler;
    int fired = 0;
    TimerHandle handle = scheduler.schedule_once(5ms, [&fired]() { fired++; });
    scheduler.advance(5ms);
    EXPECT_EQ(fired, 1);
    EXPECT_FALSE(handle.is_pending());

    handle.cancel();
    handle.cancel();

    TimerHandle empty;
    empty.cancel();
    EXPECT_FALSE(empty.is_pending());
}

} // namespace Encore::test
