#include <gtest/gtest.h>
#include "session/auto_play.hpp"
#include "fakes/fake_scheduler.hpp"

using namespace std::chrono_literals;

namespace Encore::test {

static std::vector<EpisodeRef> make_episodes(int count) {
    std::vector<EpisodeRef> episodes;
    for (int i = 1; i <= count; i++) {
        EpisodeRef ep;
        ep.id = "ep" + std::to_string(i);
        ep.title = "Episode " + std::to_string(i);
        ep.season = 1;
        ep.episode = i;
        episodes.push_back(ep);
    }
    return episodes;
}

class AutoPlayTest : public ::testing::Test {
protected:
    FakeScheduler scheduler_;
    PlaybackConfig config_;
    AutoPlayScheduler auto_play_{scheduler_, config_};
    int next_calls_ = 0;
    int leave_calls_ = 0;

    AutoPlayScheduler::Action feed(int64_t position, int64_t duration, const PlaylistContext *ctx) {
        return auto_play_.on_position(position, duration, ctx,
            [this]() { next_calls_++; },
            [this]() { leave_calls_++; });
    }
};

TEST_F(AutoPlayTest, SchedulesNextAfterGraceDelay) {
    PlaylistContext ctx = PlaylistContext::series("Show", make_episodes(3), 0, true);

    EXPECT_EQ(feed(940, 1000, &ctx), AutoPlayScheduler::Action::None);
    EXPECT_EQ(feed(951, 1000, &ctx), AutoPlayScheduler::Action::LoadNext);
    ASSERT_EQ(scheduler_.scheduled_delays().size(), 1u);
    EXPECT_EQ(scheduler_.scheduled_delays().front(), 3000ms);

    scheduler_.advance(2999ms);
    EXPECT_EQ(next_calls_, 0);
    scheduler_.advance(1ms);
    EXPECT_EQ(next_calls_, 1);
    EXPECT_EQ(leave_calls_, 0);
}

TEST_F(AutoPlayTest, ExactlyAtRatioDoesNotTrigger) {
    PlaylistContext ctx = PlaylistContext::series("Show", make_episodes(3), 0, true);

    EXPECT_EQ(feed(950, 1000, &ctx), AutoPlayScheduler::Action::None);
    EXPECT_FALSE(auto_play_.has_triggered());
    EXPECT_TRUE(scheduler_.scheduled_delays().empty());

    EXPECT_EQ(feed(951, 1000, &ctx), AutoPlayScheduler::Action::LoadNext);
}

TEST_F(AutoPlayTest, LastEpisodeNavigatesAwayAndNeverLoadsNext) {
    PlaylistContext ctx = PlaylistContext::series("Show", make_episodes(3), 2, true);

    EXPECT_EQ(feed(960, 1000, &ctx), AutoPlayScheduler::Action::NavigateAway);
    ASSERT_EQ(scheduler_.scheduled_delays().size(), 1u);
    EXPECT_EQ(scheduler_.scheduled_delays().front(), 5000ms);

    scheduler_.advance(10s);
    EXPECT_EQ(leave_calls_, 1);
    EXPECT_EQ(next_calls_, 0);
}

TEST_F(AutoPlayTest, TriggersOncePerPlayback) {
    PlaylistContext ctx = PlaylistContext::series("Show", make_episodes(3), 0, true);

    feed(960, 1000, &ctx);
    EXPECT_EQ(feed(970, 1000, &ctx), AutoPlayScheduler::Action::None);
    EXPECT_EQ(feed(990, 1000, &ctx), AutoPlayScheduler::Action::None);
    EXPECT_EQ(scheduler_.pending_count(), 1u);

    auto_play_.reset();
    EXPECT_FALSE(auto_play_.has_pending());
    EXPECT_EQ(feed(960, 1000, &ctx), AutoPlayScheduler::Action::LoadNext);
}

TEST_F(AutoPlayTest, NothingWithoutContextOrWhenDisabled) {
    EXPECT_EQ(feed(990, 1000, nullptr), AutoPlayScheduler::Action::None);

    auto_play_.reset();
    PlaylistContext disabled = PlaylistContext::series("Show", make_episodes(3), 0, false);
    EXPECT_EQ(feed(990, 1000, &disabled), AutoPlayScheduler::Action::None);

    auto_play_.reset();
    PlaylistContext single = PlaylistContext::single_item();
    EXPECT_EQ(feed(990, 1000, &single), AutoPlayScheduler::Action::None);

    EXPECT_EQ(scheduler_.pending_count(), 0u);
}

TEST_F(AutoPlayTest, UnknownDurationNeverTriggers) {
    PlaylistContext ctx = PlaylistContext::series("Show", make_episodes(3), 0, true);
    EXPECT_EQ(feed(5000, 0, &ctx), AutoPlayScheduler::Action::None);
    EXPECT_FALSE(auto_play_.has_triggered());
}

TEST_F(AutoPlayTest, ResetCancelsGraceTimer) {
    PlaylistContext ctx = PlaylistContext::series("Show", make_episodes(3), 0, true);
    feed(960, 1000, &ctx);
    auto_play_.reset();
    auto_play_.reset();
    scheduler_.advance(10s);
    EXPECT_EQ(next_calls_, 0);
}

} // namespace Encore::test
