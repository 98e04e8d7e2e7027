#include <gtest/gtest.h>
#include "session/progress_policy.hpp"

namespace Encore::test {

class ProgressPolicyTest : public ::testing::Test {
protected:
    PlaybackConfig config_;
    ProgressPolicy policy_{config_};

    static PlaybackProgress saved(int64_t position_ms, int64_t duration_ms, bool watched = false) {
        return PlaybackProgress{position_ms, duration_ms, watched};
    }
};

TEST_F(ProgressPolicyTest, ResumeStartsJustAfterThreshold) {
    EXPECT_FALSE(policy_.should_resume(saved(5000, 1200000)));
    EXPECT_TRUE(policy_.should_resume(saved(5001, 1200000)));
}

TEST_F(ProgressPolicyTest, NoResumeNearTheEnd) {
    EXPECT_TRUE(policy_.should_resume(saved(1139999, 1200000)));
    EXPECT_FALSE(policy_.should_resume(saved(1140000, 1200000)));  // exactly 95%
}

TEST_F(ProgressPolicyTest, NoResumeWhenWatchedOrDisabled) {
    EXPECT_FALSE(policy_.should_resume(saved(600000, 1200000, true)));

    config_.auto_resume = false;
    policy_.update_config(config_);
    EXPECT_FALSE(policy_.should_resume(saved(600000, 1200000)));
}

TEST_F(ProgressPolicyTest, WatchedAboveNinetyPercent) {
    EXPECT_FALSE(policy_.is_watched(900, 1000));
    EXPECT_TRUE(policy_.is_watched(901, 1000));
    EXPECT_FALSE(policy_.is_watched(500, 0));
}

TEST_F(ProgressPolicyTest, PersistsOnIntervalOrWhenWatched) {
    policy_.reset(0);
    EXPECT_FALSE(policy_.should_persist(1000, 100000, 9999));
    EXPECT_TRUE(policy_.should_persist(1000, 100000, 10000));
    EXPECT_TRUE(policy_.should_persist(95000, 100000, 1));

    policy_.mark_persisted(10000);
    EXPECT_FALSE(policy_.should_persist(2000, 100000, 15000));
}

TEST_F(ProgressPolicyTest, NeverPersistsWithoutDuration) {
    policy_.reset(0);
    EXPECT_FALSE(policy_.should_persist(1000, 0, 1000000));
    EXPECT_FALSE(policy_.should_persist(1000, -1, 1000000));
}

TEST_F(ProgressPolicyTest, RatiosAreIndependent) {
    config_.watched_ratio = 0.5;
    config_.resume_ceiling = 0.99;
    policy_.update_config(config_);

    EXPECT_TRUE(policy_.is_watched(600, 1000));
    EXPECT_TRUE(policy_.should_resume(saved(970000, 1000000)));
}

TEST(RemoteStateTagTest, MapsStatesToRemoteVocabulary) {
    EXPECT_EQ(ProgressPolicy::remote_state_tag(PlayerState::Playing, false), "playing");
    EXPECT_EQ(ProgressPolicy::remote_state_tag(PlayerState::Paused, false), "paused");
    EXPECT_EQ(ProgressPolicy::remote_state_tag(PlayerState::Stopped, false), "stopped");
    EXPECT_EQ(ProgressPolicy::remote_state_tag(PlayerState::Loading, false), "buffering");
    EXPECT_EQ(ProgressPolicy::remote_state_tag(PlayerState::Idle, false), "playing");
    EXPECT_EQ(ProgressPolicy::remote_state_tag(PlayerState::Playing, true), "stopped");
    EXPECT_EQ(ProgressPolicy::remote_state_tag(PlayerState::Playing, false, true), "buffering");
    EXPECT_EQ(ProgressPolicy::remote_state_tag(PlayerState::Paused, false, true), "buffering");
    EXPECT_EQ(ProgressPolicy::remote_state_tag(PlayerState::Stopped, false, true), "stopped");
}

TEST(PlaybackProgressTest, PercentCompleteClampsAndHandlesZero) {
    EXPECT_DOUBLE_EQ((PlaybackProgress{500, 1000, false}).percent_complete(), 0.5);
    EXPECT_DOUBLE_EQ((PlaybackProgress{2000, 1000, false}).percent_complete(), 1.0);
    EXPECT_DOUBLE_EQ((PlaybackProgress{500, 0, false}).percent_complete(), 0.0);
}

} // namespace Encore::test
