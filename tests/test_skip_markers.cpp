#include <gtest/gtest.h>
#include "session/skip_markers.hpp"

namespace Encore::test {

class SkipMarkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        markers_.intro = ChapterMarker{10000, 25000, MarkerKind::Intro};
        markers_.credits = ChapterMarker{1100000, 1180000, MarkerKind::Credits};
        manager_.load_markers(markers_);
    }

    PlaybackConfig config_;
    SkipMarkerManager manager_{config_};
    MarkerPair markers_;
};

TEST_F(SkipMarkerTest, IntroVisibleOnlyInsideHalfOpenWindow) {
    manager_.update(9999);
    EXPECT_FALSE(manager_.is_intro_visible());
    manager_.update(10000);
    EXPECT_TRUE(manager_.is_intro_visible());
    manager_.update(24999);
    EXPECT_TRUE(manager_.is_intro_visible());
    manager_.update(25000);
    EXPECT_FALSE(manager_.is_intro_visible());
}

TEST_F(SkipMarkerTest, VisibilityIsAPureFunctionOfPosition) {
    manager_.update(12000);
    EXPECT_TRUE(manager_.is_intro_visible());
    manager_.update(30000);
    manager_.update(12000);
    EXPECT_TRUE(manager_.is_intro_visible());
    EXPECT_FALSE(manager_.is_credits_visible());
}

TEST_F(SkipMarkerTest, UserSkipSeeksToEndAndStaysDismissed) {
    manager_.update(12000);
    std::optional<int64_t> target = manager_.skip_intro();
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(*target, 25000);
    EXPECT_FALSE(manager_.is_intro_visible());

    // Seeking back into the window does not bring the button back
    manager_.update(15000);
    EXPECT_FALSE(manager_.is_intro_visible());
}

TEST_F(SkipMarkerTest, CreditsSkip) {
    manager_.update(1150000);
    EXPECT_TRUE(manager_.is_credits_visible());
    EXPECT_EQ(manager_.skip_credits(), std::optional<int64_t>(1180000));
    manager_.update(1150000);
    EXPECT_FALSE(manager_.is_credits_visible());
}

TEST_F(SkipMarkerTest, AutoSkipReturnsSeekOnce) {
    config_.auto_skip_intro = true;
    manager_.update_config(config_);

    EXPECT_EQ(manager_.update(9000), std::nullopt);
    EXPECT_EQ(manager_.update(10500), std::optional<int64_t>(25000));
    EXPECT_TRUE(manager_.intro().user_dismissed);
    EXPECT_EQ(manager_.update(11000), std::nullopt);
}

TEST_F(SkipMarkerTest, AutoSkipIgnoresShortWindows) {
    config_.auto_skip_intro = true;
    config_.minimum_marker_duration_ms = 20000;
    manager_.update_config(config_);

    EXPECT_EQ(manager_.update(12000), std::nullopt);
    EXPECT_TRUE(manager_.is_intro_visible());
}

TEST_F(SkipMarkerTest, AutoSkipAcceptsWindowOfExactlyTheMinimum) {
    config_.auto_skip_intro = true;
    config_.minimum_marker_duration_ms = 15000;
    manager_.update_config(config_);

    EXPECT_EQ(manager_.update(12000), std::optional<int64_t>(25000));
}

TEST_F(SkipMarkerTest, ClearMarkersIsIdempotent) {
    manager_.update(12000);
    manager_.clear_markers();
    EXPECT_FALSE(manager_.intro().marker.has_value());
    EXPECT_FALSE(manager_.is_intro_visible());

    manager_.clear_markers();
    EXPECT_FALSE(manager_.intro().marker.has_value());
    EXPECT_FALSE(manager_.credits().marker.has_value());
    EXPECT_FALSE(manager_.intro().user_dismissed);
    EXPECT_EQ(manager_.skip_intro(), std::nullopt);
}

TEST_F(SkipMarkerTest, LoadingMarkersResetsDismissal) {
    manager_.skip_intro();
    manager_.load_markers(markers_);
    manager_.update(12000);
    EXPECT_TRUE(manager_.is_intro_visible());
}

} // namespace Encore::test
