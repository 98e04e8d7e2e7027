#include <gtest/gtest.h>
#include "session/session_types.hpp"

namespace Encore::test {

class PlaylistContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (int i = 1; i <= 4; i++) {
            EpisodeRef ep;
            ep.id = "s1e" + std::to_string(i);
            ep.title = "Episode " + std::to_string(i);
            ep.season = 1;
            ep.episode = i;
            ep.queue_item_id = 100 + i;
            episodes_.push_back(ep);
        }
    }

    std::vector<EpisodeRef> episodes_;
};

TEST_F(PlaylistContextTest, SingleItemHasNoNavigation) {
    PlaylistContext ctx = PlaylistContext::single_item();
    EXPECT_EQ(ctx.kind(), PlaylistContext::Kind::SingleItem);
    EXPECT_FALSE(ctx.has_previous());
    EXPECT_FALSE(ctx.has_next());
    EXPECT_FALSE(ctx.is_auto_play_enabled());
    EXPECT_EQ(ctx.current(), nullptr);
    EXPECT_EQ(ctx.position_label(), "");
}

TEST_F(PlaylistContextTest, SeriesNavigation) {
    PlaylistContext ctx = PlaylistContext::series("Show", episodes_, 0, true);
    EXPECT_FALSE(ctx.has_previous());
    EXPECT_TRUE(ctx.has_next());
    EXPECT_EQ(ctx.get_next(), std::optional<MediaItemId>("s1e2"));
    EXPECT_EQ(ctx.get_previous(), std::nullopt);

    ASSERT_TRUE(ctx.update_current_index("s1e4"));
    EXPECT_EQ(ctx.current_index(), 3u);
    EXPECT_TRUE(ctx.has_previous());
    EXPECT_FALSE(ctx.has_next());
    EXPECT_EQ(ctx.get_previous(), std::optional<MediaItemId>("s1e3"));
}

TEST_F(PlaylistContextTest, UnknownIdLeavesIndexUntouched) {
    PlaylistContext ctx = PlaylistContext::series("Show", episodes_, 1, true);
    EXPECT_FALSE(ctx.update_current_index("missing"));
    EXPECT_EQ(ctx.current_index(), 1u);
}

TEST_F(PlaylistContextTest, PositionLabels) {
    PlaylistContext series = PlaylistContext::series("Show", episodes_, 1, true);
    EXPECT_EQ(series.position_label(), "Show - S1E2 - Episode 2 of 4");

    PlaylistContext queue = PlaylistContext::play_queue(episodes_, 2, true);
    EXPECT_EQ(queue.position_label(), "Episode 3 - Item 3 of 4");
}

TEST_F(PlaylistContextTest, UpdatingIndexMovesRemoteQueueItem) {
    RemoteQueueInfo info{42, 3, 101};
    PlaylistContext ctx = PlaylistContext::play_queue(episodes_, 0, true, info);

    ctx.update_current_index("s1e3");
    ASSERT_TRUE(ctx.remote_queue().has_value());
    EXPECT_EQ(ctx.remote_queue()->item_id, 103);
    EXPECT_EQ(ctx.remote_queue()->queue_id, 42);
}

TEST_F(PlaylistContextTest, AutoPlayFollowsFlag) {
    EXPECT_TRUE(PlaylistContext::series("Show", episodes_, 0, true).is_auto_play_enabled());
    EXPECT_FALSE(PlaylistContext::play_queue(episodes_, 0, false).is_auto_play_enabled());
}

TEST(WindowSizeTest, ScalesDownToMaxWidthAndAddsControls) {
    Dimensions size = compute_window_size(Dimensions{3840, 2160}, 1920, 100);
    EXPECT_EQ(size.width, 1920);
    EXPECT_EQ(size.height, 1080 + 100);

    Dimensions small = compute_window_size(Dimensions{640, 480}, 1920, 100);
    EXPECT_EQ(small.width, 640);
    EXPECT_EQ(small.height, 580);

    EXPECT_FALSE(compute_window_size(Dimensions{0, 0}, 1920, 100).is_valid());
}

} // namespace Encore::test
