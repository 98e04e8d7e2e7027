#include <gtest/gtest.h>
#include "session/buffering_monitor.hpp"

namespace Encore::test {

using Kind = BufferingWarning::Kind;

static BufferingStatus waiting(int percentage, int64_t speed_bps = 0, int64_t bitrate_bps = 0) {
    BufferingStatus status;
    status.paused_for_cache = true;
    status.percentage = percentage;
    status.download_speed_bps = speed_bps;
    status.bitrate_bps = bitrate_bps;
    return status;
}

TEST(BufferingRulesTest, DownloadTooSlow) {
    EXPECT_TRUE(is_download_too_slow(1000, 1000, 1.2));
    EXPECT_FALSE(is_download_too_slow(1200, 1000, 1.2));
    EXPECT_FALSE(is_download_too_slow(0, 1000, 1.2));
    EXPECT_FALSE(is_download_too_slow(1000, 0, 1.2));
}

TEST(BufferingRulesTest, CriticallyLowBuffer) {
    EXPECT_TRUE(is_buffer_critically_low(14, 15));
    EXPECT_TRUE(is_buffer_critically_low(1, 15));
    EXPECT_FALSE(is_buffer_critically_low(15, 15));
    EXPECT_FALSE(is_buffer_critically_low(0, 15));
}

TEST(BufferingRulesTest, StalledOnlyBetweenEmptyAndFull) {
    EXPECT_TRUE(is_buffering_stalled(50, 50, 10000, 10000));
    EXPECT_FALSE(is_buffering_stalled(50, 50, 9999, 10000));
    EXPECT_FALSE(is_buffering_stalled(50, 49, 20000, 10000));
    EXPECT_FALSE(is_buffering_stalled(0, 0, 20000, 10000));
    EXPECT_FALSE(is_buffering_stalled(100, 100, 20000, 10000));
}

TEST(BufferingRulesTest, DetectsSlowDownloadBeforeLowBuffer) {
    PlaybackConfig config;
    // 0.5 Mbps download against a 1 Mbps stream
    std::vector<BufferingWarning> warnings = detect_warnings(waiting(8, 62500, 125000), config);

    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_EQ(warnings[0].kind, Kind::SlowDownload);
    EXPECT_EQ(warnings[0].message, "Download speed (0.5 Mbps) is slower than required (1.0 Mbps)");
    EXPECT_EQ(warnings[1].kind, Kind::CriticallyLowBuffer);
    EXPECT_EQ(warnings[1].message, "Buffer level critically low (8%)");
    EXPECT_EQ(warnings[1].severity, BufferingWarning::Severity::Critical);
}

TEST(BufferingRulesTest, LowBufferAboveTenPercentIsOnlyAWarning) {
    EXPECT_EQ(BufferingWarning::critically_low(12).severity, BufferingWarning::Severity::Warning);
    EXPECT_EQ(BufferingWarning::stalled().severity, BufferingWarning::Severity::Critical);
}

class BufferingMonitorTest : public ::testing::Test {
protected:
    PlaybackConfig config_;
    BufferingMonitor monitor_{config_};
};

TEST_F(BufferingMonitorTest, IgnoresSamplesWhilePlaying) {
    BufferingStatus playing;
    playing.percentage = 5;
    EXPECT_TRUE(monitor_.update(playing, 0).empty());
    EXPECT_FALSE(monitor_.is_buffering());
}

TEST_F(BufferingMonitorTest, StallNeedsUnchangedPercentageForThreshold) {
    EXPECT_TRUE(monitor_.update(waiting(40), 0).empty());
    EXPECT_TRUE(monitor_.is_buffering());
    EXPECT_TRUE(monitor_.update(waiting(40), 9000).empty());

    // Progress restarts the clock
    EXPECT_TRUE(monitor_.update(waiting(45), 9500).empty());
    EXPECT_TRUE(monitor_.update(waiting(45), 19000).empty());

    std::vector<BufferingWarning> warnings = monitor_.update(waiting(45), 19500);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].kind, Kind::BufferingStalled);
    EXPECT_EQ(warnings[0].message, "Buffering appears to be stalled");
}

TEST_F(BufferingMonitorTest, EachWarningOncePerEpisode) {
    ASSERT_EQ(monitor_.update(waiting(5), 0).size(), 1u);
    EXPECT_TRUE(monitor_.update(waiting(6), 1000).empty());

    BufferingStatus resumed;
    resumed.percentage = 100;
    EXPECT_TRUE(monitor_.update(resumed, 2000).empty());
    EXPECT_FALSE(monitor_.is_buffering());

    std::vector<BufferingWarning> again = monitor_.update(waiting(5), 3000);
    ASSERT_EQ(again.size(), 1u);
    EXPECT_EQ(again[0].kind, Kind::CriticallyLowBuffer);
}

TEST_F(BufferingMonitorTest, ConfigChangesThresholds) {
    config_.critical_buffer_percent = 50;
    monitor_.update_config(config_);

    std::vector<BufferingWarning> warnings = monitor_.update(waiting(30), 0);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].message, "Buffer level critically low (30%)");
}

} // namespace Encore::test
