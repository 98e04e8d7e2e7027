#include <gtest/gtest.h>
#include "config.hpp"
#include <glib.h>
#include <glib/gstdio.h>

namespace Encore::test {

class ConfigStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        g_autoptr(GError) error = nullptr;
        g_autofree gchar *dir = g_dir_make_tmp("encore-config-XXXXXX", &error);
        ASSERT_NE(dir, nullptr) << (error ? error->message : "");
        dir_ = dir;
        path_ = dir_ + "/config.json";
    }

    void TearDown() override {
        g_remove(path_.c_str());
        g_rmdir(dir_.c_str());
    }

    std::string dir_;
    std::string path_;
};

TEST_F(ConfigStoreTest, MissingFileGivesDefaults) {
    ConfigStore store(path_);
    store.load();

    const PlaybackConfig& config = store.get_config();
    EXPECT_TRUE(config.auto_resume);
    EXPECT_EQ(config.resume_threshold_ms, 5000);
    EXPECT_EQ(config.progress_interval_ms, 10000);
    EXPECT_DOUBLE_EQ(config.watched_ratio, 0.9);
    EXPECT_DOUBLE_EQ(config.resume_ceiling, 0.95);
    EXPECT_EQ(config.max_retry_attempts, 3);
    EXPECT_EQ(config.controls_timeout_ms, 3000);
    EXPECT_EQ(config.critical_buffer_percent, 15);
    EXPECT_EQ(config.buffer_stall_threshold_ms, 10000);
    EXPECT_DOUBLE_EQ(config.download_safety_margin, 1.2);
    EXPECT_EQ(config.version, 1u);
}

TEST_F(ConfigStoreTest, SaveAndReload) {
    {
        ConfigStore store(path_);
        store.load();
        PlaybackConfig config = store.get_config();
        config.auto_skip_intro = true;
        config.max_window_width = 1280;
        config.user_id = "alice";
        config.watched_ratio = 0.85;
        config.buffer_stall_threshold_ms = 15000;
        store.set_config(config);
        ASSERT_TRUE(store.save());
    }

    ConfigStore reloaded(path_);
    reloaded.load();
    EXPECT_TRUE(reloaded.get_config().auto_skip_intro);
    EXPECT_EQ(reloaded.get_config().max_window_width, 1280);
    EXPECT_EQ(reloaded.get_config().user_id, "alice");
    EXPECT_DOUBLE_EQ(reloaded.get_config().watched_ratio, 0.85);
    EXPECT_EQ(reloaded.get_config().buffer_stall_threshold_ms, 15000);
}

TEST_F(ConfigStoreTest, PartialFileKeepsOtherDefaults) {
    g_file_set_contents(path_.c_str(), R"({"max_retry_attempts": 5})", -1, nullptr);
    ConfigStore store(path_);
    store.load();
    EXPECT_EQ(store.get_config().max_retry_attempts, 5);
    EXPECT_EQ(store.get_config().resume_threshold_ms, 5000);
}

TEST_F(ConfigStoreTest, MalformedFileGivesDefaults) {
    g_file_set_contents(path_.c_str(), "[1, 2", -1, nullptr);
    ConfigStore store(path_);
    store.load();
    EXPECT_EQ(store.get_config().max_retry_attempts, 3);
}

TEST_F(ConfigStoreTest, SetConfigBumpsVersionAndNotifies) {
    ConfigStore store(path_);
    store.load();

    std::vector<uint64_t> versions;
    store.on_config_changed([&versions](const PlaybackConfig& config) {
        versions.push_back(config.version);
    });

    PlaybackConfig config = store.get_config();
    config.version = 0;
    store.set_config(config);
    store.set_config(config);

    ASSERT_EQ(versions.size(), 2u);
    EXPECT_EQ(versions[0], 2u);
    EXPECT_EQ(versions[1], 3u);
}

TEST_F(ConfigStoreTest, ReloadBumpsVersion) {
    ConfigStore store(path_);
    store.load();
    uint64_t first = store.get_config().version;
    store.load();
    EXPECT_GT(store.get_config().version, first);
}

} // namespace Encore::test
