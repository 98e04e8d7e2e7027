#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace Encore {

/**
 * Snapshot of the playback preferences.
 * `version` grows every time the store publishes a new snapshot.
 */
struct PlaybackConfig {
    uint64_t version = 0;

    // Resume and progress
    bool auto_resume = true;
    int64_t resume_threshold_ms = 5000;
    int64_t progress_interval_ms = 10000;
    double watched_ratio = 0.9;       // Progress counts as watched above this
    double resume_ceiling = 0.95;     // No resume at or above this

    // Auto-play
    double auto_play_ratio = 0.95;
    int64_t auto_play_next_delay_ms = 3000;
    int64_t auto_play_end_delay_ms = 5000;

    int max_retry_attempts = 3;

    // Buffering warnings
    int critical_buffer_percent = 15;
    int64_t buffer_stall_threshold_ms = 10000;
    double download_safety_margin = 1.2;  // Download must beat the bitrate by this factor

    // Skip markers
    bool auto_skip_intro = false;
    bool auto_skip_credits = false;
    int64_t minimum_marker_duration_ms = 5000;

    // Controls
    int64_t controls_timeout_ms = 3000;
    double pointer_move_threshold = 5.0;

    // Window
    int max_window_width = 1920;
    int controls_height_px = 100;

    std::string user_id = "default";
    bool hardware_decoding = true;

    // Remote progress sync; disabled while the URL is empty
    std::string remote_server_url;
    std::string remote_token;
};

/**
 * Loads, saves and publishes the playback configuration
 */
class ConfigStore {
public:
    using ConfigChangedCallback = std::function<void(const PlaybackConfig& config)>;

    /**
     * Defaults to $XDG_CONFIG_HOME/encore/config.json
     */
    ConfigStore();
    explicit ConfigStore(const std::string& storage_path);

    /**
     * Load configuration from storage; missing or malformed files give the defaults
     */
    void load();

    /**
     * Save configuration to storage
     */
    bool save();

    const PlaybackConfig& get_config() const { return config_; }

    /**
     * Replace the configuration, bump its version and notify subscribers
     */
    void set_config(const PlaybackConfig& config);

    void on_config_changed(ConfigChangedCallback callback);

    const std::string& storage_path() const { return storage_path_; }

private:
    PlaybackConfig config_;
    std::string storage_path_;
    std::vector<ConfigChangedCallback> change_callbacks_;

    static std::string default_storage_path();
};

} // namespace Encore
