#include "config.hpp"
#include <json-glib/json-glib.h>
#include <glib.h>
#include <cstring>

namespace Encore {

ConfigStore::ConfigStore() : storage_path_(default_storage_path()) {
}

ConfigStore::ConfigStore(const std::string& storage_path) : storage_path_(storage_path) {
}

std::string ConfigStore::default_storage_path() {
    const char *config_dir = g_get_user_config_dir();
    std::string app_dir = std::string(config_dir) + "/encore";
    g_mkdir_with_parents(app_dir.c_str(), 0755);
    return app_dir + "/config.json";
}

void ConfigStore::load() {
    uint64_t version = config_.version;
    config_ = PlaybackConfig{};
    config_.version = version + 1;

    if (!g_file_test(storage_path_.c_str(), G_FILE_TEST_EXISTS)) {
        g_info("No config at %s, using defaults", storage_path_.c_str());
        return;
    }

    g_autoptr(JsonParser) parser = json_parser_new();
    g_autoptr(GError) error = nullptr;

    if (!json_parser_load_from_file(parser, storage_path_.c_str(), &error)) {
        g_warning("Failed to load config: %s", error ? error->message : "unknown");
        return;
    }

    JsonNode *root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        g_warning("Invalid config format, using defaults");
        return;
    }

    JsonObject *obj = json_node_get_object(root);

    if (json_object_has_member(obj, "auto_resume"))
        config_.auto_resume = json_object_get_boolean_member(obj, "auto_resume");
    if (json_object_has_member(obj, "resume_threshold_ms"))
        config_.resume_threshold_ms = json_object_get_int_member(obj, "resume_threshold_ms");
    if (json_object_has_member(obj, "progress_interval_ms"))
        config_.progress_interval_ms = json_object_get_int_member(obj, "progress_interval_ms");
    if (json_object_has_member(obj, "watched_ratio"))
        config_.watched_ratio = json_object_get_double_member(obj, "watched_ratio");
    if (json_object_has_member(obj, "resume_ceiling"))
        config_.resume_ceiling = json_object_get_double_member(obj, "resume_ceiling");

    if (json_object_has_member(obj, "auto_play_ratio"))
        config_.auto_play_ratio = json_object_get_double_member(obj, "auto_play_ratio");
    if (json_object_has_member(obj, "auto_play_next_delay_ms"))
        config_.auto_play_next_delay_ms = json_object_get_int_member(obj, "auto_play_next_delay_ms");
    if (json_object_has_member(obj, "auto_play_end_delay_ms"))
        config_.auto_play_end_delay_ms = json_object_get_int_member(obj, "auto_play_end_delay_ms");

    if (json_object_has_member(obj, "max_retry_attempts"))
        config_.max_retry_attempts = static_cast<int>(json_object_get_int_member(obj, "max_retry_attempts"));

    if (json_object_has_member(obj, "critical_buffer_percent"))
        config_.critical_buffer_percent = static_cast<int>(json_object_get_int_member(obj, "critical_buffer_percent"));
    if (json_object_has_member(obj, "buffer_stall_threshold_ms"))
        config_.buffer_stall_threshold_ms = json_object_get_int_member(obj, "buffer_stall_threshold_ms");
    if (json_object_has_member(obj, "download_safety_margin"))
        config_.download_safety_margin = json_object_get_double_member(obj, "download_safety_margin");

    if (json_object_has_member(obj, "auto_skip_intro"))
        config_.auto_skip_intro = json_object_get_boolean_member(obj, "auto_skip_intro");
    if (json_object_has_member(obj, "auto_skip_credits"))
        config_.auto_skip_credits = json_object_get_boolean_member(obj, "auto_skip_credits");
    if (json_object_has_member(obj, "minimum_marker_duration_ms"))
        config_.minimum_marker_duration_ms = json_object_get_int_member(obj, "minimum_marker_duration_ms");

    if (json_object_has_member(obj, "controls_timeout_ms"))
        config_.controls_timeout_ms = json_object_get_int_member(obj, "controls_timeout_ms");
    if (json_object_has_member(obj, "pointer_move_threshold"))
        config_.pointer_move_threshold = json_object_get_double_member(obj, "pointer_move_threshold");

    if (json_object_has_member(obj, "max_window_width"))
        config_.max_window_width = static_cast<int>(json_object_get_int_member(obj, "max_window_width"));
    if (json_object_has_member(obj, "controls_height_px"))
        config_.controls_height_px = static_cast<int>(json_object_get_int_member(obj, "controls_height_px"));

    if (json_object_has_member(obj, "user_id")) {
        const char *s = json_object_get_string_member(obj, "user_id");
        if (s && strlen(s) > 0) config_.user_id = s;
    }
    if (json_object_has_member(obj, "hardware_decoding"))
        config_.hardware_decoding = json_object_get_boolean_member(obj, "hardware_decoding");

    if (json_object_has_member(obj, "remote_server_url")) {
        const char *s = json_object_get_string_member(obj, "remote_server_url");
        if (s) config_.remote_server_url = s;
    }
    if (json_object_has_member(obj, "remote_token")) {
        const char *s = json_object_get_string_member(obj, "remote_token");
        if (s) config_.remote_token = s;
    }
}

bool ConfigStore::save() {
    g_autoptr(JsonBuilder) builder = json_builder_new();

    json_builder_begin_object(builder);

    json_builder_set_member_name(builder, "auto_resume");
    json_builder_add_boolean_value(builder, config_.auto_resume);

    json_builder_set_member_name(builder, "resume_threshold_ms");
    json_builder_add_int_value(builder, config_.resume_threshold_ms);

    json_builder_set_member_name(builder, "progress_interval_ms");
    json_builder_add_int_value(builder, config_.progress_interval_ms);

    json_builder_set_member_name(builder, "watched_ratio");
    json_builder_add_double_value(builder, config_.watched_ratio);

    json_builder_set_member_name(builder, "resume_ceiling");
    json_builder_add_double_value(builder, config_.resume_ceiling);

    json_builder_set_member_name(builder, "auto_play_ratio");
    json_builder_add_double_value(builder, config_.auto_play_ratio);

    json_builder_set_member_name(builder, "auto_play_next_delay_ms");
    json_builder_add_int_value(builder, config_.auto_play_next_delay_ms);

    json_builder_set_member_name(builder, "auto_play_end_delay_ms");
    json_builder_add_int_value(builder, config_.auto_play_end_delay_ms);

    json_builder_set_member_name(builder, "max_retry_attempts");
    json_builder_add_int_value(builder, config_.max_retry_attempts);

    json_builder_set_member_name(builder, "critical_buffer_percent");
    json_builder_add_int_value(builder, config_.critical_buffer_percent);

    json_builder_set_member_name(builder, "buffer_stall_threshold_ms");
    json_builder_add_int_value(builder, config_.buffer_stall_threshold_ms);

    json_builder_set_member_name(builder, "download_safety_margin");
    json_builder_add_double_value(builder, config_.download_safety_margin);

    json_builder_set_member_name(builder, "auto_skip_intro");
    json_builder_add_boolean_value(builder, config_.auto_skip_intro);

    json_builder_set_member_name(builder, "auto_skip_credits");
    json_builder_add_boolean_value(builder, config_.auto_skip_credits);

    json_builder_set_member_name(builder, "minimum_marker_duration_ms");
    json_builder_add_int_value(builder, config_.minimum_marker_duration_ms);

    json_builder_set_member_name(builder, "controls_timeout_ms");
    json_builder_add_int_value(builder, config_.controls_timeout_ms);

    json_builder_set_member_name(builder, "pointer_move_threshold");
    json_builder_add_double_value(builder, config_.pointer_move_threshold);

    json_builder_set_member_name(builder, "max_window_width");
    json_builder_add_int_value(builder, config_.max_window_width);

    json_builder_set_member_name(builder, "controls_height_px");
    json_builder_add_int_value(builder, config_.controls_height_px);

    json_builder_set_member_name(builder, "user_id");
    json_builder_add_string_value(builder, config_.user_id.c_str());

    json_builder_set_member_name(builder, "hardware_decoding");
    json_builder_add_boolean_value(builder, config_.hardware_decoding);

    json_builder_set_member_name(builder, "remote_server_url");
    json_builder_add_string_value(builder, config_.remote_server_url.c_str());

    json_builder_set_member_name(builder, "remote_token");
    json_builder_add_string_value(builder, config_.remote_token.c_str());

    json_builder_end_object(builder);

    g_autoptr(JsonGenerator) generator = json_generator_new();
    json_generator_set_pretty(generator, TRUE);

    JsonNode *root = json_builder_get_root(builder);
    json_generator_set_root(generator, root);

    g_autoptr(GError) error = nullptr;
    bool ok = json_generator_to_file(generator, storage_path_.c_str(), &error);
    if (!ok) {
        g_warning("Failed to save config: %s", error->message);
    }

    json_node_unref(root);
    return ok;
}

void ConfigStore::set_config(const PlaybackConfig& config) {
    uint64_t version = config_.version;
    config_ = config;
    config_.version = version + 1;

    for (const auto& callback : change_callbacks_) {
        callback(config_);
    }
}

void ConfigStore::on_config_changed(ConfigChangedCallback callback) {
    change_callbacks_.push_back(callback);
}

} // namespace Encore
