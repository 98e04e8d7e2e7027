#include "local_library.hpp"
#include "scheduler.hpp"
#include <json-glib/json-glib.h>
#include <glib.h>
#include <cstdio>

namespace Encore {

// Helper function to format time
static std::string format_time(int64_t ms) {
    if (ms < 0) ms = 0;
    int64_t seconds = ms / 1000;
    int h = static_cast<int>(seconds / 3600);
    int m = static_cast<int>((seconds % 3600) / 60);
    int s = static_cast<int>(seconds % 60);

    char buf[32];
    if (h > 0) {
        snprintf(buf, sizeof(buf), "%d:%02d:%02d", h, m, s);
    } else {
        snprintf(buf, sizeof(buf), "%d:%02d", m, s);
    }
    return buf;
}

static std::optional<ChapterMarker> parse_marker(JsonObject *obj, const char *member, MarkerKind kind) {
    if (!json_object_has_member(obj, member)) return std::nullopt;

    JsonNode *node = json_object_get_member(obj, member);
    if (!node || !JSON_NODE_HOLDS_OBJECT(node)) return std::nullopt;

    JsonObject *marker_obj = json_node_get_object(node);
    if (!json_object_has_member(marker_obj, "start_ms") || !json_object_has_member(marker_obj, "end_ms"))
        return std::nullopt;

    ChapterMarker marker;
    marker.kind = kind;
    marker.start_ms = json_object_get_int_member(marker_obj, "start_ms");
    marker.end_ms = json_object_get_int_member(marker_obj, "end_ms");
    if (marker.end_ms <= marker.start_ms) return std::nullopt;
    return marker;
}

static void add_marker(JsonBuilder *builder, const char *member, const std::optional<ChapterMarker>& marker) {
    if (!marker) return;

    json_builder_set_member_name(builder, member);
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "start_ms");
    json_builder_add_int_value(builder, marker->start_ms);
    json_builder_set_member_name(builder, "end_ms");
    json_builder_add_int_value(builder, marker->end_ms);
    json_builder_end_object(builder);
}

// Local path for an id, empty for non-file URIs
static std::string local_path_for(const MediaItemId& id) {
    if (id.find("://") == std::string::npos) {
        g_autofree gchar *path = g_canonicalize_filename(id.c_str(), nullptr);
        return path;
    }
    g_autofree gchar *path = g_filename_from_uri(id.c_str(), nullptr, nullptr);
    return path ? path : "";
}

std::string LibraryEntry::get_progress_string() const {
    return format_time(position_ms) + " / " + format_time(duration_ms);
}

LocalLibrary::LocalLibrary() : storage_path_(get_storage_path()) {
}

LocalLibrary::LocalLibrary(const std::string& storage_path) : storage_path_(storage_path) {
}

LocalLibrary::~LocalLibrary() {
    // Save on destruction
    save();
}

std::string LocalLibrary::get_storage_path() {
    const char *data_dir = g_get_user_data_dir();
    std::string app_dir = std::string(data_dir) + "/encore";
    g_mkdir_with_parents(app_dir.c_str(), 0755);
    return app_dir + "/progress.json";
}

std::string LocalLibrary::markers_path_for(const std::string& media_path) {
    return media_path + ".markers.json";
}

void LocalLibrary::load() {
    entries_.clear();

    if (!g_file_test(storage_path_.c_str(), G_FILE_TEST_EXISTS)) {
        return;
    }

    g_autoptr(GError) error = nullptr;
    g_autoptr(JsonParser) parser = json_parser_new();

    if (!json_parser_load_from_file(parser, storage_path_.c_str(), &error)) {
        g_warning("Failed to load progress: %s", error->message);
        return;
    }

    JsonNode *root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_ARRAY(root)) {
        g_warning("Invalid progress file format");
        return;
    }

    JsonArray *array = json_node_get_array(root);
    guint length = json_array_get_length(array);

    for (guint i = 0; i < length; i++) {
        JsonNode *node = json_array_get_element(array, i);
        if (!JSON_NODE_HOLDS_OBJECT(node)) continue;

        JsonObject *obj = json_node_get_object(node);

        LibraryEntry entry;

        if (json_object_has_member(obj, "media_id"))
            entry.media_id = json_object_get_string_member(obj, "media_id");
        if (json_object_has_member(obj, "user"))
            entry.user = json_object_get_string_member(obj, "user");
        if (json_object_has_member(obj, "position_ms"))
            entry.position_ms = json_object_get_int_member(obj, "position_ms");
        if (json_object_has_member(obj, "duration_ms"))
            entry.duration_ms = json_object_get_int_member(obj, "duration_ms");
        if (json_object_has_member(obj, "watched"))
            entry.watched = json_object_get_boolean_member(obj, "watched");
        if (json_object_has_member(obj, "last_watched"))
            entry.last_watched = json_object_get_int_member(obj, "last_watched");
        if (json_object_has_member(obj, "markers_fetched"))
            entry.markers_fetched = json_object_get_boolean_member(obj, "markers_fetched");

        entry.markers.intro = parse_marker(obj, "intro", MarkerKind::Intro);
        entry.markers.credits = parse_marker(obj, "credits", MarkerKind::Credits);

        // Only add valid entries
        if (!entry.media_id.empty() && entries_.size() < kMaxEntries) {
            entries_.push_back(entry);
        }
    }
}

bool LocalLibrary::save() {
    g_autoptr(JsonBuilder) builder = json_builder_new();

    json_builder_begin_array(builder);

    for (const auto& entry : entries_) {
        json_builder_begin_object(builder);

        json_builder_set_member_name(builder, "media_id");
        json_builder_add_string_value(builder, entry.media_id.c_str());

        json_builder_set_member_name(builder, "user");
        json_builder_add_string_value(builder, entry.user.c_str());

        json_builder_set_member_name(builder, "position_ms");
        json_builder_add_int_value(builder, entry.position_ms);

        json_builder_set_member_name(builder, "duration_ms");
        json_builder_add_int_value(builder, entry.duration_ms);

        json_builder_set_member_name(builder, "watched");
        json_builder_add_boolean_value(builder, entry.watched);

        json_builder_set_member_name(builder, "last_watched");
        json_builder_add_int_value(builder, entry.last_watched);

        json_builder_set_member_name(builder, "markers_fetched");
        json_builder_add_boolean_value(builder, entry.markers_fetched);

        add_marker(builder, "intro", entry.markers.intro);
        add_marker(builder, "credits", entry.markers.credits);

        json_builder_end_object(builder);
    }

    json_builder_end_array(builder);

    g_autoptr(JsonGenerator) generator = json_generator_new();
    json_generator_set_pretty(generator, TRUE);

    JsonNode *root = json_builder_get_root(builder);
    json_generator_set_root(generator, root);

    g_autoptr(GError) error = nullptr;
    bool ok = json_generator_to_file(generator, storage_path_.c_str(), &error);
    if (!ok) {
        g_warning("Failed to save progress: %s", error->message);
    }

    json_node_unref(root);
    return ok;
}

int LocalLibrary::find_entry_index(const MediaItemId& id, const std::string& user) const {
    for (size_t i = 0; i < entries_.size(); i++) {
        if (entries_[i].media_id == id && entries_[i].user == user) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

LibraryEntry& LocalLibrary::entry_for_update(const MediaItemId& id) {
    int idx = find_entry_index(id, user_);

    LibraryEntry entry;
    if (idx >= 0) {
        entry = entries_[idx];
        entries_.erase(entries_.begin() + idx);
    } else {
        entry.media_id = id;
        entry.user = user_;
    }
    entry.last_watched = std::time(nullptr);

    // Most recent first
    entries_.insert(entries_.begin(), entry);
    if (entries_.size() > kMaxEntries) {
        entries_.resize(kMaxEntries);
    }
    return entries_.front();
}

std::optional<LibraryEntry> LocalLibrary::get_entry(const MediaItemId& id,
                                                    const std::string& user) const {
    int idx = find_entry_index(id, user);
    if (idx >= 0) {
        return entries_[idx];
    }
    return std::nullopt;
}

// ============ PlaybackServices ============

void LocalLibrary::resolve_stream(const MediaItemId& id, ResultCallback<std::string> callback) {
    auto cached = resolved_urls_.find(id);
    if (cached != resolved_urls_.end()) {
        std::string url = cached->second;
        run_on_main_loop([callback, url]() { callback(url, ""); });
        return;
    }

    std::string url;
    if (id.find("://") != std::string::npos) {
        url = id;
    } else {
        std::string path = local_path_for(id);
        if (!g_file_test(path.c_str(), G_FILE_TEST_IS_REGULAR)) {
            std::string error = "File not found: " + path;
            run_on_main_loop([callback, error]() { callback(std::nullopt, error); });
            return;
        }

        g_autoptr(GError) error = nullptr;
        g_autofree gchar *uri = g_filename_to_uri(path.c_str(), nullptr, &error);
        if (!uri) {
            std::string message = error->message;
            run_on_main_loop([callback, message]() { callback(std::nullopt, message); });
            return;
        }
        url = uri;
    }

    resolved_urls_[id] = url;
    run_on_main_loop([callback, url]() { callback(url, ""); });
}

void LocalLibrary::load_progress(const MediaItemId& id, const std::string& user,
                                 ResultCallback<PlaybackProgress> callback) {
    std::optional<PlaybackProgress> progress;
    if (auto entry = get_entry(id, user)) {
        PlaybackProgress p;
        p.position_ms = entry->position_ms;
        p.duration_ms = entry->duration_ms;
        p.watched = entry->watched;
        progress = p;
    }
    run_on_main_loop([callback, progress]() { callback(progress, ""); });
}

void LocalLibrary::save_progress(const MediaItemId& id, int64_t position_ms, int64_t duration_ms,
                                 bool watched, DoneCallback callback) {
    if (duration_ms <= 0) {
        run_on_main_loop([callback]() { callback(false, "Unknown duration"); });
        return;
    }

    LibraryEntry& entry = entry_for_update(id);
    entry.position_ms = position_ms;
    entry.duration_ms = duration_ms;
    entry.watched = watched;
    g_debug("Progress for %s: %s", id.c_str(), entry.get_progress_string().c_str());

    bool ok = save();
    run_on_main_loop([callback, ok]() {
        callback(ok, ok ? "" : "Failed to write progress file");
    });
}

void LocalLibrary::lookup_markers(const MediaItemId& id, ResultCallback<MarkerPair> callback) {
    std::optional<MarkerPair> markers;
    int idx = find_entry_index(id, user_);
    if (idx >= 0 && entries_[idx].markers_fetched) {
        markers = entries_[idx].markers;
    }
    run_on_main_loop([callback, markers]() { callback(markers, ""); });
}

void LocalLibrary::fetch_markers(const MediaItemId& id, ResultCallback<MarkerPair> callback) {
    std::string path = local_path_for(id);
    std::string sidecar = markers_path_for(path);

    if (path.empty() || !g_file_test(sidecar.c_str(), G_FILE_TEST_EXISTS)) {
        // Nothing to fetch; an empty pair still counts as fetched
        run_on_main_loop([callback]() { callback(MarkerPair{}, ""); });
        return;
    }

    g_autoptr(GError) error = nullptr;
    g_autoptr(JsonParser) parser = json_parser_new();

    if (!json_parser_load_from_file(parser, sidecar.c_str(), &error)) {
        std::string message = std::string("Failed to read markers: ") + error->message;
        run_on_main_loop([callback, message]() { callback(std::nullopt, message); });
        return;
    }

    JsonNode *root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        run_on_main_loop([callback]() { callback(std::nullopt, "Invalid markers format"); });
        return;
    }

    JsonObject *obj = json_node_get_object(root);
    MarkerPair markers;
    markers.intro = parse_marker(obj, "intro", MarkerKind::Intro);
    markers.credits = parse_marker(obj, "credits", MarkerKind::Credits);
    run_on_main_loop([callback, markers]() { callback(markers, ""); });
}

void LocalLibrary::store_markers(const MediaItemId& id, const MarkerPair& markers,
                                 DoneCallback callback) {
    LibraryEntry& entry = entry_for_update(id);
    entry.markers = markers;
    entry.markers_fetched = true;

    bool ok = save();
    run_on_main_loop([callback, ok]() {
        callback(ok, ok ? "" : "Failed to write progress file");
    });
}

} // namespace Encore
