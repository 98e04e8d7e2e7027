#pragma once

#include "session/playback_services.hpp"
#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Encore {

/**
 * Saved state of one media item for one user
 */
struct LibraryEntry {
    MediaItemId media_id;         // Local path or URI
    std::string user;

    int64_t position_ms = 0;
    int64_t duration_ms = 0;
    bool watched = false;
    int64_t last_watched = 0;     // Unix timestamp

    bool markers_fetched = false; // Stored markers are authoritative once set
    MarkerPair markers;

    /**
     * Formatted progress (e.g. "1:23:45 / 2:00:00")
     */
    std::string get_progress_string() const;
};

/**
 * PlaybackServices for local files
 *
 * Progress and markers are kept in $XDG_DATA_HOME/encore/progress.json,
 * newest first and capped at 500 entries. Markers for a file come from an
 * optional "<file>.markers.json" beside it. Results are delivered from the
 * main loop, never from inside the call.
 */
class LocalLibrary : public PlaybackServices {
public:
    static constexpr size_t kMaxEntries = 500;

    LocalLibrary();
    explicit LocalLibrary(const std::string& storage_path);
    ~LocalLibrary() override;

    /**
     * Load entries from disk
     */
    void load();

    /**
     * Save entries to disk
     */
    bool save();

    /**
     * User that save_progress() writes for
     */
    void set_user(const std::string& user) { user_ = user; }
    const std::string& get_user() const { return user_; }

    std::optional<LibraryEntry> get_entry(const MediaItemId& id, const std::string& user) const;
    const std::vector<LibraryEntry>& get_entries() const { return entries_; }

    void resolve_stream(const MediaItemId& id, ResultCallback<std::string> callback) override;
    void load_progress(const MediaItemId& id, const std::string& user,
                       ResultCallback<PlaybackProgress> callback) override;
    void save_progress(const MediaItemId& id, int64_t position_ms, int64_t duration_ms,
                       bool watched, DoneCallback callback) override;
    void lookup_markers(const MediaItemId& id, ResultCallback<MarkerPair> callback) override;
    void fetch_markers(const MediaItemId& id, ResultCallback<MarkerPair> callback) override;
    void store_markers(const MediaItemId& id, const MarkerPair& markers,
                       DoneCallback callback) override;

    /**
     * Marker sidecar path for a local media path
     */
    static std::string markers_path_for(const std::string& media_path);

private:
    std::vector<LibraryEntry> entries_;
    std::map<MediaItemId, std::string> resolved_urls_;
    std::string storage_path_;
    std::string user_ = "default";

    static std::string get_storage_path();

    // Find entry index, returns -1 if not found
    int find_entry_index(const MediaItemId& id, const std::string& user) const;
    LibraryEntry& entry_for_update(const MediaItemId& id);
};

} // namespace Encore
