#pragma once

#include "../config.hpp"
#include "session_types.hpp"
#include <cstdint>
#include <optional>

namespace Encore {

/**
 * Visibility of one skip affordance
 */
struct SkipWindow {
    std::optional<ChapterMarker> marker;
    bool visible = false;
    bool user_dismissed = false;  // Stays set for the rest of the playback

    /**
     * Pure function of position, marker and dismissal
     */
    bool is_visible_at(int64_t position_ms) const {
        return marker && !user_dismissed && marker->contains(position_ms);
    }
};

/**
 * Tracks the intro and credits windows of the current item
 */
class SkipMarkerManager {
public:
    explicit SkipMarkerManager(const PlaybackConfig& config);

    void update_config(const PlaybackConfig& config);

    void load_markers(const MarkerPair& markers);

    /**
     * Drop both windows; calling it again changes nothing
     */
    void clear_markers();

    /**
     * Recompute visibility for a new position.
     * Returns a seek target when a window is auto-skipped.
     */
    std::optional<int64_t> update(int64_t position_ms);

    /**
     * Seek target for a user skip (and dismiss), std::nullopt without a marker
     */
    std::optional<int64_t> skip_intro();
    std::optional<int64_t> skip_credits();

    bool is_intro_visible() const { return intro_.visible; }
    bool is_credits_visible() const { return credits_.visible; }

    const SkipWindow& intro() const { return intro_; }
    const SkipWindow& credits() const { return credits_; }

private:
    SkipWindow intro_;
    SkipWindow credits_;
    bool auto_skip_intro_;
    bool auto_skip_credits_;
    int64_t minimum_duration_ms_;

    std::optional<int64_t> update_window(SkipWindow& window, bool auto_skip, int64_t position_ms);
    static std::optional<int64_t> dismiss(SkipWindow& window);
};

} // namespace Encore
