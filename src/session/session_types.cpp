#include "session_types.hpp"
#include <algorithm>

namespace Encore {

// ============ PlaylistContext ============

PlaylistContext PlaylistContext::single_item() {
    return PlaylistContext();
}

PlaylistContext PlaylistContext::series(const std::string& title, std::vector<EpisodeRef> episodes,
                                        size_t current_index, bool auto_play,
                                        std::optional<RemoteQueueInfo> queue) {
    PlaylistContext ctx;
    ctx.kind_ = Kind::Series;
    ctx.title_ = title;
    ctx.episodes_ = std::move(episodes);
    ctx.current_index_ = current_index;
    ctx.auto_play_ = auto_play;
    ctx.queue_ = queue;
    return ctx;
}

PlaylistContext PlaylistContext::play_queue(std::vector<EpisodeRef> items, size_t current_index,
                                            bool auto_play, std::optional<RemoteQueueInfo> queue) {
    PlaylistContext ctx;
    ctx.kind_ = Kind::PlayQueue;
    ctx.episodes_ = std::move(items);
    ctx.current_index_ = current_index;
    ctx.auto_play_ = auto_play;
    ctx.queue_ = queue;
    return ctx;
}

bool PlaylistContext::has_previous() const {
    return kind_ != Kind::SingleItem && current_index_ > 0 && current_index_ < episodes_.size();
}

bool PlaylistContext::has_next() const {
    return kind_ != Kind::SingleItem && current_index_ + 1 < episodes_.size();
}

std::optional<MediaItemId> PlaylistContext::get_previous() const {
    if (!has_previous()) return std::nullopt;
    return episodes_[current_index_ - 1].id;
}

std::optional<MediaItemId> PlaylistContext::get_next() const {
    if (!has_next()) return std::nullopt;
    return episodes_[current_index_ + 1].id;
}

bool PlaylistContext::is_auto_play_enabled() const {
    return kind_ != Kind::SingleItem && auto_play_;
}

bool PlaylistContext::update_current_index(const MediaItemId& id) {
    auto it = std::find_if(episodes_.begin(), episodes_.end(),
        [&id](const EpisodeRef& ep) { return ep.id == id; });
    if (it == episodes_.end()) return false;

    current_index_ = static_cast<size_t>(it - episodes_.begin());
    if (queue_ && it->queue_item_id) {
        queue_->item_id = *it->queue_item_id;
    }
    return true;
}

const EpisodeRef* PlaylistContext::current() const {
    if (kind_ == Kind::SingleItem || current_index_ >= episodes_.size()) return nullptr;
    return &episodes_[current_index_];
}

std::string PlaylistContext::position_label() const {
    const EpisodeRef *ep = current();
    if (!ep) return "";

    std::string position = std::to_string(current_index_ + 1) + " of " +
                           std::to_string(episodes_.size());
    if (kind_ == Kind::Series) {
        return title_ + " - S" + std::to_string(ep->season) + "E" + std::to_string(ep->episode) +
               " - Episode " + position;
    }
    return ep->title + " - Item " + position;
}

// ============ Progress ============

double PlaybackProgress::percent_complete() const {
    if (duration_ms <= 0) return 0.0;
    return std::min(1.0, static_cast<double>(position_ms) / static_cast<double>(duration_ms));
}

Dimensions compute_window_size(const Dimensions& video, int max_width, int controls_height) {
    if (!video.is_valid()) return Dimensions{};

    int width = std::min(video.width, max_width);
    double aspect = static_cast<double>(video.height) / static_cast<double>(video.width);
    int height = static_cast<int>(width * aspect) + controls_height;
    return Dimensions{width, height};
}

} // namespace Encore
