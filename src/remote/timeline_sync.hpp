#pragma once

#include "../session/playback_services.hpp"
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Encore {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

/**
 * Build "a=1&b=two" with every key and value URI-escaped
 */
std::string encode_query(const QueryParams& params);

/**
 * RemoteProgressSync against a media server timeline API
 *
 * Only contexts backed by a server play queue are synced. Queue items are
 * reported through GET /:/timeline with the play queue ids; if that fails, a
 * plain timeline update is sent instead. Watched items are scrobbled through
 * GET /:/scrobble.
 */
class TimelineSync : public RemoteProgressSync {
public:
    using ResponseCallback = std::function<void(int status, const std::string& error)>;

    TimelineSync(const std::string& server_url, const std::string& token, double watched_ratio);

    void sync_progress(const PlaylistContext& context, const MediaItemId& id,
                       int64_t position_ms, int64_t duration_ms,
                       const std::string& state_tag, DoneCallback callback) override;

    void set_watched_ratio(double ratio) { watched_ratio_ = ratio; }

    // Query builders
    static QueryParams timeline_params(const MediaItemId& id, int64_t position_ms,
                                       int64_t duration_ms, const std::string& state_tag);
    static QueryParams queue_timeline_params(const RemoteQueueInfo& queue, const MediaItemId& id,
                                             int64_t position_ms, int64_t duration_ms,
                                             const std::string& state_tag);
    static QueryParams scrobble_params(const MediaItemId& id);

    std::string build_url(const std::string& path, const QueryParams& params) const;

private:
    std::string server_url_;
    std::string token_;
    double watched_ratio_;

    // Static; completions can run after this object is destroyed
    static void make_request(const std::string& url, const std::string& token,
                             ResponseCallback callback);
};

} // namespace Encore
