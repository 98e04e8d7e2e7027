#include "timeline_sync.hpp"
#include <libsoup/soup.h>
#include <glib.h>

namespace Encore {

namespace {

constexpr const char* kLibraryIdentifier = "com.plexapp.plugins.library";
constexpr const char* kClientIdentifier = "encore";

} // namespace

std::string encode_query(const QueryParams& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) query += "&";
        g_autofree gchar *k = g_uri_escape_string(key.c_str(), nullptr, TRUE);
        g_autofree gchar *v = g_uri_escape_string(value.c_str(), nullptr, TRUE);
        query += k;
        query += "=";
        query += v;
    }
    return query;
}

TimelineSync::TimelineSync(const std::string& server_url, const std::string& token,
                           double watched_ratio)
    : server_url_(server_url)
    , token_(token)
    , watched_ratio_(watched_ratio) {
    while (!server_url_.empty() && server_url_.back() == '/') {
        server_url_.pop_back();
    }
}

QueryParams TimelineSync::timeline_params(const MediaItemId& id, int64_t position_ms,
                                          int64_t duration_ms, const std::string& state_tag) {
    return {
        {"ratingKey", id},
        {"key", "/library/metadata/" + id},
        {"identifier", kLibraryIdentifier},
        {"state", state_tag},
        {"time", std::to_string(position_ms)},
        {"duration", std::to_string(duration_ms)},
        {"playbackTime", std::to_string(position_ms)},
    };
}

QueryParams TimelineSync::queue_timeline_params(const RemoteQueueInfo& queue, const MediaItemId& id,
                                                int64_t position_ms, int64_t duration_ms,
                                                const std::string& state_tag) {
    QueryParams params = timeline_params(id, position_ms, duration_ms, state_tag);
    params.insert(params.begin() + 2, {
        {"playQueueID", std::to_string(queue.queue_id)},
        {"playQueueVersion", std::to_string(queue.version)},
        {"playQueueItemID", std::to_string(queue.item_id)},
    });
    return params;
}

QueryParams TimelineSync::scrobble_params(const MediaItemId& id) {
    return {
        {"key", id},
        {"identifier", kLibraryIdentifier},
    };
}

std::string TimelineSync::build_url(const std::string& path, const QueryParams& params) const {
    return server_url_ + path + "?" + encode_query(params);
}

void TimelineSync::sync_progress(const PlaylistContext& context, const MediaItemId& id,
                                 int64_t position_ms, int64_t duration_ms,
                                 const std::string& state_tag, DoneCallback callback) {
    std::optional<RemoteQueueInfo> queue = context.remote_queue();
    if (!queue) {
        callback(false, "No remote play queue");
        return;
    }

    if (duration_ms > 0 &&
        static_cast<double>(position_ms) / static_cast<double>(duration_ms) > watched_ratio_) {
        g_debug("[Timeline] %s watched, scrobbling", id.c_str());
        make_request(build_url("/:/scrobble", scrobble_params(id)), token_,
            [callback](int, const std::string& error) {
                callback(error.empty(), error);
            });
        return;
    }

    std::string plain_url = build_url("/:/timeline", timeline_params(id, position_ms, duration_ms, state_tag));

    g_debug("[Timeline] Queue %lld item %lld at %lld ms (%s)",
            static_cast<long long>(queue->queue_id), static_cast<long long>(queue->item_id),
            static_cast<long long>(position_ms), state_tag.c_str());

    std::string queue_url = build_url("/:/timeline",
        queue_timeline_params(*queue, id, position_ms, duration_ms, state_tag));
    std::string token = token_;
    make_request(queue_url, token, [plain_url, token, callback](int status, const std::string& error) {
        if (error.empty()) {
            callback(true, "");
            return;
        }

        g_warning("[Timeline] Queue update failed (%d), sending plain update", status);
        make_request(plain_url, token, [callback](int, const std::string& error) {
            callback(error.empty(), error);
        });
    });
}

void TimelineSync::make_request(const std::string& url, const std::string& token,
                                ResponseCallback callback) {
    SoupMessage *msg = soup_message_new("GET", url.c_str());
    if (!msg) {
        g_warning("[Timeline] Failed to create HTTP request for %s", url.c_str());
        callback(0, "Failed to create HTTP request");
        return;
    }

    SoupMessageHeaders *headers = soup_message_get_request_headers(msg);
    soup_message_headers_append(headers, "Accept", "application/json");
    soup_message_headers_append(headers, "X-Plex-Client-Identifier", kClientIdentifier);
    soup_message_headers_append(headers, "X-Plex-Product", "Encore");
    if (!token.empty()) {
        soup_message_headers_append(headers, "X-Plex-Token", token.c_str());
    }

    SoupSession *session = soup_session_new();

    struct RequestData {
        ResponseCallback callback;
        SoupSession *session;
        SoupMessage *msg;
    };

    RequestData *data = new RequestData{callback, session, msg};

    soup_session_send_and_read_async(session, msg, G_PRIORITY_DEFAULT, nullptr,
        [](GObject *source, GAsyncResult *result, gpointer user_data) {
            RequestData *data = static_cast<RequestData*>(user_data);

            g_autoptr(GError) error = nullptr;
            GBytes *bytes = soup_session_send_and_read_finish(SOUP_SESSION(source), result, &error);

            if (error) {
                data->callback(0, error->message);
            } else {
                guint status = soup_message_get_status(data->msg);
                if (status >= 200 && status < 300) {
                    data->callback(static_cast<int>(status), "");
                } else {
                    data->callback(static_cast<int>(status), "HTTP " + std::to_string(status));
                }
                g_bytes_unref(bytes);
            }

            g_object_unref(data->session);
            g_object_unref(data->msg);
            delete data;
        }, data);
}

} // namespace Encore
