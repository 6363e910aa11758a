#pragma once

#include <optional>
#include <string>

namespace speaker_remote {
namespace receiver {

// Player state reported while the receiver is actually playing
constexpr const char* kPlayerStatePlaying = "PLAYING";
// Connection status while the receiver session is up
constexpr const char* kConnectionConnected = "CONNECTED";

struct MediaStatus {
    std::string playerState;  // PLAYING, PAUSED, BUFFERING, IDLE, UNKNOWN
    std::optional<int> mediaSessionId;
};

struct CastStatus {
    std::string appId;
    std::string sessionId;  // empty when no application session is running
};

struct ConnectionStatus {
    std::string status;  // CONNECTING, CONNECTED, DISCONNECTED, FAILED, LOST
};

// Complete receiver status as fetched in one request
struct ReceiverSnapshot {
    ConnectionStatus connection;
    CastStatus cast;
    MediaStatus media;
};

/**
 * @brief Sink for the receiver's asynchronous status pushes.
 *
 * Methods may be invoked from the subscription thread and from the thread
 * that replays the initial snapshot; implementations must be thread-safe.
 */
class ReceiverObserver {
   public:
    virtual ~ReceiverObserver() = default;

    virtual void onMediaStatus(const MediaStatus& status) = 0;
    virtual void onCastStatus(const CastStatus& status) = 0;
    virtual void onConnectionStatus(const ConnectionStatus& status) = 0;

    // Default replays connection, cast and media in that order
    virtual void onSnapshot(const ReceiverSnapshot& snapshot) {
        onConnectionStatus(snapshot.connection);
        onCastStatus(snapshot.cast);
        onMediaStatus(snapshot.media);
    }
};

}  // namespace receiver
}  // namespace speaker_remote
