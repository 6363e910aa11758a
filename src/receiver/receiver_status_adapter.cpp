#include "receiver/receiver_status_adapter.h"

#include "logging/logger.h"

#include <utility>

namespace speaker_remote {
namespace receiver {

using playback::PlaybackState;

ReceiverStatusAdapter::ReceiverStatusAdapter(SignalSink sink) : sink_(std::move(sink)) {}

void ReceiverStatusAdapter::onMediaStatus(const MediaStatus& status) {
    LOG_DEBUG("Media status: player_state={}", status.playerState);
    // Emit under the lock so concurrent callbacks reach the sink in update order
    std::lock_guard<std::mutex> lock(mutex_);
    media_ = status;
    emit(deriveLocked());
}

void ReceiverStatusAdapter::onCastStatus(const CastStatus& status) {
    LOG_DEBUG("Cast status: app_id={} session_id={}", status.appId, status.sessionId);
    std::lock_guard<std::mutex> lock(mutex_);
    cast_ = status;
    emit(deriveLocked());
}

void ReceiverStatusAdapter::onConnectionStatus(const ConnectionStatus& status) {
    LOG_DEBUG("Connection status: {}", status.status);
    std::lock_guard<std::mutex> lock(mutex_);
    connection_ = status;
    emit(deriveLocked());
}

void ReceiverStatusAdapter::onSnapshot(const ReceiverSnapshot& snapshot) {
    LOG_DEBUG("Status snapshot: connection={} session_id={} player_state={}",
              snapshot.connection.status, snapshot.cast.sessionId, snapshot.media.playerState);
    std::lock_guard<std::mutex> lock(mutex_);
    connection_ = snapshot.connection;
    cast_ = snapshot.cast;
    media_ = snapshot.media;
    emit(deriveLocked());
}

PlaybackState ReceiverStatusAdapter::derivedState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deriveLocked();
}

PlaybackState ReceiverStatusAdapter::deriveLocked() const {
    bool sessionActive = connection_.status == kConnectionConnected && !cast_.sessionId.empty();
    if (!sessionActive) {
        return PlaybackState::Inactive;
    }
    if (media_.playerState == kPlayerStatePlaying) {
        return PlaybackState::Playing;
    }
    return PlaybackState::Stopped;
}

void ReceiverStatusAdapter::emit(PlaybackState state) {
    if (sink_) {
        sink_(state);
    }
}

}  // namespace receiver
}  // namespace speaker_remote
