#pragma once

#include "playback/playback_state.h"
#include "receiver/receiver_observer.h"

#include <functional>
#include <mutex>

namespace speaker_remote {
namespace receiver {

/**
 * @brief Folds the three receiver callbacks into one playback signal.
 *
 * Every callback updates the tracked status and re-derives:
 *   Inactive  no session (not CONNECTED, or no cast session id)
 *   Playing   session active and player state PLAYING
 *   Stopped   otherwise
 * The derived state is emitted on every callback; de-duplication is the
 * state machine's job. A snapshot replaces all three at once and emits a
 * single signal.
 */
class ReceiverStatusAdapter : public ReceiverObserver {
   public:
    using SignalSink = std::function<void(playback::PlaybackState)>;

    explicit ReceiverStatusAdapter(SignalSink sink);

    void onMediaStatus(const MediaStatus& status) override;
    void onCastStatus(const CastStatus& status) override;
    void onConnectionStatus(const ConnectionStatus& status) override;
    void onSnapshot(const ReceiverSnapshot& snapshot) override;

    // Derived state from the status tracked so far
    playback::PlaybackState derivedState() const;

   private:
    playback::PlaybackState deriveLocked() const;
    void emit(playback::PlaybackState state);

    SignalSink sink_;

    mutable std::mutex mutex_;
    MediaStatus media_;
    CastStatus cast_;
    ConnectionStatus connection_;
};

}  // namespace receiver
}  // namespace speaker_remote
