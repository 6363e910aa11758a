#pragma once

namespace speaker_remote {
namespace playback {

/**
 * @brief Logical receiver state as seen by the speaker supervisor.
 *
 * Unknown is the pre-initialization sentinel. It never compares equal to a
 * real signal, so the first signal always counts as a change.
 */
enum class PlaybackState { Unknown, Playing, Stopped, Inactive };

inline const char* playbackStateToString(PlaybackState state) {
    switch (state) {
    case PlaybackState::Playing:
        return "PLAYING";
    case PlaybackState::Stopped:
        return "STOPPED";
    case PlaybackState::Inactive:
        return "INACTIVE";
    case PlaybackState::Unknown:
    default:
        return "UNKNOWN";
    }
}

}  // namespace playback
}  // namespace speaker_remote
