#pragma once

#include "playback/playback_state.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace speaker_remote {
namespace playback {

/**
 * @brief Debounces receiver signals into speaker power commands.
 *
 * Producers call signal() from any thread. A single supervisory worker wakes
 * every poll interval, or immediately after a state change, and:
 *  - Playing: switches the speakers on (repeated every poll as keep-alive)
 *  - Inactive: switches them off
 *  - Stopped / Unknown: switches them off once the grace period has passed
 *    since the last change
 *
 * State, change timestamp and wake flag share one mutex. Signals are
 * last-write-wins: a state that is replaced before the worker runs is never
 * acted upon.
 */
class PlaybackStateMachine {
   public:
    using Clock = std::chrono::steady_clock;

    struct Config {
        std::chrono::milliseconds pollInterval{std::chrono::seconds(10)};
        std::chrono::milliseconds gracePeriod{std::chrono::seconds(60)};
    };

    struct Dependencies {
        std::function<void()> switchOn;
        std::function<void()> switchOff;
        std::function<Clock::time_point()> now;  // defaults to Clock::now
    };

    enum class Action { None, SwitchOn, SwitchOff };

    PlaybackStateMachine(Config config, Dependencies deps);
    ~PlaybackStateMachine();

    PlaybackStateMachine(const PlaybackStateMachine&) = delete;
    PlaybackStateMachine& operator=(const PlaybackStateMachine&) = delete;

    /**
     * @brief Report the receiver's current logical state.
     *
     * A repeated state is ignored entirely: the change timestamp is kept and
     * the worker is not woken.
     */
    void signal(PlaybackState newState);

    // Start/stop the supervisory worker. start() returns false if already running.
    bool start();
    void stop();
    bool isRunning() const {
        return running_.load();
    }

    /**
     * @brief Run one supervisory step against the current state.
     *
     * Used by the worker after every wait; callable directly from tests.
     * Device commands are issued outside the state lock.
     */
    Action evaluate();

    PlaybackState state() const;
    // Time of the last real state change; empty before the first signal
    std::optional<Clock::time_point> lastChange() const;

    const Config& config() const {
        return config_;
    }

   private:
    void supervisorThread();

    Config config_;
    Dependencies deps_;

    mutable std::mutex mutex_;
    std::condition_variable wakeCv_;
    PlaybackState state_{PlaybackState::Unknown};
    std::optional<Clock::time_point> lastChange_;
    bool wake_{false};

    std::atomic<bool> running_{false};
    std::thread worker_;
};

const char* actionToString(PlaybackStateMachine::Action action);

}  // namespace playback
}  // namespace speaker_remote
