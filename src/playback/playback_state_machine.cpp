#include "playback/playback_state_machine.h"

#include "logging/logger.h"

#include <utility>

namespace speaker_remote {
namespace playback {

const char* actionToString(PlaybackStateMachine::Action action) {
    switch (action) {
    case PlaybackStateMachine::Action::SwitchOn:
        return "switch_on";
    case PlaybackStateMachine::Action::SwitchOff:
        return "switch_off";
    case PlaybackStateMachine::Action::None:
    default:
        return "none";
    }
}

PlaybackStateMachine::PlaybackStateMachine(Config config, Dependencies deps)
    : config_(config), deps_(std::move(deps)) {
    if (!deps_.now) {
        deps_.now = [] { return Clock::now(); };
    }
}

PlaybackStateMachine::~PlaybackStateMachine() {
    stop();
}

void PlaybackStateMachine::signal(PlaybackState newState) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (newState == state_) {
            return;
        }
        state_ = newState;
        lastChange_ = deps_.now();
        wake_ = true;
    }
    wakeCv_.notify_one();
    LOG_INFO("Receiver state changed to {}", playbackStateToString(newState));
}

PlaybackState PlaybackStateMachine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<PlaybackStateMachine::Clock::time_point> PlaybackStateMachine::lastChange() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastChange_;
}

PlaybackStateMachine::Action PlaybackStateMachine::evaluate() {
    Action action = Action::None;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (state_) {
        case PlaybackState::Playing:
            action = Action::SwitchOn;
            break;
        case PlaybackState::Inactive:
            action = Action::SwitchOff;
            break;
        case PlaybackState::Stopped:
        case PlaybackState::Unknown:
            // No change seen yet counts as an expired grace period
            if (!lastChange_ || deps_.now() - *lastChange_ >= config_.gracePeriod) {
                action = Action::SwitchOff;
            }
            break;
        }
    }

    // Broadcasts are fire-and-forget; never hold the state lock across them
    if (action == Action::SwitchOn) {
        LOG_DEBUG("Playback active, asserting speakers on");
        if (deps_.switchOn) {
            deps_.switchOn();
        }
    } else if (action == Action::SwitchOff) {
        LOG_DEBUG("Playback idle, asserting speakers off");
        if (deps_.switchOff) {
            deps_.switchOff();
        }
    }
    return action;
}

bool PlaybackStateMachine::start() {
    if (running_.exchange(true)) {
        LOG_WARN("Playback supervisor already running");
        return false;
    }
    worker_ = std::thread(&PlaybackStateMachine::supervisorThread, this);
    LOG_INFO("Playback supervisor started (poll: {} ms, grace: {} ms)",
             config_.pollInterval.count(), config_.gracePeriod.count());
    return true;
}

void PlaybackStateMachine::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wakeCv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    LOG_INFO("Playback supervisor stopped");
}

void PlaybackStateMachine::supervisorThread() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            wakeCv_.wait_for(lock, config_.pollInterval,
                             [this] { return wake_ || !running_.load(); });
            if (!running_.load()) {
                break;
            }
            wake_ = false;
        }
        evaluate();
    }
}

}  // namespace playback
}  // namespace speaker_remote
