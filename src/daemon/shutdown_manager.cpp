#include "daemon/shutdown_manager.h"

#include "logging/logger.h"

#include <csignal>
#include <stdexcept>
#include <utility>

#ifdef HAVE_SYSTEMD
#include <systemd/sd-daemon.h>
#endif

namespace speaker_remote {
namespace shutdown_manager {

ShutdownManager::ShutdownManager(Dependencies deps) : deps_(std::move(deps)) {
    if (!deps_.runningFlag) {
        throw std::invalid_argument("ShutdownManager requires a running flag");
    }
    if (!deps_.signalState) {
        deps_.signalState = &GracefulShutdown::getGlobalSignalState();
    }

    controller_.setSignalState(deps_.signalState);
    controller_.setLogCallback([](const char* message) { LOG_INFO("{}", message); });
    controller_.setStopCallback([this]() {
        if (stopCallback_) {
            stopCallback_();
        }
    });
}

void ShutdownManager::installSignalHandlers() {
    std::signal(SIGINT, GracefulShutdown::signalHandler);
    std::signal(SIGTERM, GracefulShutdown::signalHandler);
}

void ShutdownManager::setStopCallback(std::function<void()> cb) {
    stopCallback_ = std::move(cb);
}

void ShutdownManager::notifyReady(const std::string& status) {
    if (!readyNotified_) {
        sendReadyNotify(status);
    }
}

void ShutdownManager::tick() {
    if (controller_.processPendingSignals()) {
        deps_.runningFlag->store(controller_.isRunning());
    }
    if (readyNotified_ && controller_.isRunning()) {
        sendWatchdog();
    }
}

void ShutdownManager::runShutdownSequence() {
    if (sequenceRan_) {
        return;
    }
    sequenceRan_ = true;

    LOG_INFO("Stopping");
    sendStoppingNotify();
}

bool ShutdownManager::isRunning() const {
    return controller_.isRunning();
}

void ShutdownManager::sendWatchdog() {
#ifdef HAVE_SYSTEMD
    sd_notify(0, "WATCHDOG=1");
#endif
}

void ShutdownManager::sendReadyNotify(const std::string& status) {
    readyNotified_ = true;
#ifdef HAVE_SYSTEMD
    std::string message = "READY=1\nSTATUS=" + status + "\n";
    sd_notify(0, message.c_str());
    LOG_DEBUG("systemd: Notified READY=1");
#else
    LOG_DEBUG("Ready: {}", status);
#endif
}

void ShutdownManager::sendStoppingNotify() {
    if (stoppingNotified_) {
        return;
    }
    stoppingNotified_ = true;
#ifdef HAVE_SYSTEMD
    sd_notify(0, "STOPPING=1\nSTATUS=Shutting down...\n");
    LOG_DEBUG("systemd: Notified STOPPING=1");
#endif
}

}  // namespace shutdown_manager
}  // namespace speaker_remote
