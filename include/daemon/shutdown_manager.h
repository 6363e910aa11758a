#pragma once

#include "daemon/graceful_shutdown.h"

#include <atomic>
#include <functional>
#include <string>

namespace speaker_remote {
namespace shutdown_manager {

/**
 * @brief Process-level signal handling and systemd notifications.
 *
 * Signal handlers only set flags; tick() (called from the main loop) turns
 * them into a shutdown request, runs the stop callback once and keeps the
 * systemd watchdog fed while running.
 */
class ShutdownManager {
   public:
    struct Dependencies {
        std::atomic<bool>* runningFlag = nullptr;
        GracefulShutdown::SignalState* signalState = nullptr;  // defaults to the global one
    };

    explicit ShutdownManager(Dependencies deps);

    // SIGINT/SIGTERM -> GracefulShutdown::signalHandler
    void installSignalHandlers();

    // Called once when shutdown is requested (e.g. interrupt receiver discovery)
    void setStopCallback(std::function<void()> cb);

    void notifyReady(const std::string& status);

    // Periodic processing (called from the main loop)
    void tick();

    void runShutdownSequence();

    bool isRunning() const;

   private:
    // sd_notify wrappers, no-ops without systemd support
    void sendWatchdog();
    void sendReadyNotify(const std::string& status);
    void sendStoppingNotify();

    Dependencies deps_;
    GracefulShutdown::Controller controller_;
    std::function<void()> stopCallback_;

    bool readyNotified_{false};
    bool stoppingNotified_{false};
    bool sequenceRan_{false};
};

}  // namespace shutdown_manager
}  // namespace speaker_remote
