#include "daemon/graceful_shutdown.h"

#include <cstdio>

namespace speaker_remote {
namespace GracefulShutdown {

static SignalState g_signalState;

SignalState& getGlobalSignalState() {
    return g_signalState;
}

// Async-signal-safe signal handler - ONLY sets flags
void signalHandler(int sig) {
    g_signalState.received = sig;
    g_signalState.shutdown = 1;
}

bool Controller::processPendingSignals() {
    if (!signalState_ || !signalState_->shutdown) {
        return false;
    }

    signalState_->shutdown = 0;
    lastSignal_ = signalState_->received;

    if (logCallback_) {
        char buf[64];
        snprintf(buf, sizeof(buf), "Received signal %d, shutting down...", lastSignal_);
        logCallback_(buf);
    }

    // Only the first request runs the stop callback
    bool wasRunning = running_.exchange(false);
    if (wasRunning && stopCallback_) {
        stopCallback_();
    }
    return true;
}

}  // namespace GracefulShutdown
}  // namespace speaker_remote
