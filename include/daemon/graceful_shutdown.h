#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <utility>

namespace speaker_remote {
namespace GracefulShutdown {

// ========== Signal State ==========
// Flags set by the signal handler and polled by the main loop.
// volatile sig_atomic_t keeps the handler async-signal-safe.

struct SignalState {
    volatile sig_atomic_t shutdown = 0;  // SIGTERM, SIGINT
    volatile sig_atomic_t received = 0;  // Last signal number (for logging)

    void reset() {
        shutdown = 0;
        received = 0;
    }
};

// ========== Shutdown Controller ==========
// Turns pending signal flags into a shutdown request.
// Testable without actual signal delivery.

class Controller {
   public:
    using StopCallback = std::function<void()>;
    using LogCallback = std::function<void(const char*)>;

    Controller() = default;

    // Set the signal state (for testing, this can be a mock)
    void setSignalState(SignalState* state) {
        signalState_ = state;
    }

    // Invoked once when shutdown is requested (interrupts blocking waits)
    void setStopCallback(StopCallback cb) {
        stopCallback_ = std::move(cb);
    }
    void setLogCallback(LogCallback cb) {
        logCallback_ = std::move(cb);
    }

    // Process pending signals. Returns true if a shutdown was requested.
    bool processPendingSignals();

    bool isRunning() const {
        return running_.load();
    }
    void setRunning(bool running) {
        running_ = running;
    }

    int getLastSignal() const {
        return lastSignal_;
    }

   private:
    SignalState* signalState_ = nullptr;
    std::atomic<bool> running_{true};

    StopCallback stopCallback_;
    LogCallback logCallback_;

    int lastSignal_ = 0;
};

// ========== Signal Handler ==========
// Async-signal-safe handler that only sets flags.
void signalHandler(int sig);

// Global signal state written by signalHandler
SignalState& getGlobalSignalState();

}  // namespace GracefulShutdown
}  // namespace speaker_remote
