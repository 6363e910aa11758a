#ifndef SPEAKER_REMOTE_DAEMON_CONSTANTS_H
#define SPEAKER_REMOTE_DAEMON_CONSTANTS_H

// Defaults shared by the config loader, the state machine and the bootstrap

namespace speaker_remote {
namespace DaemonConstants {

// Supervisory loop
constexpr int DEFAULT_POLL_INTERVAL_SEC = 10;  // idle wait ceiling between evaluations
constexpr int DEFAULT_GRACE_PERIOD_SEC = 60;   // Stopped -> off delay

// Receiver discovery
constexpr int DEFAULT_DISCOVERY_RETRY_SEC = 10;

// Device / bridge request timeouts
constexpr int DEFAULT_DEVICE_TIMEOUT_MS = 5000;
constexpr int DEFAULT_BRIDGE_TIMEOUT_MS = 3000;

// Main loop tick (signal processing granularity)
constexpr int MAIN_LOOP_TICK_MS = 1000;

// ZeroMQ endpoints of the receiver bridge
constexpr const char* DEFAULT_BRIDGE_CONTROL_ENDPOINT = "tcp://127.0.0.1:5560";
constexpr const char* DEFAULT_BRIDGE_EVENT_ENDPOINT = "tcp://127.0.0.1:5561";

}  // namespace DaemonConstants
}  // namespace speaker_remote

#endif  // SPEAKER_REMOTE_DAEMON_CONSTANTS_H
