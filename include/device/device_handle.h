#pragma once

#include "device/device_errors.h"
#include "device/device_session.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace speaker_remote {
namespace device {

enum class ConnectionState { Disconnected, Connecting, Connected };

const char* connectionStateToString(ConnectionState state);
const char* powerStateToString(bool on);

/**
 * @brief One speaker and its lazily (re)created session.
 *
 * The handle owns at most one live session. Any I/O failure discards it and
 * the next operation reconnects; there is no other retry. All operations are
 * serialized per handle so that overlapping broadcasts cannot interleave on
 * the same session.
 */
class DeviceHandle {
   public:
    DeviceHandle(DeviceSpec spec, std::shared_ptr<DeviceConnector> connector);

    DeviceHandle(const DeviceHandle&) = delete;
    DeviceHandle& operator=(const DeviceHandle&) = delete;

    /**
     * @brief Open a new session and authenticate.
     *
     * Any previous session is dropped first; on failure none is kept.
     * @throws ConnectError on network error, protocol error or rejected auth
     */
    void connect();

    /**
     * @brief Query the current power state (connects first if needed).
     * @throws ConnectError
     */
    bool currentPower();

    /**
     * @brief Switch power (connects first if needed).
     * @throws ConnectError
     */
    void setPower(bool on);

    /**
     * @brief Bring the device to the desired state if it is not there already.
     *
     * Never throws: connection failures are logged as warnings. No write is
     * issued when the device already reports the desired state.
     */
    void setState(bool desired);

    const std::string& name() const {
        return spec_.name;
    }
    const DeviceSpec& spec() const {
        return spec_;
    }
    ConnectionState connectionState() const {
        return state_.load();
    }
    bool hasSession() const;

   private:
    void connectLocked();
    DeviceSession& sessionLocked();
    [[noreturn]] void dropSessionLocked(ErrorCode cause, const char* what);

    DeviceSpec spec_;
    std::shared_ptr<DeviceConnector> connector_;

    mutable std::mutex mutex_;  // one in-flight operation per device
    std::unique_ptr<DeviceSession> session_;
    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
};

}  // namespace device
}  // namespace speaker_remote
