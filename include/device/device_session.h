#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace speaker_remote {
namespace device {

/**
 * @brief Static identity of one smart-plug controlled speaker.
 */
struct DeviceSpec {
    std::string name;
    std::string host;
    uint16_t port = 0;
    std::vector<uint8_t> mac;
    std::string devtype;

    std::string address() const {
        return host + ":" + std::to_string(port);
    }
};

/**
 * @brief One open connection to a power switch.
 *
 * queryPower() and setPower() throw DeviceIoError on any failure.
 * Implementations are not required to be thread-safe; DeviceHandle
 * serializes all calls into its session.
 */
class DeviceSession {
   public:
    virtual ~DeviceSession() = default;

    // Device-level handshake. false means the device rejected us.
    virtual bool authenticate() = 0;

    virtual bool queryPower() = 0;
    virtual void setPower(bool on) = 0;
};

/**
 * @brief Factory for sessions of one wire protocol.
 *
 * open() may throw DeviceIoError when the transport cannot be created.
 */
class DeviceConnector {
   public:
    virtual ~DeviceConnector() = default;

    virtual std::unique_ptr<DeviceSession> open(const DeviceSpec& spec) = 0;
};

}  // namespace device
}  // namespace speaker_remote
