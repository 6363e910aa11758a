#pragma once

#include "device/device_session.h"
#include "network/zeromq_interface.h"

#include <memory>
#include <string>

namespace speaker_remote {
namespace device {

// Gateway command names
constexpr const char* kCmdAuth = "AUTH";
constexpr const char* kCmdCheckPower = "CHECK_POWER";
constexpr const char* kCmdSetPower = "SET_POWER";

// "tcp://host:port" for a speaker's plug gateway (IPv6 hosts get brackets)
std::string gatewayEndpoint(const DeviceSpec& spec);

/**
 * @brief Session that drives a plug through its JSON/ZeroMQ gateway.
 *
 * Every failure to get a well-formed reply is a DeviceIoError. The session
 * is expected to be discarded after one, which also throws away the REQ
 * socket that missed its reply.
 */
class ZmqDeviceSession : public DeviceSession {
   public:
    ZmqDeviceSession(DeviceSpec spec, std::string endpoint, int timeoutMs);

    bool authenticate() override;
    bool queryPower() override;
    void setPower(bool on) override;

   private:
    ZMQComm::Reply call(const char* cmd, const nlohmann::json& params);

    DeviceSpec spec_;
    ZMQComm::RequestClient client_;
};

class ZmqDeviceConnector : public DeviceConnector {
   public:
    explicit ZmqDeviceConnector(int timeoutMs) : timeoutMs_(timeoutMs) {}

    std::unique_ptr<DeviceSession> open(const DeviceSpec& spec) override;

   private:
    int timeoutMs_;
};

}  // namespace device
}  // namespace speaker_remote
