#include "device/zmq_device_session.h"

#include "core/config_loader.h"
#include "device/device_errors.h"
#include "logging/logger.h"

#include <utility>

using json = nlohmann::json;

namespace speaker_remote {
namespace device {

std::string gatewayEndpoint(const DeviceSpec& spec) {
    if (spec.host.find(':') != std::string::npos) {
        return "tcp://[" + spec.host + "]:" + std::to_string(spec.port);
    }
    return "tcp://" + spec.host + ":" + std::to_string(spec.port);
}

ZmqDeviceSession::ZmqDeviceSession(DeviceSpec spec, std::string endpoint, int timeoutMs)
    : spec_(std::move(spec)), client_(std::move(endpoint), timeoutMs) {}

ZMQComm::Reply ZmqDeviceSession::call(const char* cmd, const json& params) {
    auto reply = client_.request(cmd, params);
    if (reply.transportError) {
        ErrorCode code = reply.errorCode == ErrorCode::IPC_TIMEOUT ? ErrorCode::DEVICE_TIMEOUT
                                                                   : ErrorCode::DEVICE_IO_ERROR;
        throw DeviceIoError(reply.message, code);
    }
    return reply;
}

bool ZmqDeviceSession::authenticate() {
    json params;
    params["mac"] = formatMacAddress(spec_.mac);
    params["devtype"] = spec_.devtype;

    auto reply = call(kCmdAuth, params);
    if (!reply.ok) {
        LOG_DEBUG("{} speaker: AUTH refused by {} ({}: {})", spec_.name, client_.endpoint(),
                  errorCodeToString(reply.errorCode), reply.message);
        return false;
    }
    return true;
}

bool ZmqDeviceSession::queryPower() {
    auto reply = call(kCmdCheckPower, nullptr);
    if (!reply.ok) {
        throw DeviceIoError("CHECK_POWER failed: " + reply.message, reply.errorCode);
    }
    if (!reply.data.is_object() || !reply.data.contains("power") ||
        !reply.data["power"].is_boolean()) {
        throw DeviceIoError("CHECK_POWER reply has no boolean 'power'",
                            ErrorCode::IPC_PROTOCOL_ERROR);
    }
    return reply.data["power"].get<bool>();
}

void ZmqDeviceSession::setPower(bool on) {
    json params;
    params["power"] = on;
    auto reply = call(kCmdSetPower, params);
    if (!reply.ok) {
        throw DeviceIoError("SET_POWER failed: " + reply.message, reply.errorCode);
    }
}

std::unique_ptr<DeviceSession> ZmqDeviceConnector::open(const DeviceSpec& spec) {
    return std::make_unique<ZmqDeviceSession>(spec, gatewayEndpoint(spec), timeoutMs_);
}

}  // namespace device
}  // namespace speaker_remote
