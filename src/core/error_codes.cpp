#include "error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace speaker_remote {

static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    // Device
    {ErrorCode::DEVICE_CONNECT_FAILED, "DEVICE_CONNECT_FAILED"},
    {ErrorCode::DEVICE_AUTH_REJECTED, "DEVICE_AUTH_REJECTED"},
    {ErrorCode::DEVICE_IO_ERROR, "DEVICE_IO_ERROR"},
    {ErrorCode::DEVICE_TIMEOUT, "DEVICE_TIMEOUT"},

    // Receiver
    {ErrorCode::RECEIVER_NOT_FOUND, "RECEIVER_NOT_FOUND"},
    {ErrorCode::RECEIVER_CONNECTION_LOST, "RECEIVER_CONNECTION_LOST"},
    {ErrorCode::RECEIVER_STATUS_UNAVAILABLE, "RECEIVER_STATUS_UNAVAILABLE"},

    // IPC/ZeroMQ
    {ErrorCode::IPC_CONNECTION_FAILED, "IPC_CONNECTION_FAILED"},
    {ErrorCode::IPC_TIMEOUT, "IPC_TIMEOUT"},
    {ErrorCode::IPC_INVALID_COMMAND, "IPC_INVALID_COMMAND"},
    {ErrorCode::IPC_INVALID_PARAMS, "IPC_INVALID_PARAMS"},
    {ErrorCode::IPC_PROTOCOL_ERROR, "IPC_PROTOCOL_ERROR"},

    // Internal
    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

// Reverse lookup, built once from the forward table
static const std::unordered_map<std::string, ErrorCode>& stringTable() {
    static const std::unordered_map<std::string, ErrorCode> table = [] {
        std::unordered_map<std::string, ErrorCode> reverse;
        for (const auto& entry : kErrorCodeStrings) {
            reverse.emplace(entry.second, entry.first);
        }
        return reverse;
    }();
    return table;
}

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isDeviceError(code)) {
        return "device";
    }
    if (isReceiverError(code)) {
        return "receiver";
    }
    if (isIpcError(code)) {
        return "ipc_zeromq";
    }
    return "internal";
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    const auto& table = stringTable();
    auto it = table.find(str);
    if (it != table.end()) {
        return it->second;
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

}  // namespace speaker_remote
