#ifndef SPEAKER_REMOTE_ERROR_CODES_H
#define SPEAKER_REMOTE_ERROR_CODES_H

#include <cstdint>
#include <string>

namespace speaker_remote {

/**
 * @brief Error codes shared by the device, receiver and bridge layers.
 *
 * Categories use the upper 4 bits of the low 16 (0xF000 mask):
 * - 0x1xxx: Device (smart plug sessions)
 * - 0x2xxx: Receiver (media receiver discovery/session)
 * - 0x3xxx: IPC/ZeroMQ
 * - 0xFxxx: Internal (reserved)
 *
 * The string names double as the "error_code" field of gateway and bridge
 * replies, so they must stay stable.
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Device (0x1000)
    DEVICE_CONNECT_FAILED = 0x1001,
    DEVICE_AUTH_REJECTED = 0x1002,
    DEVICE_IO_ERROR = 0x1003,
    DEVICE_TIMEOUT = 0x1004,

    // Receiver (0x2000)
    RECEIVER_NOT_FOUND = 0x2001,
    RECEIVER_CONNECTION_LOST = 0x2002,
    RECEIVER_STATUS_UNAVAILABLE = 0x2003,

    // IPC/ZeroMQ (0x3000)
    IPC_CONNECTION_FAILED = 0x3001,
    IPC_TIMEOUT = 0x3002,
    IPC_INVALID_COMMAND = 0x3003,
    IPC_INVALID_PARAMS = 0x3004,
    IPC_PROTOCOL_ERROR = 0x3005,

    // Internal (0xF000)
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Convert ErrorCode to its stable string name.
 * @return e.g. "DEVICE_AUTH_REJECTED", or "UNKNOWN_ERROR" for unmapped values
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Category name for an error code ("device", "receiver", "ipc_zeromq",
 *        "internal", or "ok").
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Convert ErrorCode to hex string (e.g. "0x1002").
 */
std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Convert string to ErrorCode.
 * @return Corresponding ErrorCode, or INTERNAL_UNKNOWN if not found
 */
ErrorCode stringToErrorCode(const std::string& str);

constexpr bool isDeviceError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isReceiverError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isIpcError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

}  // namespace speaker_remote

#endif  // SPEAKER_REMOTE_ERROR_CODES_H
