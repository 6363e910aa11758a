#pragma once

#include "error_codes.h"

#include <stdexcept>
#include <string>

namespace speaker_remote {
namespace device {

// Protocol level failure raised by a DeviceSession (transport error, timeout,
// error reply). DeviceHandle translates it into ConnectError.
class DeviceIoError : public std::runtime_error {
   public:
    explicit DeviceIoError(const std::string& message,
                           ErrorCode code = ErrorCode::DEVICE_IO_ERROR)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const {
        return code_;
    }

   private:
    ErrorCode code_;
};

// A device session could not be established or authenticated, or an I/O
// operation on it failed. The handle has already dropped its session when
// this is thrown, so the next call reconnects from scratch.
class ConnectError : public std::runtime_error {
   public:
    ConnectError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const {
        return code_;
    }

   private:
    ErrorCode code_;
};

}  // namespace device
}  // namespace speaker_remote
