#include "device/device_handle.h"

#include "logging/logger.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace speaker_remote {
namespace device {

const char* connectionStateToString(ConnectionState state) {
    switch (state) {
    case ConnectionState::Connecting:
        return "connecting";
    case ConnectionState::Connected:
        return "connected";
    case ConnectionState::Disconnected:
    default:
        return "disconnected";
    }
}

const char* powerStateToString(bool on) {
    return on ? "on" : "off";
}

DeviceHandle::DeviceHandle(DeviceSpec spec, std::shared_ptr<DeviceConnector> connector)
    : spec_(std::move(spec)), connector_(std::move(connector)) {
    if (!connector_) {
        throw std::invalid_argument("DeviceHandle requires a connector");
    }
}

void DeviceHandle::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    connectLocked();
}

bool DeviceHandle::hasSession() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_ != nullptr;
}

void DeviceHandle::connectLocked() {
    // A failed attempt never leaves a half-open session behind
    session_.reset();
    state_.store(ConnectionState::Connecting);

    std::unique_ptr<DeviceSession> session;
    bool accepted = false;
    try {
        session = connector_->open(spec_);
        if (!session) {
            throw DeviceIoError("connector returned no session",
                                ErrorCode::DEVICE_CONNECT_FAILED);
        }
        accepted = session->authenticate();
    } catch (const std::exception& e) {
        // Also covers socket setup and resource failures from the connector
        state_.store(ConnectionState::Disconnected);
        throw ConnectError(ErrorCode::DEVICE_CONNECT_FAILED,
                           std::string("Connection error: ") + e.what());
    }
    if (!accepted) {
        state_.store(ConnectionState::Disconnected);
        throw ConnectError(ErrorCode::DEVICE_AUTH_REJECTED, "Authentication rejected");
    }

    session_ = std::move(session);
    state_.store(ConnectionState::Connected);
    LOG_INFO("Connected to {} speaker", spec_.name);
}

DeviceSession& DeviceHandle::sessionLocked() {
    if (!session_) {
        connectLocked();
    }
    return *session_;
}

void DeviceHandle::dropSessionLocked(ErrorCode cause, const char* what) {
    LOG_DEBUG("{} speaker: dropping session after I/O failure ({}: {})", spec_.name,
              errorCodeToString(cause), what);
    session_.reset();
    state_.store(ConnectionState::Disconnected);
    throw ConnectError(ErrorCode::DEVICE_IO_ERROR, "Communication error");
}

bool DeviceHandle::currentPower() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& session = sessionLocked();
    try {
        return session.queryPower();
    } catch (const DeviceIoError& e) {
        dropSessionLocked(e.code(), e.what());
    } catch (const std::exception& e) {
        dropSessionLocked(ErrorCode::DEVICE_IO_ERROR, e.what());
    }
}

void DeviceHandle::setPower(bool on) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& session = sessionLocked();
    try {
        session.setPower(on);
    } catch (const DeviceIoError& e) {
        dropSessionLocked(e.code(), e.what());
    } catch (const std::exception& e) {
        dropSessionLocked(ErrorCode::DEVICE_IO_ERROR, e.what());
    }
}

void DeviceHandle::setState(bool desired) {
    try {
        // Query and write under one lock so a concurrent broadcast cannot
        // slip in between the check and the command
        std::lock_guard<std::mutex> lock(mutex_);
        auto& session = sessionLocked();
        try {
            if (session.queryPower() != desired) {
                LOG_INFO("Turning {} {} speaker", powerStateToString(desired), spec_.name);
                session.setPower(desired);
            }
        } catch (const DeviceIoError& e) {
            dropSessionLocked(e.code(), e.what());
        } catch (const std::exception& e) {
            dropSessionLocked(ErrorCode::DEVICE_IO_ERROR, e.what());
        }
    } catch (const ConnectError& e) {
        LOG_WARN("Could not turn {} {} speaker: {}", powerStateToString(desired), spec_.name,
                 e.what());
    } catch (const std::exception& e) {
        // Runs on a detached broadcast worker; nothing may escape
        LOG_WARN("Could not turn {} {} speaker: {}", powerStateToString(desired), spec_.name,
                 e.what());
    }
}

}  // namespace device
}  // namespace speaker_remote
