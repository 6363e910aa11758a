#include "device/device_group.h"

#include "logging/logger.h"

#include <system_error>
#include <thread>
#include <utility>

namespace speaker_remote {
namespace device {

DeviceGroup::DeviceGroup(std::vector<std::shared_ptr<DeviceHandle>> members)
    : members_(std::move(members)) {}

void DeviceGroup::setPowerState(bool on) {
    LOG_DEBUG("Broadcasting power {} to {} speaker(s)", powerStateToString(on), members_.size());

    for (const auto& member : members_) {
        // The worker keeps its own reference so a late finisher never
        // outlives the handle it talks to
        std::shared_ptr<DeviceHandle> handle = member;
        try {
            std::thread([handle, on]() { handle->setState(on); }).detach();
        } catch (const std::system_error& e) {
            LOG_ERROR("Could not start worker for {} speaker: {}", handle->name(), e.what());
        }
    }
}

size_t DeviceGroup::connectAll() {
    size_t connected = 0;
    for (const auto& member : members_) {
        try {
            member->connect();
            ++connected;
        } catch (const ConnectError& e) {
            LOG_WARN("Could not connect to {} speaker: {}", member->name(), e.what());
        }
    }
    return connected;
}

}  // namespace device
}  // namespace speaker_remote
