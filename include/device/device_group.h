#pragma once

#include "device/device_handle.h"

#include <cstddef>
#include <memory>
#include <vector>

namespace speaker_remote {
namespace device {

/**
 * @brief Fixed set of speakers switched together.
 *
 * setPowerState() starts one detached worker per member and returns
 * immediately. Workers are never joined and their results are never
 * collected: outcomes are visible only in the log.
 */
class DeviceGroup {
   public:
    explicit DeviceGroup(std::vector<std::shared_ptr<DeviceHandle>> members);

    void setPowerState(bool on);

    void switchOn() {
        setPowerState(true);
    }
    void switchOff() {
        setPowerState(false);
    }

    // Authenticate every member once, sequentially. Failures are logged only.
    // Returns the number of members that connected.
    size_t connectAll();

    size_t size() const {
        return members_.size();
    }
    const std::vector<std::shared_ptr<DeviceHandle>>& members() const {
        return members_;
    }

   private:
    const std::vector<std::shared_ptr<DeviceHandle>> members_;
};

}  // namespace device
}  // namespace speaker_remote
