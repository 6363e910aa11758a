#pragma once

#include "core/config_loader.h"
#include "daemon/app/app_options.h"
#include "device/device_group.h"
#include "device/device_session.h"
#include "playback/playback_state_machine.h"
#include "receiver/receiver_client.h"

#include <memory>

namespace speaker_remote {
namespace daemon_app {

class App {
   public:
    explicit App(AppOptions options);

    // Runs until SIGINT/SIGTERM. Returns the process exit code.
    int run();

   private:
    AppOptions options_;
};

// One DeviceHandle per configured speaker, in configuration order
std::shared_ptr<device::DeviceGroup> buildDeviceGroup(
    const AppConfig& config, std::shared_ptr<device::DeviceConnector> connector);

playback::PlaybackStateMachine::Config makeStateMachineConfig(const AppConfig& config);

receiver::ReceiverClient::Config makeReceiverClientConfig(const AppConfig& config);

}  // namespace daemon_app
}  // namespace speaker_remote
