#include "daemon/app/app.h"

#include "core/daemon_constants.h"
#include "daemon/shutdown_manager.h"
#include "device/zmq_device_session.h"
#include "logging/logger.h"
#include "receiver/receiver_status_adapter.h"

#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>
#include <utility>
#include <vector>

namespace speaker_remote {
namespace daemon_app {

using namespace DaemonConstants;

std::shared_ptr<device::DeviceGroup> buildDeviceGroup(
    const AppConfig& config, std::shared_ptr<device::DeviceConnector> connector) {
    std::vector<std::shared_ptr<device::DeviceHandle>> members;
    members.reserve(config.speakers.size());
    for (const auto& speaker : config.speakers) {
        device::DeviceSpec spec;
        spec.name = speaker.name;
        spec.host = speaker.host;
        spec.port = speaker.port;
        spec.mac = speaker.mac;
        spec.devtype = speaker.devtype;
        members.push_back(std::make_shared<device::DeviceHandle>(std::move(spec), connector));
    }
    return std::make_shared<device::DeviceGroup>(std::move(members));
}

playback::PlaybackStateMachine::Config makeStateMachineConfig(const AppConfig& config) {
    playback::PlaybackStateMachine::Config smConfig;
    smConfig.pollInterval = std::chrono::seconds(config.timing.pollIntervalSec);
    smConfig.gracePeriod = std::chrono::seconds(config.timing.gracePeriodSec);
    return smConfig;
}

receiver::ReceiverClient::Config makeReceiverClientConfig(const AppConfig& config) {
    receiver::ReceiverClient::Config clientConfig;
    clientConfig.controlEndpoint = config.bridge.controlEndpoint;
    clientConfig.eventEndpoint = config.bridge.eventEndpoint;
    clientConfig.requestTimeoutMs = config.bridge.requestTimeoutMs;
    clientConfig.discoveryRetry = std::chrono::seconds(config.timing.discoveryRetrySec);
    return clientConfig;
}

App::App(AppOptions options) : options_(std::move(options)) {}

int App::run() {
    if (!logging::initializeEarly()) {
        std::cerr << "Failed to initialize logging" << std::endl;
        return 1;
    }

    AppConfig config;
    std::string configError;
    if (!loadAppConfig(options_.configPath, config, configError)) {
        LOG_ERROR("Config error: {}", configError);
        logging::flush();
        return 1;
    }

    if (!logging::initializeFromConfig(options_.configPath, options_.verbose)) {
        LOG_WARN("Could not apply logging settings from {}", options_.configPath);
    }

    LOG_INFO("speaker_remote start");
    LOG_INFO("  - receiver:  {}", config.receiver.name);
    LOG_INFO("  - speakers:  {}", config.speakers.size());
    LOG_INFO("  - bridge:    {} / {}", config.bridge.controlEndpoint, config.bridge.eventEndpoint);
    LOG_INFO("  - timing:    poll {}s, grace {}s", config.timing.pollIntervalSec,
             config.timing.gracePeriodSec);

    auto connector = std::make_shared<device::ZmqDeviceConnector>(config.timing.deviceTimeoutMs);
    auto group = buildDeviceGroup(config, connector);
    size_t connected = group->connectAll();
    LOG_INFO("{} of {} speaker(s) reachable", connected, group->size());

    playback::PlaybackStateMachine::Dependencies smDeps;
    smDeps.switchOn = [group]() { group->switchOn(); };
    smDeps.switchOff = [group]() { group->switchOff(); };
    playback::PlaybackStateMachine stateMachine(makeStateMachineConfig(config), smDeps);
    if (!stateMachine.start()) {
        LOG_ERROR("Playback supervisor is already running");
        return 1;
    }

    receiver::ReceiverStatusAdapter adapter(
        [&stateMachine](playback::PlaybackState state) { stateMachine.signal(state); });
    receiver::ReceiverClient client(makeReceiverClientConfig(config));

    std::atomic<bool> running{true};
    shutdown_manager::ShutdownManager::Dependencies shutdownDeps;
    shutdownDeps.runningFlag = &running;
    shutdown_manager::ShutdownManager shutdown(shutdownDeps);
    shutdown.setStopCallback([&client]() { client.stop(); });
    shutdown.installSignalHandlers();

    auto keepRunning = [&]() {
        shutdown.tick();
        return running.load();
    };

    int exitCode = 0;
    if (client.waitForReceiver(config.receiver.name, keepRunning)) {
        if (!client.subscribe(config.receiver.name, &adapter)) {
            LOG_ERROR("Cannot receive status events from {}", config.bridge.eventEndpoint);
            exitCode = 1;
            running.store(false);
        } else {
            std::string statusError;
            if (!client.requestInitialStatus(config.receiver.name, adapter, statusError)) {
                LOG_WARN("Could not fetch initial status of {}: {}", config.receiver.name,
                         statusError);
            }
            shutdown.notifyReady("Watching " + config.receiver.name);
        }

        while (running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(MAIN_LOOP_TICK_MS));
            shutdown.tick();
            if (client.subscriptionError() != ErrorCode::OK) {
                LOG_ERROR("Lost status events from {} ({})", config.receiver.name,
                          errorCodeToString(client.subscriptionError()));
                exitCode = 1;
                running.store(false);
            }
        }
    }

    shutdown.runShutdownSequence();
    client.stop();
    stateMachine.stop();
    logging::flush();
    return exitCode;
}

}  // namespace daemon_app
}  // namespace speaker_remote
