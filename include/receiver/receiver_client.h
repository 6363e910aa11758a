#pragma once

#include "error_codes.h"
#include "network/zeromq_interface.h"
#include "receiver/receiver_observer.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace speaker_remote {
namespace receiver {

// Bridge control commands
constexpr const char* kCmdListReceivers = "LIST_RECEIVERS";
constexpr const char* kCmdGetStatus = "GET_STATUS";

// Event names published on the bridge event endpoint
constexpr const char* kEventMediaStatus = "media_status";
constexpr const char* kEventCastStatus = "cast_status";
constexpr const char* kEventConnectionStatus = "connection_status";

/**
 * @brief Client for the receiver bridge.
 *
 * Control requests (discovery, status snapshot) go over a REQ socket to the
 * control endpoint and must come from one thread. Status pushes arrive on a
 * SUB socket filtered by the receiver's friendly name and are dispatched to
 * the observer from an internal thread until stop().
 */
class ReceiverClient {
   public:
    struct Config {
        std::string controlEndpoint;
        std::string eventEndpoint;
        int requestTimeoutMs = 3000;
        std::chrono::milliseconds discoveryRetry{std::chrono::seconds(10)};
    };

    explicit ReceiverClient(Config config);
    ~ReceiverClient();

    ReceiverClient(const ReceiverClient&) = delete;
    ReceiverClient& operator=(const ReceiverClient&) = delete;

    /**
     * @brief Ask the bridge which receivers it can see.
     * @return false with error set when the bridge is unreachable or replies with an error
     */
    bool listReceivers(std::vector<std::string>& names, std::string& error);

    /**
     * @brief Poll discovery until a receiver with this friendly name shows up.
     *
     * Retries with a fixed delay, logging a warning per failed attempt. The
     * wait is cut short once keepRunning() returns false or stop() is called.
     * @return true when found, false when interrupted
     */
    bool waitForReceiver(const std::string& name, const std::function<bool()>& keepRunning);

    /**
     * @brief Start dispatching status pushes for one receiver.
     *
     * The observer must stay alive until stop() returns. The subscription
     * ends early on a socket error or when the observer throws; see
     * subscriptionError(). It may then be started again.
     */
    bool subscribe(const std::string& name, ReceiverObserver* observer);

    /**
     * @brief Fetch the receiver's current status and hand it to the observer
     *        as one snapshot.
     */
    bool requestInitialStatus(const std::string& name, ReceiverObserver& observer,
                              std::string& error);

    // Stop the subscription thread and interrupt a pending waitForReceiver().
    void stop();

    bool isSubscribed() const {
        return subscribed_.load();
    }

    // Why the last subscription ended on its own (OK while running or after stop())
    ErrorCode subscriptionError() const {
        return subscriptionError_.load();
    }

   private:
    struct Impl;

    void subscriptionThread(std::string name, ReceiverObserver* observer);

    Config config_;
    ZMQComm::RequestClient control_;
    std::unique_ptr<Impl> impl_;

    std::atomic<bool> stopping_{false};
    std::atomic<bool> subscribed_{false};
    std::atomic<ErrorCode> subscriptionError_{ErrorCode::OK};
    std::mutex subscribeMutex_;
    std::thread subscriber_;
};

/**
 * @brief Decode one event payload and forward it to the observer.
 *
 * @return false for malformed JSON or an unknown event name
 */
bool dispatchEvent(const std::string& payload, ReceiverObserver& observer);

// Decoders for the bridge's status objects (missing fields become empty)
MediaStatus parseMediaStatus(const nlohmann::json& data);
CastStatus parseCastStatus(const nlohmann::json& data);
ConnectionStatus parseConnectionStatus(const nlohmann::json& data);

}  // namespace receiver
}  // namespace speaker_remote
