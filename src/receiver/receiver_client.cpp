#include "receiver/receiver_client.h"

#include "logging/logger.h"

#include <algorithm>
#include <cerrno>
#include <exception>
#include <utility>
#include <zmq.hpp>

using json = nlohmann::json;

namespace speaker_remote {
namespace receiver {

namespace {

// Granularity of interruptible waits and of the SUB receive timeout
constexpr std::chrono::milliseconds kPollSlice{200};

std::string stringField(const json& data, const char* key) {
    if (data.is_object() && data.contains(key) && data[key].is_string()) {
        return data[key].get<std::string>();
    }
    return {};
}

}  // namespace

MediaStatus parseMediaStatus(const json& data) {
    MediaStatus status;
    status.playerState = stringField(data, "player_state");
    if (data.is_object() && data.contains("media_session_id") &&
        data["media_session_id"].is_number_integer()) {
        status.mediaSessionId = data["media_session_id"].get<int>();
    }
    return status;
}

CastStatus parseCastStatus(const json& data) {
    CastStatus status;
    status.appId = stringField(data, "app_id");
    status.sessionId = stringField(data, "session_id");
    return status;
}

ConnectionStatus parseConnectionStatus(const json& data) {
    ConnectionStatus status;
    status.status = stringField(data, "status");
    return status;
}

bool dispatchEvent(const std::string& payload, ReceiverObserver& observer) {
    json j;
    try {
        j = json::parse(payload);
    } catch (const json::exception& e) {
        LOG_EVERY_N(WARN, 100, "Dropping malformed receiver event: {}", e.what());
        return false;
    }

    const std::string event = stringField(j, "event");
    const json data = j.is_object() && j.contains("data") ? j["data"] : json::object();

    if (event == kEventMediaStatus) {
        observer.onMediaStatus(parseMediaStatus(data));
    } else if (event == kEventCastStatus) {
        observer.onCastStatus(parseCastStatus(data));
    } else if (event == kEventConnectionStatus) {
        observer.onConnectionStatus(parseConnectionStatus(data));
    } else {
        LOG_DEBUG("Ignoring receiver event '{}'", event);
        return false;
    }
    return true;
}

// ============================================================
// ReceiverClient
// ============================================================

struct ReceiverClient::Impl {
    zmq::context_t context{1};
    // Created by subscribe(), then owned by the subscription thread
    std::unique_ptr<zmq::socket_t> subSocket;
};

ReceiverClient::ReceiverClient(Config config)
    : config_(std::move(config)),
      control_(config_.controlEndpoint, config_.requestTimeoutMs),
      impl_(std::make_unique<Impl>()) {}

ReceiverClient::~ReceiverClient() {
    stop();
    impl_->subSocket.reset();
}

bool ReceiverClient::listReceivers(std::vector<std::string>& names, std::string& error) {
    auto reply = control_.request(kCmdListReceivers);
    if (!reply.ok) {
        error = reply.message.empty() ? errorCodeToString(reply.errorCode) : reply.message;
        return false;
    }

    names.clear();
    if (reply.data.is_object() && reply.data.contains("receivers") &&
        reply.data["receivers"].is_array()) {
        for (const auto& entry : reply.data["receivers"]) {
            std::string name = stringField(entry, "name");
            if (!name.empty()) {
                names.push_back(std::move(name));
            }
        }
    }
    return true;
}

bool ReceiverClient::waitForReceiver(const std::string& name,
                                     const std::function<bool()>& keepRunning) {
    auto shouldRun = [&]() { return !stopping_.load() && (!keepRunning || keepRunning()); };

    while (shouldRun()) {
        LOG_INFO("Connecting to {}", name);

        std::vector<std::string> names;
        std::string error;
        if (listReceivers(names, error)) {
            if (std::find(names.begin(), names.end(), name) != names.end()) {
                LOG_INFO("Connected to {}", name);
                return true;
            }
            LOG_DEBUG("Bridge lists {} receiver(s), {} not among them", names.size(), name);
        } else {
            LOG_DEBUG("Receiver discovery failed: {}", error);
        }

        LOG_WARN("Could not connect to {}, retrying in {} seconds", name,
                 std::chrono::duration_cast<std::chrono::seconds>(config_.discoveryRetry).count());

        auto deadline = std::chrono::steady_clock::now() + config_.discoveryRetry;
        while (shouldRun() && std::chrono::steady_clock::now() < deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            std::this_thread::sleep_for(std::min(remaining, kPollSlice));
        }
    }

    LOG_INFO("Receiver discovery interrupted");
    return false;
}

bool ReceiverClient::subscribe(const std::string& name, ReceiverObserver* observer) {
    if (!observer) {
        LOG_ERROR("Cannot subscribe to {} without an observer", name);
        return false;
    }

    std::lock_guard<std::mutex> lock(subscribeMutex_);
    if (subscribed_.load()) {
        LOG_WARN("Already subscribed to receiver events");
        return false;
    }
    // A subscription that ended on its own still has to be joined
    if (subscriber_.joinable()) {
        subscriber_.join();
    }
    impl_->subSocket.reset();

    try {
        auto socket = std::make_unique<zmq::socket_t>(impl_->context, zmq::socket_type::sub);
        socket->set(zmq::sockopt::linger, 0);
        socket->set(zmq::sockopt::rcvtimeo, static_cast<int>(kPollSlice.count()));
        socket->set(zmq::sockopt::subscribe, name);
        socket->connect(config_.eventEndpoint);
        impl_->subSocket = std::move(socket);
    } catch (const zmq::error_t& e) {
        LOG_ERROR("Failed to subscribe to {}: {}", config_.eventEndpoint, e.what());
        return false;
    }

    stopping_.store(false);
    subscriptionError_.store(ErrorCode::OK);
    subscribed_.store(true);
    subscriber_ = std::thread(&ReceiverClient::subscriptionThread, this, name, observer);
    LOG_INFO("Subscribed to {} status events on {}", name, config_.eventEndpoint);
    return true;
}

bool ReceiverClient::requestInitialStatus(const std::string& name, ReceiverObserver& observer,
                                          std::string& error) {
    json params;
    params["name"] = name;
    auto reply = control_.request(kCmdGetStatus, params);
    if (!reply.ok) {
        error = reply.message.empty() ? errorCodeToString(reply.errorCode) : reply.message;
        return false;
    }
    if (!reply.data.is_object()) {
        error = errorCodeToString(ErrorCode::RECEIVER_STATUS_UNAVAILABLE);
        return false;
    }

    // Missing sections decode as empty status
    const json& data = reply.data;
    ReceiverSnapshot snapshot;
    snapshot.connection = parseConnectionStatus(data.value("connection", json::object()));
    snapshot.cast = parseCastStatus(data.value("cast", json::object()));
    snapshot.media = parseMediaStatus(data.value("media", json::object()));
    observer.onSnapshot(snapshot);
    return true;
}

void ReceiverClient::stop() {
    stopping_.store(true);
    std::lock_guard<std::mutex> lock(subscribeMutex_);
    if (subscriber_.joinable()) {
        subscriber_.join();
    }
    subscribed_.store(false);
}

void ReceiverClient::subscriptionThread(std::string name, ReceiverObserver* observer) {
    zmq::socket_t& socket = *impl_->subSocket;

    while (!stopping_.load()) {
        zmq::message_t topic;
        zmq::message_t payload;
        try {
            if (!socket.recv(topic, zmq::recv_flags::none)) {
                continue;  // timeout, re-check stop flag
            }
            if (!socket.get(zmq::sockopt::rcvmore)) {
                LOG_EVERY_N(WARN, 100, "Dropping single-frame receiver event");
                continue;
            }
            if (!socket.recv(payload, zmq::recv_flags::none)) {
                continue;
            }
            // Drain unexpected trailing frames
            while (socket.get(zmq::sockopt::rcvmore)) {
                zmq::message_t extra;
                if (!socket.recv(extra, zmq::recv_flags::none)) {
                    break;
                }
            }
        } catch (const zmq::error_t& e) {
            if (e.num() == EINTR) {
                continue;
            }
            LOG_ERROR("Receiver event socket error: {}", e.what());
            subscriptionError_.store(ErrorCode::RECEIVER_CONNECTION_LOST);
            break;
        }

        // SUB filtering is by prefix; require the exact friendly name
        std::string topicStr(static_cast<char*>(topic.data()), topic.size());
        if (topicStr != name) {
            continue;
        }
        try {
            dispatchEvent(std::string(static_cast<char*>(payload.data()), payload.size()),
                          *observer);
        } catch (const std::exception& e) {
            LOG_ERROR("Receiver event handler failed: {}", e.what());
            subscriptionError_.store(ErrorCode::INTERNAL_UNKNOWN);
            break;
        }
    }

    subscribed_.store(false);
}

}  // namespace receiver
}  // namespace speaker_remote
