#include "network/zeromq_interface.h"

#include "logging/logger.h"

#include <utility>
#include <zmq.hpp>

using json = nlohmann::json;

namespace speaker_remote {
namespace ZMQComm {

// ============================================================
// JSON utilities
// ============================================================

namespace JSON {

std::string buildCommand(const std::string& cmd, const json& params) {
    json j;
    j["cmd"] = cmd;
    if (!params.is_null()) {
        j["params"] = params;
    }
    return j.dump();
}

bool parseCommand(const std::string& jsonStr, std::string& cmd, json& params) {
    try {
        auto j = json::parse(jsonStr);
        if (!j.is_object() || !j.contains("cmd") || !j["cmd"].is_string()) {
            return false;
        }
        cmd = j["cmd"].get<std::string>();
        params = j.contains("params") ? j["params"] : json(nullptr);
        return true;
    } catch (const json::exception& e) {
        LOG_ERROR("ZMQ JSON parse error: {}", e.what());
        return false;
    }
}

std::string buildOkResponse(const std::string& message, const json& data) {
    json j;
    j["status"] = "ok";
    if (!message.empty()) {
        j["message"] = message;
    }
    if (!data.is_null()) {
        j["data"] = data;
    }
    return j.dump();
}

std::string buildErrorResponse(ErrorCode code, const std::string& message) {
    json j;
    j["status"] = "error";
    j["error_code"] = errorCodeToString(code);
    j["message"] = message;
    return j.dump();
}

bool parseReply(const std::string& jsonStr, Reply& reply) {
    try {
        auto j = json::parse(jsonStr);
        if (!j.is_object() || !j.contains("status") || !j["status"].is_string()) {
            return false;
        }

        const auto status = j["status"].get<std::string>();
        reply.transportError = false;
        reply.ok = status == "ok";
        reply.message = j.value("message", "");
        reply.data = j.contains("data") ? j["data"] : json(nullptr);

        if (reply.ok) {
            reply.errorCode = ErrorCode::OK;
        } else if (j.contains("error_code") && j["error_code"].is_string()) {
            reply.errorCode = stringToErrorCode(j["error_code"].get<std::string>());
        } else {
            reply.errorCode = ErrorCode::IPC_PROTOCOL_ERROR;
        }
        return true;
    } catch (const json::exception& e) {
        LOG_ERROR("ZMQ JSON parse error: {}", e.what());
        return false;
    }
}

}  // namespace JSON

// ============================================================
// RequestClient implementation
// ============================================================

struct RequestClient::Impl {
    zmq::context_t context{1};
    std::unique_ptr<zmq::socket_t> socket;
    std::string endpoint;
    int timeoutMs = 0;

    void open() {
        socket = std::make_unique<zmq::socket_t>(context, zmq::socket_type::req);
        socket->set(zmq::sockopt::linger, 0);
        if (timeoutMs > 0) {
            socket->set(zmq::sockopt::rcvtimeo, timeoutMs);
            socket->set(zmq::sockopt::sndtimeo, timeoutMs);
        }
        socket->connect(endpoint);
    }
};

namespace {

Reply transportFailure(ErrorCode code, std::string message) {
    Reply reply;
    reply.ok = false;
    reply.transportError = true;
    reply.errorCode = code;
    reply.message = std::move(message);
    return reply;
}

}  // namespace

RequestClient::RequestClient(std::string endpoint, int timeoutMs)
    : impl_(std::make_unique<Impl>()) {
    impl_->endpoint = std::move(endpoint);
    impl_->timeoutMs = timeoutMs;
}

RequestClient::~RequestClient() {
    // Sockets must close before the context terminates
    impl_->socket.reset();
}

const std::string& RequestClient::endpoint() const {
    return impl_->endpoint;
}

Reply RequestClient::request(const std::string& cmd, const json& params) {
    try {
        if (!impl_->socket) {
            impl_->open();
        }

        std::string payload = JSON::buildCommand(cmd, params);
        auto sent = impl_->socket->send(zmq::buffer(payload), zmq::send_flags::none);
        if (!sent) {
            impl_->socket.reset();
            return transportFailure(ErrorCode::IPC_TIMEOUT,
                                    "Timeout sending " + cmd + " to " + impl_->endpoint);
        }

        zmq::message_t response;
        auto received = impl_->socket->recv(response, zmq::recv_flags::none);
        if (!received) {
            impl_->socket.reset();
            return transportFailure(ErrorCode::IPC_TIMEOUT,
                                    "Timeout waiting for " + cmd + " reply from " +
                                        impl_->endpoint);
        }

        std::string responseStr(static_cast<char*>(response.data()), response.size());
        Reply reply;
        if (!JSON::parseReply(responseStr, reply)) {
            impl_->socket.reset();
            return transportFailure(ErrorCode::IPC_PROTOCOL_ERROR,
                                    "Malformed " + cmd + " reply from " + impl_->endpoint);
        }
        return reply;
    } catch (const zmq::error_t& e) {
        impl_->socket.reset();
        return transportFailure(ErrorCode::IPC_CONNECTION_FAILED,
                                std::string("ZMQ error: ") + e.what());
    }
}

}  // namespace ZMQComm
}  // namespace speaker_remote
