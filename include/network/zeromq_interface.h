#ifndef SPEAKER_REMOTE_ZEROMQ_INTERFACE_H
#define SPEAKER_REMOTE_ZEROMQ_INTERFACE_H

#include "error_codes.h"

#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace speaker_remote {
namespace ZMQComm {

/**
 * Request/reply envelope shared by the plug gateway and the receiver bridge.
 *
 * Request:  { "cmd": "CHECK_POWER", "params": { ... } }
 * Reply ok: { "status": "ok", "message": "...", "data": { ... } }
 * Reply ng: { "status": "error", "error_code": "DEVICE_AUTH_REJECTED", "message": "..." }
 */
struct Reply {
    bool ok = false;
    bool transportError = false;  // no reply at all (timeout, socket error)
    ErrorCode errorCode = ErrorCode::OK;
    std::string message;
    nlohmann::json data;
};

namespace JSON {

std::string buildCommand(const std::string& cmd, const nlohmann::json& params = nullptr);

bool parseCommand(const std::string& jsonStr, std::string& cmd, nlohmann::json& params);

std::string buildOkResponse(const std::string& message = "",
                            const nlohmann::json& data = nullptr);

std::string buildErrorResponse(ErrorCode code, const std::string& message);

// Parses either reply form. Returns false when the text is not an envelope.
bool parseReply(const std::string& jsonStr, Reply& reply);

}  // namespace JSON

/**
 * @brief Synchronous REQ client with a receive timeout.
 *
 * A REQ socket that missed its reply cannot be reused, so after any
 * transport failure the socket is closed and recreated on the next request.
 * Not thread-safe.
 */
class RequestClient {
   public:
    RequestClient(std::string endpoint, int timeoutMs);
    ~RequestClient();

    RequestClient(const RequestClient&) = delete;
    RequestClient& operator=(const RequestClient&) = delete;

    Reply request(const std::string& cmd, const nlohmann::json& params = nullptr);

    const std::string& endpoint() const;

   private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace ZMQComm
}  // namespace speaker_remote

#endif  // SPEAKER_REMOTE_ZEROMQ_INTERFACE_H
