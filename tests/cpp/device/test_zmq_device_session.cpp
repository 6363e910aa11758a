/**
 * @file test_zmq_device_session.cpp
 * @brief Tests for the ZeroMQ plug gateway session against an in-process gateway
 */

#include "device/device_handle.h"
#include "device/zmq_device_session.h"
#include "network/fake_rep_server.h"

#include <atomic>
#include <gtest/gtest.h>
#include <string>

using json = nlohmann::json;
using namespace speaker_remote;
using namespace speaker_remote::device;
using fakes::FakeRepServer;

namespace {

constexpr int kTimeoutMs = 300;

DeviceSpec gatewaySpec() {
    DeviceSpec spec;
    spec.name = "kitchen";
    spec.host = "192.168.1.20";
    spec.port = 80;
    spec.mac = {0xa1, 0xb2, 0xc3, 0xd4, 0xe5, 0xf6};
    spec.devtype = "0x2711";
    return spec;
}

// Gateway that behaves like a healthy plug
class PlugGateway {
   public:
    explicit PlugGateway(const std::string& endpoint)
        : server_(endpoint, [this](const std::string& cmd, const json& params) {
              return handle(cmd, params);
          }) {}

    std::atomic<bool> power{false};
    std::atomic<bool> rejectAuth{false};

    FakeRepServer& server() {
        return server_;
    }

   private:
    std::string handle(const std::string& cmd, const json& params) {
        using namespace ZMQComm;
        if (cmd == kCmdAuth) {
            if (rejectAuth.load()) {
                return JSON::buildErrorResponse(ErrorCode::DEVICE_AUTH_REJECTED, "bad key");
            }
            return JSON::buildOkResponse("authenticated");
        }
        if (cmd == kCmdCheckPower) {
            return JSON::buildOkResponse("", json{{"power", power.load()}});
        }
        if (cmd == kCmdSetPower) {
            power = params.value("power", false);
            return JSON::buildOkResponse();
        }
        return JSON::buildErrorResponse(ErrorCode::IPC_INVALID_COMMAND, "unknown command");
    }

    FakeRepServer server_;
};

}  // namespace

// ============================================================
// Endpoint formatting
// ============================================================

TEST(ZmqDeviceSession, GatewayEndpointIpv4) {
    EXPECT_EQ(gatewayEndpoint(gatewaySpec()), "tcp://192.168.1.20:80");
}

TEST(ZmqDeviceSession, GatewayEndpointIpv6IsBracketed) {
    auto spec = gatewaySpec();
    spec.host = "fe80::1";
    spec.port = 8080;
    EXPECT_EQ(gatewayEndpoint(spec), "tcp://[fe80::1]:8080");
}

// ============================================================
// Protocol
// ============================================================

TEST(ZmqDeviceSession, AuthenticateSendsMacAndDevtype) {
    PlugGateway gateway(fakes::makeIpcEndpoint("auth"));
    ZmqDeviceSession session(gatewaySpec(), gateway.server().endpoint(), kTimeoutMs);

    EXPECT_TRUE(session.authenticate());

    auto requests = gateway.server().requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].cmd, "AUTH");
    EXPECT_EQ(requests[0].params["mac"], "a1b2c3d4e5f6");
    EXPECT_EQ(requests[0].params["devtype"], "0x2711");
}

TEST(ZmqDeviceSession, RejectedAuthReturnsFalse) {
    PlugGateway gateway(fakes::makeIpcEndpoint("auth_reject"));
    gateway.rejectAuth = true;
    ZmqDeviceSession session(gatewaySpec(), gateway.server().endpoint(), kTimeoutMs);

    EXPECT_FALSE(session.authenticate());
}

TEST(ZmqDeviceSession, QueryAndSetPower) {
    PlugGateway gateway(fakes::makeIpcEndpoint("power"));
    ZmqDeviceSession session(gatewaySpec(), gateway.server().endpoint(), kTimeoutMs);

    EXPECT_FALSE(session.queryPower());
    session.setPower(true);
    EXPECT_TRUE(gateway.power.load());
    EXPECT_TRUE(session.queryPower());

    auto requests = gateway.server().requests();
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_EQ(requests[1].cmd, "SET_POWER");
    EXPECT_EQ(requests[1].params["power"], true);
}

TEST(ZmqDeviceSession, MalformedPowerReplyThrows) {
    FakeRepServer server(fakes::makeIpcEndpoint("malformed"),
                         [](const std::string&, const json&) {
                             return ZMQComm::JSON::buildOkResponse("", json{{"state", "on"}});
                         });
    ZmqDeviceSession session(gatewaySpec(), server.endpoint(), kTimeoutMs);

    try {
        session.queryPower();
        FAIL() << "expected DeviceIoError";
    } catch (const DeviceIoError& e) {
        EXPECT_EQ(e.code(), ErrorCode::IPC_PROTOCOL_ERROR);
    }
}

TEST(ZmqDeviceSession, ErrorReplyToSetPowerThrows) {
    FakeRepServer server(fakes::makeIpcEndpoint("set_error"),
                         [](const std::string&, const json&) {
                             return ZMQComm::JSON::buildErrorResponse(ErrorCode::DEVICE_IO_ERROR,
                                                                      "relay stuck");
                         });
    ZmqDeviceSession session(gatewaySpec(), server.endpoint(), kTimeoutMs);

    EXPECT_THROW(session.setPower(true), DeviceIoError);
}

TEST(ZmqDeviceSession, NoGatewayTimesOut) {
    ZmqDeviceSession session(gatewaySpec(), fakes::makeIpcEndpoint("nobody"), kTimeoutMs);

    try {
        session.authenticate();
        FAIL() << "expected DeviceIoError";
    } catch (const DeviceIoError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DEVICE_TIMEOUT);
    }
}

// ============================================================
// DeviceHandle over a real gateway
// ============================================================

TEST(ZmqDeviceSession, HandleSwitchesPlugThroughTcpGateway) {
    PlugGateway gateway("tcp://127.0.0.1:*");
    const std::string& endpoint = gateway.server().endpoint();
    auto spec = gatewaySpec();
    spec.host = "127.0.0.1";
    spec.port = static_cast<uint16_t>(std::stoi(endpoint.substr(endpoint.rfind(':') + 1)));

    DeviceHandle handle(spec, std::make_shared<ZmqDeviceConnector>(kTimeoutMs));
    handle.setState(true);

    EXPECT_TRUE(gateway.power.load());
    auto commands = gateway.server().commands();
    ASSERT_EQ(commands.size(), 3u);
    EXPECT_EQ(commands[0], "AUTH");
    EXPECT_EQ(commands[1], "CHECK_POWER");
    EXPECT_EQ(commands[2], "SET_POWER");

    // Already on: query only
    handle.setState(true);
    EXPECT_EQ(gateway.server().commands().size(), 4u);
}

TEST(ZmqDeviceSession, HandleRecoversAfterRejectedAuth) {
    PlugGateway gateway("tcp://127.0.0.1:*");
    const std::string& endpoint = gateway.server().endpoint();
    auto spec = gatewaySpec();
    spec.host = "127.0.0.1";
    spec.port = static_cast<uint16_t>(std::stoi(endpoint.substr(endpoint.rfind(':') + 1)));
    gateway.rejectAuth = true;

    DeviceHandle handle(spec, std::make_shared<ZmqDeviceConnector>(kTimeoutMs));
    handle.setState(true);
    EXPECT_FALSE(gateway.power.load());
    EXPECT_FALSE(handle.hasSession());

    gateway.rejectAuth = false;
    handle.setState(true);
    EXPECT_TRUE(gateway.power.load());
}
