/**
 * @file test_device_handle.cpp
 * @brief Unit tests for DeviceHandle (lazy reconnect, error isolation, no-op suppression)
 */

#include "device/device_handle.h"
#include "device/fake_device.h"

#include <atomic>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace speaker_remote;
using namespace speaker_remote::device;
using fakes::FakeConnector;
using fakes::FakePlug;

namespace {

// Fails the way socket setup does when the process is out of descriptors
class ThrowingConnector : public DeviceConnector {
   public:
    std::unique_ptr<DeviceSession> open(const DeviceSpec& /*spec*/) override {
        ++opens;
        throw std::runtime_error("Too many open files");
    }

    std::atomic<int> opens{0};
};

// Session whose reads fail with a plain standard exception
class BrokenSession : public DeviceSession {
   public:
    bool authenticate() override {
        return true;
    }
    bool queryPower() override {
        throw std::runtime_error("Resource temporarily unavailable");
    }
    void setPower(bool /*on*/) override {}
};

class BrokenSessionConnector : public DeviceConnector {
   public:
    std::unique_ptr<DeviceSession> open(const DeviceSpec& /*spec*/) override {
        return std::make_unique<BrokenSession>();
    }
};

}  // namespace

class DeviceHandleTest : public ::testing::Test {
   protected:
    void SetUp() override {
        plug_ = std::make_shared<FakePlug>();
        handle_ = std::make_unique<DeviceHandle>(fakes::makeSpec("kitchen"),
                                                 std::make_shared<FakeConnector>(plug_));
    }

    std::shared_ptr<FakePlug> plug_;
    std::unique_ptr<DeviceHandle> handle_;
};

// ============================================================
// connect()
// ============================================================

TEST_F(DeviceHandleTest, InitiallyDisconnected) {
    EXPECT_EQ(handle_->connectionState(), ConnectionState::Disconnected);
    EXPECT_FALSE(handle_->hasSession());
    EXPECT_EQ(handle_->name(), "kitchen");
    EXPECT_EQ(handle_->spec().address(), "192.168.1.20:80");
}

TEST_F(DeviceHandleTest, ConnectAuthenticatesAndKeepsSession) {
    EXPECT_NO_THROW(handle_->connect());

    EXPECT_EQ(plug_->opens.load(), 1);
    EXPECT_EQ(plug_->auths.load(), 1);
    EXPECT_TRUE(handle_->hasSession());
    EXPECT_EQ(handle_->connectionState(), ConnectionState::Connected);
}

TEST_F(DeviceHandleTest, ConnectRejectedAuthThrowsAndLeavesNoSession) {
    plug_->acceptAuth = false;

    try {
        handle_->connect();
        FAIL() << "expected ConnectError";
    } catch (const ConnectError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DEVICE_AUTH_REJECTED);
    }
    EXPECT_FALSE(handle_->hasSession());
    EXPECT_EQ(handle_->connectionState(), ConnectionState::Disconnected);
}

TEST_F(DeviceHandleTest, ConnectUnreachableThrowsConnectError) {
    plug_->failOpen = true;

    try {
        handle_->connect();
        FAIL() << "expected ConnectError";
    } catch (const ConnectError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DEVICE_CONNECT_FAILED);
    }
    EXPECT_FALSE(handle_->hasSession());
}

TEST_F(DeviceHandleTest, FailedReconnectDropsPreviousSession) {
    handle_->connect();
    ASSERT_TRUE(handle_->hasSession());

    plug_->acceptAuth = false;
    EXPECT_THROW(handle_->connect(), ConnectError);
    EXPECT_FALSE(handle_->hasSession());
}

TEST(DeviceHandle, ConnectorFailureBecomesConnectError) {
    auto connector = std::make_shared<ThrowingConnector>();
    DeviceHandle handle(fakes::makeSpec("porch"), connector);

    try {
        handle.connect();
        FAIL() << "expected ConnectError";
    } catch (const ConnectError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DEVICE_CONNECT_FAILED);
        EXPECT_NE(std::string(e.what()).find("Too many open files"), std::string::npos);
    }
    EXPECT_EQ(handle.connectionState(), ConnectionState::Disconnected);
    EXPECT_FALSE(handle.hasSession());
}

TEST(DeviceHandle, SetStateContainsConnectorFailure) {
    auto connector = std::make_shared<ThrowingConnector>();
    DeviceHandle handle(fakes::makeSpec("porch"), connector);

    EXPECT_NO_THROW(handle.setState(true));
    EXPECT_EQ(handle.connectionState(), ConnectionState::Disconnected);

    // Next call tries again from scratch
    EXPECT_NO_THROW(handle.setState(true));
    EXPECT_EQ(connector->opens.load(), 2);
}

TEST(DeviceHandle, UnexpectedSessionFailureDropsSession) {
    DeviceHandle handle(fakes::makeSpec("porch"), std::make_shared<BrokenSessionConnector>());
    handle.connect();

    try {
        handle.currentPower();
        FAIL() << "expected ConnectError";
    } catch (const ConnectError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DEVICE_IO_ERROR);
    }
    EXPECT_FALSE(handle.hasSession());

    EXPECT_NO_THROW(handle.setState(false));
    EXPECT_EQ(handle.connectionState(), ConnectionState::Disconnected);
}

TEST(DeviceHandle, NullConnectorRejected) {
    EXPECT_THROW(DeviceHandle(fakes::makeSpec("x"), nullptr), std::invalid_argument);
}

// ============================================================
// currentPower() / setPower()
// ============================================================

TEST_F(DeviceHandleTest, CurrentPowerConnectsLazily) {
    plug_->power = true;

    EXPECT_TRUE(handle_->currentPower());
    EXPECT_EQ(plug_->opens.load(), 1);
    EXPECT_TRUE(handle_->hasSession());
}

TEST_F(DeviceHandleTest, SessionReusedAcrossCalls) {
    handle_->currentPower();
    handle_->setPower(true);
    handle_->currentPower();

    EXPECT_EQ(plug_->opens.load(), 1);
    EXPECT_EQ(plug_->auths.load(), 1);
    EXPECT_TRUE(plug_->power.load());
}

TEST_F(DeviceHandleTest, ReadFailureDropsSessionAndNextCallReconnects) {
    handle_->connect();
    plug_->failQuery = true;

    try {
        handle_->currentPower();
        FAIL() << "expected ConnectError";
    } catch (const ConnectError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DEVICE_IO_ERROR);
    }
    EXPECT_FALSE(handle_->hasSession());
    EXPECT_EQ(handle_->connectionState(), ConnectionState::Disconnected);

    plug_->failQuery = false;
    EXPECT_FALSE(handle_->currentPower());
    EXPECT_EQ(plug_->opens.load(), 2);
}

TEST_F(DeviceHandleTest, WriteFailureDropsSession) {
    handle_->connect();
    plug_->failWrite = true;

    EXPECT_THROW(handle_->setPower(true), ConnectError);
    EXPECT_FALSE(handle_->hasSession());
}

// ============================================================
// setState()
// ============================================================

TEST_F(DeviceHandleTest, SetStateSkipsWriteWhenAlreadyInDesiredState) {
    plug_->power = true;

    handle_->setState(true);

    EXPECT_EQ(plug_->queries.load(), 1);
    EXPECT_EQ(plug_->writes.load(), 0);
}

TEST_F(DeviceHandleTest, SetStateWritesWhenStateDiffers) {
    handle_->setState(true);

    EXPECT_EQ(plug_->writes.load(), 1);
    EXPECT_TRUE(plug_->power.load());

    handle_->setState(true);
    EXPECT_EQ(plug_->writes.load(), 1);
}

TEST_F(DeviceHandleTest, SetStateSwallowsConnectionFailures) {
    plug_->failOpen = true;

    EXPECT_NO_THROW(handle_->setState(true));
    EXPECT_EQ(plug_->writes.load(), 0);
    EXPECT_FALSE(handle_->hasSession());
}

TEST_F(DeviceHandleTest, SetStateSwallowsIoFailureAndDropsSession) {
    handle_->connect();
    plug_->failQuery = true;

    EXPECT_NO_THROW(handle_->setState(false));
    EXPECT_FALSE(handle_->hasSession());
}

TEST_F(DeviceHandleTest, ReconnectsAfterFailedAuthentication) {
    plug_->acceptAuth = false;
    handle_->setState(true);
    EXPECT_FALSE(handle_->hasSession());
    EXPECT_FALSE(plug_->power.load());

    // Device accepts again: next call reconnects from scratch and writes
    plug_->acceptAuth = true;
    handle_->setState(true);

    EXPECT_EQ(plug_->opens.load(), 2);
    EXPECT_TRUE(handle_->hasSession());
    EXPECT_TRUE(plug_->power.load());
    EXPECT_EQ(plug_->writes.load(), 1);
}

TEST_F(DeviceHandleTest, ConcurrentSetStateIssuesSingleWrite) {
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([this]() { handle_->setState(true); });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(plug_->writes.load(), 1);
    EXPECT_EQ(plug_->opens.load(), 1);
    EXPECT_EQ(plug_->queries.load(), 8);
}

// ============================================================
// String helpers
// ============================================================

TEST(DeviceHandle, StateStrings) {
    EXPECT_STREQ(connectionStateToString(ConnectionState::Disconnected), "disconnected");
    EXPECT_STREQ(connectionStateToString(ConnectionState::Connecting), "connecting");
    EXPECT_STREQ(connectionStateToString(ConnectionState::Connected), "connected");
    EXPECT_STREQ(powerStateToString(true), "on");
    EXPECT_STREQ(powerStateToString(false), "off");
}
