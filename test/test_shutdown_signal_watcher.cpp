#include "errors.hpp"
#include "inhibitor_lock.hpp"
#include "mocks/mock_host_control.hpp"
#include "mocks/mock_host_signal.hpp"
#include "mocks/mock_mqtt_client.hpp"
#include "shutdown_signal_watcher.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace systemctl_mqtt;
using namespace systemctl_mqtt::bridge;
using ::testing::_;
using ::testing::InSequence;
using ::testing::InvokeWithoutArgs;
using ::testing::SaveArg;
using ::testing::StrictMock;
using ::testing::Throw;

constexpr auto stateTopic = "systemctl/host/preparing-for-shutdown";

class ShutdownSignalWatcherTest : public testing::Test
{
  protected:
    ShutdownSignalWatcherTest() :
        lock(host), watcher(signals, lock, mqtt, stateTopic)
    {}

    void SetUp() override
    {
        EXPECT_CALL(signals, subscribe(_)).WillOnce(SaveArg<0>(&handler));
        watcher.start();
        ASSERT_TRUE(handler);

        EXPECT_CALL(host, inhibit(_, _, _, _))
            .WillOnce(InvokeWithoutArgs(&test::makeShutdownLock))
            .RetiresOnSaturation();
        ASSERT_EQ(lock.acquire(), std::nullopt);
    }

    StrictMock<test::MockHostControl> host;
    StrictMock<test::MockHostSignalSource> signals;
    StrictMock<test::MockMqttClient> mqtt;
    InhibitorLock lock;
    ShutdownSignalWatcher watcher;
    host::ShutdownSignalHandler handler;
};

TEST_F(ShutdownSignalWatcherTest, shutdownStartingReportsThenReleases)
{
    {
        InSequence seq;
        EXPECT_CALL(mqtt, publish(stateTopic, "true", 0, true));
        EXPECT_CALL(host, releaseLock(_));
    }

    handler(true);

    EXPECT_FALSE(lock.held());
}

TEST_F(ShutdownSignalWatcherTest, shutdownCancelledReacquires)
{
    EXPECT_CALL(mqtt, publish(stateTopic, "true", 0, true));
    EXPECT_CALL(host, releaseLock(_)).Times(2);
    handler(true);

    {
        InSequence seq;
        EXPECT_CALL(host, inhibit("shutdown", "systemctl-mqtt",
                                  "Report shutdown via MQTT", "delay"))
            .WillOnce(InvokeWithoutArgs(&test::makeShutdownLock));
        EXPECT_CALL(mqtt, publish(stateTopic, "false", 0, true));
    }

    handler(false);

    EXPECT_TRUE(lock.held());
}

TEST_F(ShutdownSignalWatcherTest, repeatedStartReleasesOnce)
{
    EXPECT_CALL(mqtt, publish(stateTopic, "true", 0, true)).Times(1);
    EXPECT_CALL(host, releaseLock(_)).Times(1);

    handler(true);
    handler(true);
}

TEST_F(ShutdownSignalWatcherTest, publishFailureStillReleases)
{
    EXPECT_CALL(mqtt, publish(stateTopic, "true", 0, true))
        .WillOnce(Throw(ConnectionError("not connected")));
    EXPECT_CALL(host, releaseLock(_));

    handler(true);

    EXPECT_FALSE(lock.held());
}

TEST_F(ShutdownSignalWatcherTest, cancelWithDeniedLockStillReports)
{
    EXPECT_CALL(mqtt, publish(stateTopic, "true", 0, true));
    EXPECT_CALL(host, releaseLock(_));
    handler(true);

    EXPECT_CALL(host, inhibit(_, _, _, _))
        .WillOnce(Throw(Unauthorized("Access denied")));
    EXPECT_CALL(mqtt, publish(stateTopic, "false", 0, true));

    handler(false);

    EXPECT_FALSE(lock.held());
}

TEST_F(ShutdownSignalWatcherTest, stopUnsubscribes)
{
    EXPECT_CALL(signals, unsubscribe());
    EXPECT_CALL(host, releaseLock(_));

    watcher.stop();
}
