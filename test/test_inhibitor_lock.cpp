#include "errors.hpp"
#include "inhibitor_lock.hpp"
#include "mocks/mock_host_control.hpp"

#include <thread>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace systemctl_mqtt;
using namespace systemctl_mqtt::bridge;
using ::testing::_;
using ::testing::InvokeWithoutArgs;
using ::testing::StrictMock;
using ::testing::Throw;

class InhibitorLockTest : public testing::Test
{
  protected:
    void expectInhibit()
    {
        EXPECT_CALL(host, inhibit("shutdown", "systemctl-mqtt",
                                  "Report shutdown via MQTT", "delay"))
            .WillOnce(InvokeWithoutArgs(&test::makeShutdownLock));
    }

    StrictMock<test::MockHostControl> host;
};

TEST_F(InhibitorLockTest, acquireRequestsDelayLock)
{
    InhibitorLock lock(host);
    expectInhibit();
    EXPECT_CALL(host, releaseLock(_));

    EXPECT_FALSE(lock.held());
    EXPECT_EQ(lock.acquire(), std::nullopt);
    EXPECT_TRUE(lock.held());
}

TEST_F(InhibitorLockTest, acquireIsIdempotent)
{
    InhibitorLock lock(host);
    expectInhibit();
    EXPECT_CALL(host, releaseLock(_)).Times(1);

    EXPECT_EQ(lock.acquire(), std::nullopt);
    EXPECT_EQ(lock.acquire(), std::nullopt);

    EXPECT_EQ(lock.release(), std::nullopt);
    EXPECT_EQ(lock.release(), std::nullopt);
    EXPECT_FALSE(lock.held());
}

TEST_F(InhibitorLockTest, releaseWithoutLock)
{
    InhibitorLock lock(host);

    EXPECT_EQ(lock.release(), std::nullopt);
    EXPECT_FALSE(lock.held());
}

TEST_F(InhibitorLockTest, releasePassesOwnedDescriptor)
{
    InhibitorLock lock(host);
    expectInhibit();
    EXPECT_CALL(host, releaseLock(_))
        .WillOnce([](host::ShutdownLock& l) { EXPECT_TRUE(l.valid()); });

    ASSERT_EQ(lock.acquire(), std::nullopt);
    EXPECT_EQ(lock.release(), std::nullopt);
}

TEST_F(InhibitorLockTest, deniedByPolicy)
{
    InhibitorLock lock(host);
    EXPECT_CALL(host, inhibit(_, _, _, _))
        .WillOnce(Throw(Unauthorized("Access denied")));

    EXPECT_EQ(lock.acquire(), LockError::DeniedByPolicy);
    EXPECT_FALSE(lock.held());
}

TEST_F(InhibitorLockTest, hostUnavailable)
{
    InhibitorLock lock(host);
    EXPECT_CALL(host, inhibit(_, _, _, _))
        .WillOnce(Throw(HostError("org.freedesktop.DBus.Error.NoReply")));

    EXPECT_EQ(lock.acquire(), LockError::HostUnavailable);
    EXPECT_FALSE(lock.held());
}

TEST_F(InhibitorLockTest, acquireAfterFailureRetries)
{
    InhibitorLock lock(host);
    EXPECT_CALL(host, inhibit(_, _, _, _))
        .WillOnce(Throw(HostError("org.freedesktop.DBus.Error.NoReply")))
        .WillOnce(InvokeWithoutArgs(&test::makeShutdownLock));
    EXPECT_CALL(host, releaseLock(_));

    EXPECT_EQ(lock.acquire(), LockError::HostUnavailable);
    EXPECT_EQ(lock.acquire(), std::nullopt);
    EXPECT_TRUE(lock.held());
}

TEST_F(InhibitorLockTest, failedReleaseStillDropsLock)
{
    InhibitorLock lock(host);
    expectInhibit();
    EXPECT_CALL(host, releaseLock(_))
        .WillOnce(Throw(HostError("close failed")));

    ASSERT_EQ(lock.acquire(), std::nullopt);
    EXPECT_EQ(lock.release(), LockError::HostUnavailable);
    EXPECT_FALSE(lock.held());
    EXPECT_EQ(lock.release(), std::nullopt);
}

TEST_F(InhibitorLockTest, destructorReleases)
{
    expectInhibit();
    EXPECT_CALL(host, releaseLock(_)).Times(1);

    InhibitorLock lock(host);
    ASSERT_EQ(lock.acquire(), std::nullopt);
}

TEST_F(InhibitorLockTest, concurrentAcquire)
{
    InhibitorLock lock(host);
    expectInhibit();
    EXPECT_CALL(host, releaseLock(_)).Times(1);

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i)
    {
        threads.emplace_back([&lock]() { EXPECT_EQ(lock.acquire(), std::nullopt); });
    }
    for (auto& t : threads)
    {
        t.join();
    }

    EXPECT_TRUE(lock.held());
}
