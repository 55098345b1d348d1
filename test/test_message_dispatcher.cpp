#include "action_registry.hpp"
#include "errors.hpp"
#include "inhibitor_lock.hpp"
#include "message_dispatcher.hpp"
#include "mocks/mock_host_control.hpp"
#include "mocks/mock_mqtt_client.hpp"

#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace systemctl_mqtt;
using namespace systemctl_mqtt::bridge;
using ::testing::_;
using ::testing::Expectation;
using ::testing::ExpectationSet;
using ::testing::InvokeWithoutArgs;
using ::testing::Return;
using ::testing::StartsWith;
using ::testing::StrictMock;
using ::testing::Throw;

class MessageDispatcherTest : public testing::Test
{
  protected:
    MessageDispatcherTest() :
        registry(ActionSettings{}), lock(host),
        dispatcher(registry, host, lock, mqtt, "system/command")
    {}

    static mqtt::InboundMessage message(const std::string& topic,
                                        const std::string& payload = "",
                                        bool retained = false)
    {
        return mqtt::InboundMessage{topic, payload, retained};
    }

    StrictMock<test::MockHostControl> host;
    StrictMock<test::MockMqttClient> mqtt;
    ActionRegistry registry;
    InhibitorLock lock;
    MessageDispatcher dispatcher;
};

TEST_F(MessageDispatcherTest, topicJoinsPrefix)
{
    EXPECT_EQ(dispatcher.topic("poweroff"), "system/command/poweroff");
}

TEST_F(MessageDispatcherTest, connectSubscribesBeforeLocking)
{
    ExpectationSet subscribed;
    for (const auto& [suffix, action] : registry.entries())
    {
        subscribed += EXPECT_CALL(mqtt, subscribe("system/command/" + suffix,
                                                  MessageDispatcher::subscribeQos));
    }
    Expectation locked = EXPECT_CALL(host, inhibit(_, _, _, _))
                      .After(subscribed)
                      .WillOnce(InvokeWithoutArgs(&test::makeShutdownLock));
    Expectation queried = EXPECT_CALL(host, preparingForShutdown())
                       .After(locked)
                       .WillOnce(Return(false));
    EXPECT_CALL(mqtt, publish("system/command/preparing-for-shutdown", "false",
                              0, true))
        .After(queried);
    EXPECT_CALL(host, releaseLock(_));

    dispatcher.onConnect();

    EXPECT_TRUE(lock.held());
}

TEST_F(MessageDispatcherTest, reconnectKeepsLock)
{
    EXPECT_CALL(mqtt, subscribe(StartsWith("system/command/"), 0))
        .Times(2 * static_cast<int>(registry.entries().size()));
    EXPECT_CALL(host, inhibit(_, _, _, _))
        .WillOnce(InvokeWithoutArgs(&test::makeShutdownLock));
    EXPECT_CALL(host, preparingForShutdown())
        .Times(2)
        .WillRepeatedly(Return(false));
    EXPECT_CALL(mqtt, publish(_, "false", 0, true)).Times(2);
    EXPECT_CALL(host, releaseLock(_)).Times(1);

    dispatcher.onConnect();
    dispatcher.onConnect();
}

TEST_F(MessageDispatcherTest, connectWithoutLockStillSubscribes)
{
    EXPECT_CALL(mqtt, subscribe(StartsWith("system/command/"), 0))
        .Times(static_cast<int>(registry.entries().size()));
    EXPECT_CALL(host, inhibit(_, _, _, _))
        .WillOnce(Throw(Unauthorized("Access denied")));
    EXPECT_CALL(host, preparingForShutdown()).WillOnce(Return(true));
    EXPECT_CALL(mqtt,
                publish("system/command/preparing-for-shutdown", "true", 0, true));

    dispatcher.onConnect();

    EXPECT_FALSE(lock.held());
}

TEST_F(MessageDispatcherTest, connectWithUnreadableStateSkipsReport)
{
    EXPECT_CALL(mqtt, subscribe(_, 0))
        .Times(static_cast<int>(registry.entries().size()));
    EXPECT_CALL(host, inhibit(_, _, _, _))
        .WillOnce(InvokeWithoutArgs(&test::makeShutdownLock));
    EXPECT_CALL(host, preparingForShutdown())
        .WillOnce(Throw(HostError("org.freedesktop.DBus.Error.NoReply")));
    EXPECT_CALL(host, releaseLock(_));

    dispatcher.onConnect();
}

TEST_F(MessageDispatcherTest, poweroffMessageSchedulesOnce)
{
    EXPECT_CALL(host, scheduleShutdown(host::ShutdownAction::Poweroff, _))
        .Times(1);
    EXPECT_CALL(host, listInhibitors())
        .WillOnce(Return(std::vector<host::InhibitorInfo>{}));

    auto result = dispatcher.onMessage(message("system/command/poweroff"));

    EXPECT_EQ(result.outcome, DispatchOutcome::Completed);
    EXPECT_EQ(result.action, "poweroff");
    EXPECT_TRUE(result.error.empty());
}

TEST_F(MessageDispatcherTest, retainedMessageIgnored)
{
    auto result =
        dispatcher.onMessage(message("system/command/poweroff", "", true));
    EXPECT_EQ(result.outcome, DispatchOutcome::IgnoredRetained);
    EXPECT_TRUE(result.action.empty());

    result =
        dispatcher.onMessage(message("system/command/suspend", "junk", true));
    EXPECT_EQ(result.outcome, DispatchOutcome::IgnoredRetained);
}

TEST_F(MessageDispatcherTest, unknownTopicIgnored)
{
    for (const auto* topic : {"system/command/hibernate", "system/command",
                              "system/commandpoweroff", "other/poweroff"})
    {
        auto result = dispatcher.onMessage(message(topic));
        EXPECT_EQ(result.outcome, DispatchOutcome::UnknownTopic) << topic;
        EXPECT_TRUE(result.action.empty()) << topic;
    }
}

TEST_F(MessageDispatcherTest, unauthorizedIsNotRetried)
{
    EXPECT_CALL(host, scheduleShutdown(host::ShutdownAction::Poweroff, _))
        .WillOnce(Throw(Unauthorized("Interactive authentication required.")));
    EXPECT_CALL(host, suspend()).Times(1);

    auto result = dispatcher.onMessage(message("system/command/poweroff"));
    EXPECT_EQ(result.outcome, DispatchOutcome::Unauthorized);
    EXPECT_EQ(result.action, "poweroff");
    EXPECT_EQ(result.error, "Interactive authentication required.");

    result = dispatcher.onMessage(message("system/command/suspend"));
    EXPECT_EQ(result.outcome, DispatchOutcome::Completed);
    EXPECT_EQ(result.action, "suspend");
}

TEST_F(MessageDispatcherTest, hostFailureNamesAction)
{
    EXPECT_CALL(host, lockAllSessions())
        .WillOnce(Throw(HostError("org.freedesktop.DBus.Error.NoReply")));

    auto result =
        dispatcher.onMessage(message("system/command/lock-all-sessions"));

    EXPECT_EQ(result.outcome, DispatchOutcome::Failed);
    EXPECT_EQ(result.action, "lock-all-sessions");
    EXPECT_EQ(result.error, "org.freedesktop.DBus.Error.NoReply");
}

TEST_F(MessageDispatcherTest, oversizedPayloadKeepsProcessing)
{
    EXPECT_CALL(host, suspend()).Times(1);

    std::string payload;
    for (int i = 0; i < 50000; ++i)
    {
        payload += "1s";
    }
    auto result = dispatcher.onMessage(
        message("system/command/schedule-poweroff", payload));
    EXPECT_EQ(result.outcome, DispatchOutcome::Failed);
    EXPECT_EQ(result.action, "schedule-poweroff");

    result = dispatcher.onMessage(message("system/command/suspend"));
    EXPECT_EQ(result.outcome, DispatchOutcome::Completed);
}

TEST_F(MessageDispatcherTest, invalidPayloadFails)
{
    auto result = dispatcher.onMessage(
        message("system/command/schedule-reboot", "tomorrow"));

    EXPECT_EQ(result.outcome, DispatchOutcome::Failed);
    EXPECT_EQ(result.action, "schedule-reboot");
    EXPECT_NE(result.error.find("tomorrow"), std::string::npos);
}
