#pragma once

#include "action_registry.hpp"
#include "inhibitor_lock.hpp"
#include "mqtt_client.hpp"

#include <string>

namespace systemctl_mqtt::bridge
{

enum class DispatchOutcome
{
    IgnoredRetained,
    UnknownTopic,
    Completed,
    Unauthorized,
    Failed,
};

// What onMessage() did with a message, matching what it logged
struct DispatchResult
{
    DispatchOutcome outcome;

    // Name of the action, empty unless one was resolved
    std::string action;

    // Error text of a failed action
    std::string error;
};

/** @class MessageDispatcher
 *
 *  @brief Maps MQTT messages below the topic prefix to host actions.
 *
 *  Called on the network loop only, one event at a time.
 */
class MessageDispatcher
{
  public:
    // QoS of the action subscriptions, nothing to persist across restarts
    static constexpr int subscribeQos = 0;

    MessageDispatcher(const ActionRegistry& registry, host::HostControl& host,
                      InhibitorLock& lock, mqtt::MqttClient& mqtt,
                      const std::string& topicPrefix);

    MessageDispatcher(const MessageDispatcher&) = delete;
    MessageDispatcher& operator=(const MessageDispatcher&) = delete;
    MessageDispatcher(MessageDispatcher&&) = delete;
    MessageDispatcher& operator=(MessageDispatcher&&) = delete;
    ~MessageDispatcher() = default;

    // Subscribes every action topic, then acquires the shutdown lock and
    // publishes the current shutdown state.
    void onConnect();

    // Runs the action registered for the message's topic. Retained
    // messages are never acted on. Errors of the action are logged.
    DispatchResult onMessage(const mqtt::InboundMessage& msg);

    // @returns     <prefix>/<suffix>
    std::string topic(const std::string& suffix) const;

  private:
    const ActionRegistry& registry;
    host::HostControl& host;
    InhibitorLock& lock;
    mqtt::MqttClient& mqtt;
    const std::string topicPrefix;
};

} // namespace systemctl_mqtt::bridge
