#include "message_dispatcher.hpp"

#include "errors.hpp"
#include "shutdown_signal_watcher.hpp"
#include "utils.hpp"

#include <phosphor-logging/lg2.hpp>

#include <exception>

PHOSPHOR_LOG2_USING;

namespace systemctl_mqtt::bridge
{

MessageDispatcher::MessageDispatcher(const ActionRegistry& registry,
                                     host::HostControl& host,
                                     InhibitorLock& lock,
                                     mqtt::MqttClient& mqtt,
                                     const std::string& topicPrefix) :
    registry(registry), host(host), lock(lock), mqtt(mqtt),
    topicPrefix(topicPrefix)
{}

std::string MessageDispatcher::topic(const std::string& suffix) const
{
    return topicPrefix + "/" + suffix;
}

void MessageDispatcher::onConnect()
{
    debug("connected to MQTT broker");

    for (const auto& [suffix, action] : registry.entries())
    {
        const auto actionTopic = topic(suffix);
        info("subscribing to {TOPIC}", "TOPIC", actionTopic);
        mqtt.subscribe(actionTopic, subscribeQos);
        debug("registered MQTT callback for topic {TOPIC} triggering {ACTION}",
              "TOPIC", actionTopic, "ACTION", action.name);
    }

    // A lock held across a reconnect is kept
    if (lock.acquire())
    {
        warning("continuing without delaying shutdowns");
    }

    bool preparing = false;
    try
    {
        preparing = host.preparingForShutdown();
    }
    catch (const HostError& e)
    {
        warning("failed to read shutdown state: {ERROR}", "ERROR", e);
        return;
    }
    reportPreparingForShutdown(mqtt, topic(preparingForShutdownSuffix),
                               preparing);
}

DispatchResult MessageDispatcher::onMessage(const mqtt::InboundMessage& msg)
{
    debug("received topic={TOPIC} payload={PAYLOAD}", "TOPIC", msg.topic,
          "PAYLOAD", utils::formatPayload(msg.payload));

    // Retained messages are stale commands, e.g. a poweroff replayed on
    // every reconnect
    if (msg.retained)
    {
        info("ignoring retained message");
        return {DispatchOutcome::IgnoredRetained, {}, {}};
    }

    const auto prefix = topicPrefix + "/";
    if (!msg.topic.starts_with(prefix))
    {
        warning("ignoring message on unexpected topic {TOPIC}", "TOPIC",
                msg.topic);
        return {DispatchOutcome::UnknownTopic, {}, {}};
    }

    const auto* action = registry.resolve(msg.topic.substr(prefix.size()));
    if (action == nullptr)
    {
        warning("no action registered for topic {TOPIC}", "TOPIC", msg.topic);
        return {DispatchOutcome::UnknownTopic, {}, {}};
    }

    debug("executing action {ACTION}", "ACTION", action->name);
    try
    {
        action->invoke(host, msg.payload);
    }
    catch (const Unauthorized& e)
    {
        error(
            "failed to execute {ACTION}: unauthorized; missing polkit authorization rules?",
            "ACTION", action->name);
        return {DispatchOutcome::Unauthorized, action->name, e.what()};
    }
    catch (const std::exception& e)
    {
        error("failed to execute {ACTION}: {ERROR}", "ACTION", action->name,
              "ERROR", e);
        return {DispatchOutcome::Failed, action->name, e.what()};
    }
    debug("completed action {ACTION}", "ACTION", action->name);
    return {DispatchOutcome::Completed, action->name, {}};
}

} // namespace systemctl_mqtt::bridge
