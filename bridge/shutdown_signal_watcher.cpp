#include "shutdown_signal_watcher.hpp"

#include "errors.hpp"

#include <phosphor-logging/lg2.hpp>

PHOSPHOR_LOG2_USING;

namespace systemctl_mqtt::bridge
{

void reportPreparingForShutdown(mqtt::MqttClient& mqtt,
                                const std::string& topic, bool preparing)
{
    const std::string payload = preparing ? "true" : "false";
    try
    {
        mqtt.publish(topic, payload, 0, true);
        debug("published {PAYLOAD} on {TOPIC}", "PAYLOAD", payload, "TOPIC",
              topic);
    }
    catch (const ConnectionError& e)
    {
        warning("failed to publish {PAYLOAD} on {TOPIC}: {ERROR}", "PAYLOAD",
                payload, "TOPIC", topic, "ERROR", e);
    }
}

ShutdownSignalWatcher::ShutdownSignalWatcher(host::HostSignalSource& signals,
                                             InhibitorLock& lock,
                                             mqtt::MqttClient& mqtt,
                                             const std::string& topic) :
    signals(signals), lock(lock), mqtt(mqtt), topic(topic)
{}

void ShutdownSignalWatcher::start()
{
    signals.subscribe(
        [this](bool starting) { handlePrepareForShutdown(starting); });
}

void ShutdownSignalWatcher::stop()
{
    signals.unsubscribe();
}

void ShutdownSignalWatcher::handlePrepareForShutdown(bool starting)
{
    if (starting)
    {
        if (shutdownInProgress)
        {
            debug("ignoring repeated shutdown notification");
            return;
        }
        shutdownInProgress = true;

        info("system preparing for shutdown");
        reportPreparingForShutdown(mqtt, topic, true);
        // Releasing the lock lets the host proceed with the shutdown
        if (lock.release())
        {
            warning("shutdown lock could not be released cleanly");
        }
        return;
    }

    shutdownInProgress = false;
    info("system shutdown cancelled");
    if (lock.acquire())
    {
        warning("next shutdown will not be delayed");
    }
    reportPreparingForShutdown(mqtt, topic, false);
}

} // namespace systemctl_mqtt::bridge
