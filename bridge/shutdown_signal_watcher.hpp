#pragma once

#include "host_signal.hpp"
#include "inhibitor_lock.hpp"
#include "mqtt_client.hpp"

#include <string>

namespace systemctl_mqtt::bridge
{

// Suffix of the topic announcing an upcoming shutdown
constexpr auto preparingForShutdownSuffix = "preparing-for-shutdown";

/**
 * @brief Publishes "true" or "false" retained on the topic.
 *
 * Best effort: the message is only queued, a failure is logged and
 * swallowed so the caller never waits on the network.
 */
void reportPreparingForShutdown(mqtt::MqttClient& mqtt,
                                const std::string& topic, bool preparing);

/** @class ShutdownSignalWatcher
 *
 *  @brief Lets a pending host shutdown proceed once it has been reported.
 *
 *  Runs on the signal loop. On "shutdown starting" the state is reported on
 *  MQTT and the inhibitor lock released, letting the host go on. On
 *  "cancelled" the lock is taken again so the next shutdown is delayed too.
 */
class ShutdownSignalWatcher
{
  public:
    ShutdownSignalWatcher(host::HostSignalSource& signals, InhibitorLock& lock,
                          mqtt::MqttClient& mqtt, const std::string& topic);

    ShutdownSignalWatcher(const ShutdownSignalWatcher&) = delete;
    ShutdownSignalWatcher& operator=(const ShutdownSignalWatcher&) = delete;
    ShutdownSignalWatcher(ShutdownSignalWatcher&&) = delete;
    ShutdownSignalWatcher& operator=(ShutdownSignalWatcher&&) = delete;
    ~ShutdownSignalWatcher() = default;

    void start();
    void stop();

    /** @brief Handles one PrepareForShutdown notification
     *
     *  @param[in] starting - true if the shutdown starts, false if the host
     *                        cancelled it
     */
    void handlePrepareForShutdown(bool starting);

  private:
    host::HostSignalSource& signals;
    InhibitorLock& lock;
    mqtt::MqttClient& mqtt;

    /** @brief topic the shutdown state is published on */
    const std::string topic;

    /** @brief set between "starting" and "cancelled", signal loop only */
    bool shutdownInProgress = false;
};

} // namespace systemctl_mqtt::bridge
