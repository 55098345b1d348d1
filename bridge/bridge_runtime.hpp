#pragma once

#include "action_registry.hpp"
#include "bridge_config.hpp"
#include "event_loop.hpp"
#include "host_control.hpp"
#include "host_signal.hpp"
#include "inhibitor_lock.hpp"
#include "message_dispatcher.hpp"
#include "mqtt_client.hpp"
#include "shutdown_signal_watcher.hpp"

#include <atomic>
#include <thread>

namespace systemctl_mqtt::bridge
{

enum class BridgeState
{
    Connecting,
    Subscribing,
    Running,
    Terminating,
    Stopped,
};

/** @class BridgeRuntime
 *
 *  @brief Runs the MQTT network loop and the host signal loop side by side.
 *
 *  The network loop gets a thread of its own, the signal loop runs on the
 *  thread calling run(). Ending the signal loop, by a termination signal or
 *  requestStop(), stops the network loop and releases the shutdown lock.
 */
class BridgeRuntime
{
  public:
    BridgeRuntime(const BridgeConfig& config, mqtt::MqttClient& mqtt,
                  host::HostControl& host, host::HostSignalSource& signals,
                  EventLoop& loop);

    BridgeRuntime(const BridgeRuntime&) = delete;
    BridgeRuntime& operator=(const BridgeRuntime&) = delete;
    BridgeRuntime(BridgeRuntime&&) = delete;
    BridgeRuntime& operator=(BridgeRuntime&&) = delete;

    ~BridgeRuntime();

    /** @brief Connects and runs until stopped.
     *
     *  @throws ConfigurationError    before any connection attempt when the
     *                                configuration is unusable
     *  @throws ConnectionError       when the broker cannot be reached
     */
    void run();

    // Ends run(). Safe to call from any thread.
    void requestStop();

    BridgeState state() const
    {
        return currentState.load();
    }

    const InhibitorLock& inhibitorLock() const
    {
        return lock;
    }

  private:
    void handleConnect();
    void handleMessage(const mqtt::InboundMessage& msg);

    // Stops the network loop and waits for it, then drops the signal
    // subscription and the shutdown lock
    void terminate();

    bool terminating() const;

    const BridgeConfig& config;
    mqtt::MqttClient& mqtt;
    EventLoop& loop;

    ActionRegistry registry;
    InhibitorLock lock;
    MessageDispatcher dispatcher;
    ShutdownSignalWatcher watcher;

    std::atomic<BridgeState> currentState = BridgeState::Stopped;

    std::thread networkThread;
};

} // namespace systemctl_mqtt::bridge
