#include "bridge_runtime.hpp"

#include "errors.hpp"

#include <phosphor-logging/lg2.hpp>

#include <exception>

PHOSPHOR_LOG2_USING;

namespace systemctl_mqtt::bridge
{

BridgeRuntime::BridgeRuntime(const BridgeConfig& config,
                             mqtt::MqttClient& mqtt, host::HostControl& host,
                             host::HostSignalSource& signals,
                             EventLoop& loop) :
    config(config), mqtt(mqtt), loop(loop), registry(config.actions),
    lock(host), dispatcher(registry, host, lock, mqtt, config.topicPrefix),
    watcher(signals, lock, mqtt,
            dispatcher.topic(preparingForShutdownSuffix))
{}

BridgeRuntime::~BridgeRuntime()
{
    if (networkThread.joinable())
    {
        mqtt.stop();
        networkThread.join();
    }
}

void BridgeRuntime::run()
{
    config.validate();

    currentState = BridgeState::Connecting;

    const auto options = config.connectOptions();
    info("connecting to MQTT broker {HOST}:{PORT}", "HOST", options.host,
         "PORT", options.port);

    mqtt.setHandlers([this]() { handleConnect(); },
                     [this](const mqtt::InboundMessage& msg) {
                         handleMessage(msg);
                     });

    try
    {
        mqtt.connect(options);
    }
    catch (const ConnectionError& e)
    {
        error("failed to connect to MQTT broker: {ERROR}", "ERROR", e);
        currentState = BridgeState::Stopped;
        throw;
    }

    try
    {
        watcher.start();
    }
    catch (const std::exception& e)
    {
        error("failed to watch for shutdowns: {ERROR}", "ERROR", e);
        mqtt.stop();
        currentState = BridgeState::Stopped;
        throw;
    }

    networkThread = std::thread([this]() {
        mqtt.loopForever();
        if (!terminating())
        {
            error("MQTT network loop ended unexpectedly");
            requestStop();
        }
    });

    try
    {
        loop.run();
    }
    catch (const std::exception& e)
    {
        error("signal loop failed: {ERROR}", "ERROR", e);
        terminate();
        throw;
    }

    terminate();
}

void BridgeRuntime::requestStop()
{
    auto state = currentState.load();
    while (state != BridgeState::Terminating && state != BridgeState::Stopped)
    {
        if (currentState.compare_exchange_weak(state,
                                               BridgeState::Terminating))
        {
            break;
        }
    }
    loop.exit();
}

void BridgeRuntime::terminate()
{
    currentState = BridgeState::Terminating;

    debug("stopping MQTT network loop");
    mqtt.stop();
    if (networkThread.joinable())
    {
        networkThread.join();
    }

    watcher.stop();

    if (lock.release())
    {
        warning("shutdown lock could not be released cleanly");
    }

    currentState = BridgeState::Stopped;
    info("bridge stopped");
}

bool BridgeRuntime::terminating() const
{
    auto state = currentState.load();
    return state == BridgeState::Terminating || state == BridgeState::Stopped;
}

void BridgeRuntime::handleConnect()
{
    auto expected = currentState.load();
    if (expected == BridgeState::Terminating ||
        expected == BridgeState::Stopped ||
        !currentState.compare_exchange_strong(expected,
                                              BridgeState::Subscribing))
    {
        debug("ignoring connect while terminating");
        return;
    }

    dispatcher.onConnect();

    expected = BridgeState::Subscribing;
    currentState.compare_exchange_strong(expected, BridgeState::Running);
}

void BridgeRuntime::handleMessage(const mqtt::InboundMessage& msg)
{
    if (terminating())
    {
        debug("dropping message on {TOPIC} while terminating", "TOPIC",
              msg.topic);
        return;
    }

    dispatcher.onMessage(msg);
}

} // namespace systemctl_mqtt::bridge
