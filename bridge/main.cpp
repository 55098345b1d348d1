#include "config.h"

#include "bridge_config.hpp"
#include "bridge_runtime.hpp"
#include "errors.hpp"
#include "login_manager.hpp"
#include "mosquitto_client.hpp"
#include "sd_event_loop.hpp"
#include "utils.hpp"

#include <CLI/CLI.hpp>
#include <phosphor-logging/lg2.hpp>
#include <sdbusplus/bus.hpp>
#include <sdbusplus/exception.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <string>

using namespace systemctl_mqtt;

int main(int argc, char** argv)
{
    bridge::BridgeConfig config;
    config.topicPrefix = bridge::defaultTopicPrefix();

    std::string username;
    std::string password;
    std::string passwordFile;
    bool disableTls = false;
    bool disableHostnameVerification = false;
    double poweroffDelaySeconds = 4;
    const auto maxDelaySeconds = static_cast<double>(
        std::chrono::duration_cast<std::chrono::seconds>(utils::maxDuration)
            .count());

    CLI::App app{"MQTT client triggering & reporting shutdown on systemd-based "
                 "systems"};
    app.set_version_flag("--version", SYSTEMCTL_MQTT_VERSION);
    app.add_option("--mqtt-host", config.mqttHost, "MQTT broker host name")
        ->required();
    app.add_option("--mqtt-port", config.mqttPort,
                   "MQTT broker port, default 8883, or 1883 without TLS")
        ->check(CLI::Range(1, 65535));
    app.add_option("--mqtt-username", username, "MQTT user name");
    auto* passwordOpt =
        app.add_option("--mqtt-password", password, "MQTT password");
    app.add_option("--mqtt-password-file", passwordFile,
                   "file containing the MQTT password in its first line")
        ->check(CLI::ExistingFile)
        ->excludes(passwordOpt);
    app.add_flag("--mqtt-disable-tls", disableTls,
                 "connect without TLS, credentials are sent in plain text");
    app.add_flag("--mqtt-disable-hostname-verification",
                 disableHostnameVerification,
                 "do not verify the broker certificate's host name");
    app.add_option("--mqtt-ca-path", config.caPath,
                   "directory of trusted CA certificates")
        ->capture_default_str();
    app.add_option("--mqtt-topic-prefix", config.topicPrefix,
                   "prefix of all MQTT topics")
        ->capture_default_str();
    app.add_option("--poweroff-delay-seconds", poweroffDelaySeconds,
                   "delay between a poweroff or reboot request and its "
                   "execution")
        ->check(CLI::Range(0.0, maxDelaySeconds))
        ->capture_default_str();
    app.add_option("--control-system-unit", config.actions.controlledUnits,
                   "systemd unit to provide a start topic for, repeatable");

    CLI11_PARSE(app, argc, argv);

    config.tls = !disableTls;
    config.verifyHostname = !disableHostnameVerification;
    config.actions.poweroffDelay = std::chrono::milliseconds(
        static_cast<int64_t>(poweroffDelaySeconds * 1000));

    try
    {
        if (!username.empty())
        {
            config.username = username;
        }
        if (!passwordFile.empty())
        {
            config.password = bridge::readPasswordFile(passwordFile);
        }
        else if (!password.empty())
        {
            config.password = password;
        }

        // Signals are taken by the signal loop, the network thread must
        // inherit the blocked mask
        SdEventLoop::blockTerminationSignals();

        host::LoginManager loginManager(sdbusplus::bus::new_system());

        auto signalBus = sdbusplus::bus::new_system();
        host::LoginSignalSource signals(signalBus);
        SdEventLoop loop(signalBus);

        mqtt::MosquittoClient mqttClient("");

        bridge::BridgeRuntime runtime(config, mqttClient, loginManager,
                                      signals, loop);
        runtime.run();
    }
    catch (const ConfigurationError& e)
    {
        lg2::error("Invalid configuration: {ERROR}", "ERROR", e);
        return 2;
    }
    catch (const ConnectionError& e)
    {
        lg2::error("MQTT connection failed: {ERROR}", "ERROR", e);
        return 1;
    }
    catch (const sdbusplus::exception_t& e)
    {
        lg2::error("D-Bus setup failed: {ERROR}", "ERROR", e);
        return 1;
    }
    catch (const std::exception& e)
    {
        lg2::error("Bridge failed: {ERROR}", "ERROR", e);
        return 1;
    }

    return 0;
}
