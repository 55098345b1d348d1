#include "bridge_config.hpp"

#include "errors.hpp"
#include "utils.hpp"

#include <chrono>
#include <fstream>

namespace systemctl_mqtt::bridge
{

void BridgeConfig::validate() const
{
    if (mqttHost.empty())
    {
        throw ConfigurationError("MQTT broker host missing");
    }

    if (password && !username)
    {
        throw ConfigurationError("MQTT password given without username");
    }

    if (topicPrefix.empty() || topicPrefix.ends_with('/'))
    {
        throw ConfigurationError("invalid MQTT topic prefix: '" + topicPrefix +
                                 "'");
    }

    if (topicPrefix.find_first_of("+#") != std::string::npos)
    {
        throw ConfigurationError(
            "MQTT topic prefix must not contain wildcards: '" + topicPrefix +
            "'");
    }

    if (actions.poweroffDelay < std::chrono::milliseconds::zero() ||
        actions.poweroffDelay > utils::maxDuration)
    {
        throw ConfigurationError("poweroff delay out of range");
    }

    for (const auto& unit : actions.controlledUnits)
    {
        if (unit.empty() || unit.find_first_of("/+#") != std::string::npos)
        {
            throw ConfigurationError("invalid unit name: '" + unit + "'");
        }
    }
}

uint16_t BridgeConfig::port() const
{
    if (mqttPort != 0)
    {
        return mqttPort;
    }
    return tls ? defaultTlsPort : defaultPlainPort;
}

mqtt::ConnectOptions BridgeConfig::connectOptions() const
{
    mqtt::ConnectOptions options;
    options.host = mqttHost;
    options.port = port();
    options.tls = tls;
    options.verifyHostname = verifyHostname;
    options.caPath = caPath;
    options.username = username;
    options.password = password;
    return options;
}

std::string defaultTopicPrefix()
{
    return "systemctl/" + utils::getHostname();
}

std::string readPasswordFile(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        throw ConfigurationError("failed to open password file " + path);
    }

    std::string password;
    std::getline(file, password);
    if (!password.empty() && password.back() == '\r')
    {
        password.pop_back();
    }
    return password;
}

} // namespace systemctl_mqtt::bridge
