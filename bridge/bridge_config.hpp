#pragma once

#include "action_registry.hpp"
#include "mqtt_client.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace systemctl_mqtt::bridge
{

constexpr uint16_t defaultTlsPort = 8883;
constexpr uint16_t defaultPlainPort = 1883;

/* Everything the bridge is configured with, as given on the command line.
 */
struct BridgeConfig
{
    std::string mqttHost;

    // 0 selects the default port for the TLS setting
    uint16_t mqttPort = 0;

    bool tls = true;

    // Verify the broker certificate's host name, only with tls
    bool verifyHostname = true;

    std::string caPath = "/etc/ssl/certs";

    std::optional<std::string> username;
    std::optional<std::string> password;

    // Topics are <topicPrefix>/<suffix>
    std::string topicPrefix;

    ActionSettings actions;

    // @throws ConfigurationError    if the configuration is unusable
    void validate() const;

    // @returns     the configured port, or the default one for the TLS setting
    uint16_t port() const;

    mqtt::ConnectOptions connectOptions() const;
};

// @returns     systemctl/<hostname>
std::string defaultTopicPrefix();

/**
 * @brief Reads a password from the first line of a file.
 *
 * @throws ConfigurationError if the file cannot be read
 */
std::string readPasswordFile(const std::string& path);

} // namespace systemctl_mqtt::bridge
