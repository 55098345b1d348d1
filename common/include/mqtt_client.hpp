#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace systemctl_mqtt::mqtt
{

struct InboundMessage
{
    std::string topic;
    std::string payload;
    bool retained = false;
};

struct ConnectOptions
{
    std::string host;
    uint16_t port = 0;
    bool tls = true;
    // Only meaningful with tls, verifies the broker certificate's host name
    bool verifyHostname = true;
    std::string caPath;
    std::optional<std::string> username;
    std::optional<std::string> password;
};

using ConnectHandler = std::function<void()>;
using MessageHandler = std::function<void(const InboundMessage&)>;

/** @class MqttClient
 *
 *  @brief MQTT transport with its own network loop.
 *
 *  Handlers run on the thread executing loopForever(), in the order the
 *  broker delivers the events. Reconnecting after a lost connection is up to
 *  the implementation; the connect handler runs again after each reconnect.
 */
class MqttClient
{
  public:
    virtual ~MqttClient() = default;

    virtual void setHandlers(ConnectHandler onConnect,
                             MessageHandler onMessage) = 0;

    // @throws systemctl_mqtt::ConnectionError
    virtual void connect(const ConnectOptions& options) = 0;

    virtual void subscribe(const std::string& topic, int qos) = 0;

    // Queues a message without waiting for it to be sent.
    // @throws systemctl_mqtt::ConnectionError when it cannot be queued
    virtual void publish(const std::string& topic, const std::string& payload,
                         int qos, bool retain) = 0;

    // Blocks running the network loop until stop() is called
    virtual void loopForever() = 0;

    // Makes loopForever() return. Safe to call from any thread.
    virtual void stop() = 0;
};

} // namespace systemctl_mqtt::mqtt
