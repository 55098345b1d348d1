#pragma once

#include "mqtt_client.hpp"

#include <mosquitto.h>

#include <mutex>

namespace systemctl_mqtt::mqtt
{

/** @class MosquittoClient
 *
 *  @brief MqttClient on top of libmosquitto.
 *
 *  libmosquitto reconnects on its own inside loopForever(); the connect
 *  handler runs after every successful (re)connect.
 */
class MosquittoClient : public MqttClient
{
  public:
    explicit MosquittoClient(const std::string& clientId);

    MosquittoClient(const MosquittoClient&) = delete;
    MosquittoClient& operator=(const MosquittoClient&) = delete;
    MosquittoClient(MosquittoClient&&) = delete;
    MosquittoClient& operator=(MosquittoClient&&) = delete;

    ~MosquittoClient() override;

    void setHandlers(ConnectHandler onConnect,
                     MessageHandler onMessage) override;
    void connect(const ConnectOptions& options) override;
    void subscribe(const std::string& topic, int qos) override;
    void publish(const std::string& topic, const std::string& payload,
                 int qos, bool retain) override;
    void loopForever() override;
    void stop() override;

  private:
    static void onConnectCallback(struct mosquitto* mosq, void* userdata,
                                  int rc);
    static void onDisconnectCallback(struct mosquitto* mosq, void* userdata,
                                     int rc);
    static void onMessageCallback(struct mosquitto* mosq, void* userdata,
                                  const struct mosquitto_message* message);

    struct mosquitto* mosq = nullptr;

    ConnectHandler connectHandler;
    MessageHandler messageHandler;

    std::string brokerHost;
    uint16_t brokerPort = 0;

    std::mutex stopMutex;
    bool stopRequested = false;
};

} // namespace systemctl_mqtt::mqtt
