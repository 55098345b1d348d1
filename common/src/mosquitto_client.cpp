#include "mosquitto_client.hpp"

#include "errors.hpp"

#include <phosphor-logging/lg2.hpp>

#include <cerrno>
#include <cstring>
#include <exception>

PHOSPHOR_LOG2_USING;

namespace systemctl_mqtt::mqtt
{

constexpr int keepaliveSeconds = 60;
constexpr unsigned int reconnectDelayMin = 1;
constexpr unsigned int reconnectDelayMax = 30;

static std::string describe(int rc)
{
    if (rc == MOSQ_ERR_ERRNO)
    {
        return strerror(errno);
    }
    return mosquitto_strerror(rc);
}

MosquittoClient::MosquittoClient(const std::string& clientId)
{
    static std::once_flag libInit;
    std::call_once(libInit, [] { mosquitto_lib_init(); });

    mosq = mosquitto_new(clientId.empty() ? nullptr : clientId.c_str(), true,
                         this);
    if (mosq == nullptr)
    {
        throw ConnectionError("failed to create MQTT client: " +
                              std::string(strerror(errno)));
    }

    mosquitto_threaded_set(mosq, true);
    mosquitto_reconnect_delay_set(mosq, reconnectDelayMin, reconnectDelayMax,
                                  true);
    mosquitto_connect_callback_set(mosq, onConnectCallback);
    mosquitto_disconnect_callback_set(mosq, onDisconnectCallback);
    mosquitto_message_callback_set(mosq, onMessageCallback);
}

MosquittoClient::~MosquittoClient()
{
    mosquitto_destroy(mosq);
}

void MosquittoClient::setHandlers(ConnectHandler onConnect,
                                  MessageHandler onMessage)
{
    connectHandler = std::move(onConnect);
    messageHandler = std::move(onMessage);
}

void MosquittoClient::connect(const ConnectOptions& options)
{
    int rc = MOSQ_ERR_SUCCESS;

    if (options.username)
    {
        rc = mosquitto_username_pw_set(
            mosq, options.username->c_str(),
            options.password ? options.password->c_str() : nullptr);
        if (rc != MOSQ_ERR_SUCCESS)
        {
            throw ConnectionError("failed to set MQTT credentials: " +
                                  describe(rc));
        }
    }

    if (options.tls)
    {
        rc = mosquitto_tls_set(mosq, nullptr, options.caPath.c_str(), nullptr,
                               nullptr, nullptr);
        if (rc != MOSQ_ERR_SUCCESS)
        {
            throw ConnectionError("failed to enable TLS: " + describe(rc));
        }

        rc = mosquitto_tls_insecure_set(mosq, !options.verifyHostname);
        if (rc != MOSQ_ERR_SUCCESS)
        {
            throw ConnectionError("failed to configure TLS: " + describe(rc));
        }
    }

    brokerHost = options.host;
    brokerPort = options.port;

    rc = mosquitto_connect(mosq, options.host.c_str(), options.port,
                           keepaliveSeconds);
    if (rc != MOSQ_ERR_SUCCESS)
    {
        throw ConnectionError("failed to connect to MQTT broker " +
                              options.host + ":" +
                              std::to_string(options.port) + ": " +
                              describe(rc));
    }
}

void MosquittoClient::subscribe(const std::string& topic, int qos)
{
    int rc = mosquitto_subscribe(mosq, nullptr, topic.c_str(), qos);
    if (rc != MOSQ_ERR_SUCCESS)
    {
        error("Failed to subscribe to {TOPIC}: {ERROR}", "TOPIC", topic,
              "ERROR", describe(rc));
    }
}

void MosquittoClient::publish(const std::string& topic,
                              const std::string& payload, int qos, bool retain)
{
    int rc = mosquitto_publish(mosq, nullptr, topic.c_str(),
                               static_cast<int>(payload.size()),
                               payload.data(), qos, retain);
    if (rc != MOSQ_ERR_SUCCESS)
    {
        throw ConnectionError("failed to publish on " + topic + ": " +
                              describe(rc));
    }
}

void MosquittoClient::loopForever()
{
    {
        std::lock_guard lock(stopMutex);
        if (stopRequested)
        {
            return;
        }
    }

    int rc = mosquitto_loop_forever(mosq, -1, 1);
    if (rc != MOSQ_ERR_SUCCESS)
    {
        error("MQTT network loop for {HOST}:{PORT} stopped: {ERROR}", "HOST",
              brokerHost, "PORT", brokerPort, "ERROR", describe(rc));
    }
}

void MosquittoClient::stop()
{
    std::lock_guard lock(stopMutex);
    stopRequested = true;
    // makes mosquitto_loop_forever() return instead of reconnecting
    int rc = mosquitto_disconnect(mosq);
    if (rc != MOSQ_ERR_SUCCESS && rc != MOSQ_ERR_NO_CONN)
    {
        warning("Disconnecting from MQTT broker failed: {ERROR}", "ERROR",
                describe(rc));
    }
}

void MosquittoClient::onConnectCallback(struct mosquitto* /*mosq*/,
                                        void* userdata, int rc)
{
    auto* client = static_cast<MosquittoClient*>(userdata);
    if (rc != 0)
    {
        error("MQTT broker {HOST}:{PORT} refused connection: {ERROR}", "HOST",
              client->brokerHost, "PORT", client->brokerPort, "ERROR",
              std::string(mosquitto_connack_string(rc)));
        return;
    }

    if (!client->connectHandler)
    {
        return;
    }

    try
    {
        client->connectHandler();
    }
    catch (const std::exception& e)
    {
        error("MQTT connect handler failed: {ERROR}", "ERROR", e);
    }
}

void MosquittoClient::onDisconnectCallback(struct mosquitto* /*mosq*/,
                                           void* userdata, int rc)
{
    auto* client = static_cast<MosquittoClient*>(userdata);
    if (rc == 0)
    {
        debug("Disconnected from MQTT broker {HOST}:{PORT}", "HOST",
              client->brokerHost, "PORT", client->brokerPort);
        return;
    }
    warning("Lost connection to MQTT broker {HOST}:{PORT}: {ERROR}", "HOST",
            client->brokerHost, "PORT", client->brokerPort, "ERROR",
            describe(rc));
}

void MosquittoClient::onMessageCallback(
    struct mosquitto* /*mosq*/, void* userdata,
    const struct mosquitto_message* message)
{
    auto* client = static_cast<MosquittoClient*>(userdata);
    if (!client->messageHandler || message == nullptr)
    {
        return;
    }

    InboundMessage msg;
    msg.topic = message->topic != nullptr ? message->topic : "";
    if (message->payload != nullptr && message->payloadlen > 0)
    {
        msg.payload.assign(static_cast<const char*>(message->payload),
                           static_cast<size_t>(message->payloadlen));
    }
    msg.retained = message->retain;

    try
    {
        client->messageHandler(msg);
    }
    catch (const std::exception& e)
    {
        error("MQTT message handler failed for {TOPIC}: {ERROR}", "TOPIC",
              msg.topic, "ERROR", e);
    }
}

} // namespace systemctl_mqtt::mqtt
