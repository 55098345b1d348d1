#pragma once

#include "mqtt_client.hpp"

#include <condition_variable>
#include <mutex>

#include <gmock/gmock.h>

namespace systemctl_mqtt::test
{

class MockMqttClient : public mqtt::MqttClient
{
  public:
    MOCK_METHOD(void, setHandlers,
                (mqtt::ConnectHandler onConnect,
                 mqtt::MessageHandler onMessage),
                (override));
    MOCK_METHOD(void, connect, (const mqtt::ConnectOptions& options),
                (override));
    MOCK_METHOD(void, subscribe, (const std::string& topic, int qos),
                (override));
    MOCK_METHOD(void, publish,
                (const std::string& topic, const std::string& payload, int qos,
                 bool retain),
                (override));
    MOCK_METHOD(void, loopForever, (), (override));
    MOCK_METHOD(void, stop, (), (override));
};

// Blocks like a network loop until released from another thread
class BlockingLoop
{
  public:
    void wait()
    {
        std::unique_lock lock(mutex);
        cv.wait(lock, [this] { return released; });
    }

    void release()
    {
        {
            std::lock_guard lock(mutex);
            released = true;
        }
        cv.notify_all();
    }

  private:
    std::mutex mutex;
    std::condition_variable cv;
    bool released = false;
};

} // namespace systemctl_mqtt::test
