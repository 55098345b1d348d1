#pragma once

namespace systemctl_mqtt
{

/** @class EventLoop
 *
 *  @brief The loop blocking on host notifications.
 */
class EventLoop
{
  public:
    virtual ~EventLoop() = default;

    // Runs until exit() is called or a termination signal arrives
    virtual void run() = 0;

    // Makes run() return. Safe to call from any thread.
    virtual void exit() = 0;
};

} // namespace systemctl_mqtt
