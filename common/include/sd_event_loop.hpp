#pragma once

#include "event_loop.hpp"

#include <sys/signalfd.h>

#include <sdbusplus/bus.hpp>
#include <sdeventplus/event.hpp>
#include <sdeventplus/source/io.hpp>
#include <sdeventplus/source/signal.hpp>

#include <memory>

namespace systemctl_mqtt
{

/** @class SdEventLoop
 *
 *  @brief sd-event loop servicing the signal loop's D-Bus connection.
 *
 *  SIGTERM and SIGINT are delivered through signalfd sources and end the
 *  loop. They must be blocked in every thread before the loop is created,
 *  see blockTerminationSignals().
 */
class SdEventLoop : public EventLoop
{
  public:
    explicit SdEventLoop(sdbusplus::bus_t& bus);

    SdEventLoop(const SdEventLoop&) = delete;
    SdEventLoop& operator=(const SdEventLoop&) = delete;
    SdEventLoop(SdEventLoop&&) = delete;
    SdEventLoop& operator=(SdEventLoop&&) = delete;

    ~SdEventLoop() override;

    void run() override;
    void exit() override;

    // Blocks SIGTERM and SIGINT for the calling thread and the threads it
    // spawns afterwards
    static void blockTerminationSignals();

  private:
    void onSignal(sdeventplus::source::Signal& source,
                  const struct signalfd_siginfo* siginfo);

    sdbusplus::bus_t& bus;

    sdeventplus::Event event;

    // Written by exit() to wake the loop from another thread
    int wakeupFd = -1;

    std::unique_ptr<sdeventplus::source::IO> wakeupSource;
    std::unique_ptr<sdeventplus::source::Signal> sigtermSource;
    std::unique_ptr<sdeventplus::source::Signal> sigintSource;
};

} // namespace systemctl_mqtt
