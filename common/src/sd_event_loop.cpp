#include "sd_event_loop.hpp"

#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include <phosphor-logging/lg2.hpp>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <functional>
#include <stdexcept>
#include <string>

PHOSPHOR_LOG2_USING;

namespace systemctl_mqtt
{

SdEventLoop::SdEventLoop(sdbusplus::bus_t& bus) :
    bus(bus), event(sdeventplus::Event::get_default())
{
    wakeupFd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (wakeupFd < 0)
    {
        throw std::runtime_error("eventfd failed: " +
                                 std::string(strerror(errno)));
    }

    wakeupSource = std::make_unique<sdeventplus::source::IO>(
        event, wakeupFd, EPOLLIN,
        [this](sdeventplus::source::IO& /*source*/, int fd,
               uint32_t /*revents*/) {
            uint64_t count = 0;
            if (read(fd, &count, sizeof(count)) < 0 && errno != EAGAIN)
            {
                warning("Reading loop wakeup failed: {ERRNO}", "ERRNO", errno);
            }
            event.exit(0);
        });

    sigtermSource = std::make_unique<sdeventplus::source::Signal>(
        event, SIGTERM,
        std::bind_front(&SdEventLoop::onSignal, this));
    sigintSource = std::make_unique<sdeventplus::source::Signal>(
        event, SIGINT,
        std::bind_front(&SdEventLoop::onSignal, this));

    // Attach the bus to sd_event to service the signal matches
    bus.attach_event(event.get(), SD_EVENT_PRIORITY_NORMAL);
}

SdEventLoop::~SdEventLoop()
{
    bus.detach_event();
    sigintSource.reset();
    sigtermSource.reset();
    wakeupSource.reset();
    if (wakeupFd >= 0)
    {
        close(wakeupFd);
    }
}

void SdEventLoop::run()
{
    debug("Starting signal loop");
    event.loop();
    debug("Signal loop stopped");
}

void SdEventLoop::exit()
{
    const uint64_t one = 1;
    if (write(wakeupFd, &one, sizeof(one)) < 0)
    {
        error("Waking up signal loop failed: {ERRNO}", "ERRNO", errno);
    }
}

void SdEventLoop::blockTerminationSignals()
{
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGINT);

    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0)
    {
        throw std::runtime_error("pthread_sigmask failed: " +
                                 std::string(strerror(rc)));
    }
}

void SdEventLoop::onSignal(sdeventplus::source::Signal& /*source*/,
                           const struct signalfd_siginfo* siginfo)
{
    info("Received signal {SIGNAL}, terminating", "SIGNAL",
         siginfo->ssi_signo);
    event.exit(0);
}

} // namespace systemctl_mqtt
