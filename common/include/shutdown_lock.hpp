#pragma once

#include <utility>

namespace systemctl_mqtt::host
{

/** @class ShutdownLock
 *
 *  @brief Owner of the file descriptor backing a logind inhibitor lock.
 *
 *  The lock stays in effect for as long as the descriptor is open. The
 *  descriptor is handed out exactly once through release(); closing it is up
 *  to HostControl::releaseLock(). A lock that was never released is closed
 *  on destruction.
 */
class ShutdownLock
{
  public:
    ShutdownLock() = default;
    explicit ShutdownLock(int fd) : fd(fd) {}

    ShutdownLock(const ShutdownLock&) = delete;
    ShutdownLock& operator=(const ShutdownLock&) = delete;

    ShutdownLock(ShutdownLock&& other) noexcept :
        fd(std::exchange(other.fd, -1))
    {}

    ShutdownLock& operator=(ShutdownLock&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            fd = std::exchange(other.fd, -1);
        }
        return *this;
    }

    ~ShutdownLock()
    {
        reset();
    }

    /** @brief Whether a descriptor is still owned */
    bool valid() const noexcept
    {
        return fd >= 0;
    }

    int get() const noexcept
    {
        return fd;
    }

    /** @brief Give up ownership of the descriptor
     *
     *  @returns the descriptor, or -1 if it was already given up
     */
    int release() noexcept
    {
        return std::exchange(fd, -1);
    }

  private:
    void reset() noexcept;

    int fd = -1;
};

} // namespace systemctl_mqtt::host
