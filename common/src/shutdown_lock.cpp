#include "shutdown_lock.hpp"

#include <unistd.h>

namespace systemctl_mqtt::host
{

void ShutdownLock::reset() noexcept
{
    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
}

} // namespace systemctl_mqtt::host
