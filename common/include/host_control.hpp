#pragma once

#include "shutdown_lock.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace systemctl_mqtt::host
{

enum class ShutdownAction
{
    Poweroff,
    Reboot,
};

// @returns     the logind name of the action, "poweroff" or "reboot"
const char* toString(ShutdownAction action);

// One entry of logind's ListInhibitors()
struct InhibitorInfo
{
    std::string what;
    std::string who;
    std::string why;
    std::string mode;
    uint32_t uid = 0;
    uint32_t pid = 0;
};

/** @class HostControl
 *
 *  @brief Host power management primitives.
 *
 *  Every method may block on an inter-process call with a bounded timeout.
 *  Failures are reported as systemctl_mqtt::HostError, or
 *  systemctl_mqtt::Unauthorized when the caller lacks the policy to perform
 *  the call.
 */
class HostControl
{
  public:
    virtual ~HostControl() = default;

    // @param action      poweroff or reboot
    // @param when        point in time at which logind shall act
    virtual void scheduleShutdown(
        ShutdownAction action, std::chrono::system_clock::time_point when) = 0;

    // @returns           true if a scheduled shutdown was cancelled
    virtual bool cancelScheduledShutdown() = 0;

    virtual void suspend() = 0;

    virtual void lockAllSessions() = 0;

    virtual std::vector<InhibitorInfo> listInhibitors() = 0;

    // @returns           the lock, held until passed to releaseLock()
    virtual ShutdownLock inhibit(const std::string& what,
                                 const std::string& who,
                                 const std::string& why,
                                 const std::string& mode) = 0;

    // Closes the descriptor of the lock. Calling it for a lock that was
    // released before is a no-op.
    virtual void releaseLock(ShutdownLock& lock) = 0;

    // @returns           logind's PreparingForShutdown property
    virtual bool preparingForShutdown() = 0;

    // Starts a systemd unit in "replace" mode
    virtual void startUnit(const std::string& unit) = 0;
};

} // namespace systemctl_mqtt::host
