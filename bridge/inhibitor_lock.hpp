#pragma once

#include "host_control.hpp"

#include <mutex>
#include <optional>

namespace systemctl_mqtt::bridge
{

enum class LockError
{
    // The host's policy refused the inhibitor
    DeniedByPolicy,
    // The host could not be reached or failed otherwise
    HostUnavailable,
};

/** @class InhibitorLock
 *
 *  @brief Holds at most one shutdown delay lock obtained from the host.
 *
 *  acquire() and release() may be called from the network loop and the
 *  signal loop concurrently; both are serialised by one mutex. The lock's
 *  descriptor never leaves this class other than through
 *  HostControl::releaseLock().
 */
class InhibitorLock
{
  public:
    static constexpr auto what = "shutdown";
    static constexpr auto who = "systemctl-mqtt";
    static constexpr auto why = "Report shutdown via MQTT";
    static constexpr auto mode = "delay";

    explicit InhibitorLock(host::HostControl& host);

    InhibitorLock(const InhibitorLock&) = delete;
    InhibitorLock& operator=(const InhibitorLock&) = delete;
    InhibitorLock(InhibitorLock&&) = delete;
    InhibitorLock& operator=(InhibitorLock&&) = delete;

    // Releases a lock still held
    ~InhibitorLock();

    // Requests the shutdown delay lock unless it is already held.
    // @returns     std::nullopt when the lock is held afterwards
    std::optional<LockError> acquire();

    // Gives the lock back to the host, letting a pending shutdown proceed.
    // No-op when no lock is held.
    std::optional<LockError> release();

    bool held() const;

  private:
    host::HostControl& host;

    mutable std::mutex mutex;

    std::optional<host::ShutdownLock> lock;
};

} // namespace systemctl_mqtt::bridge
