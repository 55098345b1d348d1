#include "inhibitor_lock.hpp"

#include "errors.hpp"

#include <phosphor-logging/lg2.hpp>

PHOSPHOR_LOG2_USING;

namespace systemctl_mqtt::bridge
{

InhibitorLock::InhibitorLock(host::HostControl& host) : host(host) {}

InhibitorLock::~InhibitorLock()
{
    release();
}

std::optional<LockError> InhibitorLock::acquire()
{
    std::lock_guard guard(mutex);

    if (lock)
    {
        debug("shutdown lock already held");
        return std::nullopt;
    }

    try
    {
        lock = host.inhibit(what, who, why, mode);
    }
    catch (const Unauthorized& e)
    {
        error(
            "failed to acquire shutdown lock: unauthorized; shutdown will not be delayed: {ERROR}",
            "ERROR", e);
        return LockError::DeniedByPolicy;
    }
    catch (const HostError& e)
    {
        error(
            "failed to acquire shutdown lock; shutdown will not be delayed: {ERROR}",
            "ERROR", e);
        return LockError::HostUnavailable;
    }

    debug("acquired shutdown lock");
    return std::nullopt;
}

std::optional<LockError> InhibitorLock::release()
{
    std::lock_guard guard(mutex);

    if (!lock)
    {
        debug("no shutdown lock to release");
        return std::nullopt;
    }

    // The lock is gone after this call even if closing it failed
    auto current = std::move(*lock);
    lock.reset();

    try
    {
        host.releaseLock(current);
    }
    catch (const HostError& e)
    {
        error("failed to release shutdown lock: {ERROR}", "ERROR", e);
        return LockError::HostUnavailable;
    }

    debug("released shutdown lock");
    return std::nullopt;
}

bool InhibitorLock::held() const
{
    std::lock_guard guard(mutex);
    return lock.has_value();
}

} // namespace systemctl_mqtt::bridge
