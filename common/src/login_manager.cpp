#include "config.h"

#include "login_manager.hpp"

#include "errors.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <phosphor-logging/lg2.hpp>
#include <sdbusplus/exception.hpp>
#include <sdbusplus/message/native_types.hpp>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <tuple>
#include <variant>

PHOSPHOR_LOG2_USING;

namespace RulesIntf = sdbusplus::bus::match::rules;

namespace systemctl_mqtt::host
{

// Upper bound for every call, so a stuck logind cannot stall either loop
const auto methodTimeout =
    std::chrono::duration_cast<sdbusplus::SdBusDuration>(
        std::chrono::seconds(25));

constexpr std::array unauthorizedErrors = {
    "org.freedesktop.DBus.Error.InteractiveAuthorizationRequired",
    "org.freedesktop.DBus.Error.AccessDenied",
};

const char* toString(ShutdownAction action)
{
    switch (action)
    {
        case ShutdownAction::Poweroff:
            return "poweroff";
        case ShutdownAction::Reboot:
            return "reboot";
    }
    throw std::invalid_argument("unknown shutdown action");
}

LoginManager::LoginManager(sdbusplus::bus_t&& bus) : bus(std::move(bus)) {}

sdbusplus::message_t LoginManager::newLoginMethod(const char* method)
{
    return bus.new_method_call(LOGIN1_BUSNAME, LOGIN1_PATH,
                               LOGIN1_MANAGER_INTERFACE, method);
}

void throwHostError(const sdbusplus::exception_t& e)
{
    for (const auto* name : unauthorizedErrors)
    {
        if (e.name() != nullptr && strcmp(name, e.name()) == 0)
        {
            throw Unauthorized(e.what());
        }
    }
    throw HostError(e.what());
}

sdbusplus::message_t LoginManager::call(sdbusplus::message_t& method)
{
    try
    {
        return bus.call(method, methodTimeout);
    }
    catch (const sdbusplus::exception_t& e)
    {
        throwHostError(e);
    }
}

void LoginManager::scheduleShutdown(ShutdownAction action,
                                    std::chrono::system_clock::time_point when)
{
    const uint64_t usec =
        std::chrono::duration_cast<std::chrono::microseconds>(
            when.time_since_epoch())
            .count();

    std::lock_guard lock(busMutex);
    auto method = newLoginMethod("ScheduleShutdown");
    method.append(std::string(toString(action)), usec);
    call(method);
}

bool LoginManager::cancelScheduledShutdown()
{
    std::lock_guard lock(busMutex);
    auto method = newLoginMethod("CancelScheduledShutdown");
    auto reply = call(method);

    bool cancelled = false;
    readReply(reply, cancelled);
    return cancelled;
}

void LoginManager::suspend()
{
    std::lock_guard lock(busMutex);
    auto method = newLoginMethod("Suspend");
    // not interactive, polkit must allow it without asking
    method.append(false);
    call(method);
}

void LoginManager::lockAllSessions()
{
    std::lock_guard lock(busMutex);
    auto method = newLoginMethod("LockSessions");
    call(method);
}

std::vector<InhibitorInfo> LoginManager::listInhibitors()
{
    using Entry = std::tuple<std::string, std::string, std::string,
                             std::string, uint32_t, uint32_t>;
    std::vector<Entry> entries;
    {
        std::lock_guard lock(busMutex);
        auto method = newLoginMethod("ListInhibitors");
        auto reply = call(method);
        readReply(reply, entries);
    }

    std::vector<InhibitorInfo> inhibitors;
    inhibitors.reserve(entries.size());
    for (auto& [what, who, why, mode, uid, pid] : entries)
    {
        inhibitors.push_back({std::move(what), std::move(who), std::move(why),
                              std::move(mode), uid, pid});
    }
    return inhibitors;
}

ShutdownLock LoginManager::inhibit(const std::string& what,
                                   const std::string& who,
                                   const std::string& why,
                                   const std::string& mode)
{
    std::lock_guard lock(busMutex);
    auto method = newLoginMethod("Inhibit");
    method.append(what, who, why, mode);
    auto reply = call(method);

    sdbusplus::message::unix_fd fd;
    readReply(reply, fd);

    // The reply owns the received descriptor and closes it with the message
    int owned = fcntl(fd.fd, F_DUPFD_CLOEXEC, 0);
    if (owned < 0)
    {
        throw HostError("failed to duplicate inhibitor lock descriptor: " +
                        std::string(strerror(errno)));
    }

    debug("Acquired {WHAT} inhibitor lock {FD} in {MODE} mode", "WHAT", what,
          "FD", owned, "MODE", mode);

    return ShutdownLock(owned);
}

void LoginManager::releaseLock(ShutdownLock& lock)
{
    int fd = lock.release();
    if (fd < 0)
    {
        return;
    }

    if (::close(fd) != 0)
    {
        throw HostError("failed to close inhibitor lock descriptor: " +
                        std::string(strerror(errno)));
    }

    debug("Closed inhibitor lock {FD}", "FD", fd);
}

bool LoginManager::preparingForShutdown()
{
    std::lock_guard lock(busMutex);
    auto method = bus.new_method_call(LOGIN1_BUSNAME, LOGIN1_PATH,
                                      "org.freedesktop.DBus.Properties", "Get");
    method.append(LOGIN1_MANAGER_INTERFACE, "PreparingForShutdown");
    auto reply = call(method);

    std::variant<bool> value;
    readReply(reply, value);
    return std::get<bool>(value);
}

void LoginManager::startUnit(const std::string& unit)
{
    std::lock_guard lock(busMutex);
    auto method = bus.new_method_call(SYSTEMD_BUSNAME, SYSTEMD_PATH,
                                      SYSTEMD_INTERFACE, "StartUnit");
    method.append(unit, "replace");
    call(method);
}

LoginSignalSource::LoginSignalSource(sdbusplus::bus_t& bus) : bus(bus) {}

void LoginSignalSource::subscribe(ShutdownSignalHandler handler)
{
    if (tornDown)
    {
        throw std::logic_error(
            "PrepareForShutdown subscription cannot be restarted");
    }

    prepareForShutdownMatch = std::make_unique<sdbusplus::bus::match_t>(
        bus,
        RulesIntf::type::signal() + RulesIntf::member("PrepareForShutdown") +
            RulesIntf::path(LOGIN1_PATH) +
            RulesIntf::interface(LOGIN1_MANAGER_INTERFACE),
        [handler = std::move(handler)](sdbusplus::message_t& msg) {
            bool active = false;
            try
            {
                msg.read(active);
            }
            catch (const sdbusplus::exception_t& e)
            {
                error("Failed to read PrepareForShutdown signal: {ERROR}",
                      "ERROR", e);
                return;
            }
            handler(active);
        });

    debug("Subscribed to PrepareForShutdown signal");
}

void LoginSignalSource::unsubscribe()
{
    tornDown = true;
    if (prepareForShutdownMatch)
    {
        prepareForShutdownMatch.reset();
        debug("Unsubscribed from PrepareForShutdown signal");
    }
}

} // namespace systemctl_mqtt::host
