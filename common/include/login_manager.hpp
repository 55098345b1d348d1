#pragma once

#include "host_control.hpp"
#include "host_signal.hpp"

#include <sdbusplus/bus.hpp>
#include <sdbusplus/bus/match.hpp>
#include <sdbusplus/exception.hpp>

#include <memory>
#include <mutex>

namespace systemctl_mqtt::host
{

/** @brief Rethrows a failed D-Bus call or reply as a HostError.
 *
 *  @throws Unauthorized    for polkit denials (InteractiveAuthorizationRequired
 *                          or AccessDenied)
 *  @throws HostError       for every other error
 */
[[noreturn]] void throwHostError(const sdbusplus::exception_t& e);

/** @class LoginManager
 *
 *  @brief HostControl backed by systemd-logind and the systemd manager on
 *         the system bus.
 *
 *  Owns a D-Bus connection of its own, used from the network loop and the
 *  signal loop alike, so every call is serialised.
 */
class LoginManager : public HostControl
{
  public:
    explicit LoginManager(sdbusplus::bus_t&& bus);

    LoginManager(const LoginManager&) = delete;
    LoginManager& operator=(const LoginManager&) = delete;
    LoginManager(LoginManager&&) = delete;
    LoginManager& operator=(LoginManager&&) = delete;
    ~LoginManager() override = default;

    void scheduleShutdown(ShutdownAction action,
                          std::chrono::system_clock::time_point when) override;
    bool cancelScheduledShutdown() override;
    void suspend() override;
    void lockAllSessions() override;
    std::vector<InhibitorInfo> listInhibitors() override;
    ShutdownLock inhibit(const std::string& what, const std::string& who,
                         const std::string& why,
                         const std::string& mode) override;
    void releaseLock(ShutdownLock& lock) override;
    bool preparingForShutdown() override;
    void startUnit(const std::string& unit) override;

  private:
    sdbusplus::message_t newLoginMethod(const char* method);

    // Performs the call, translating sdbusplus errors into HostError
    sdbusplus::message_t call(sdbusplus::message_t& method);

    // Reads the reply, translating sdbusplus errors into HostError
    template <typename... Args>
    static void readReply(sdbusplus::message_t& reply, Args&... args)
    {
        try
        {
            reply.read(args...);
        }
        catch (const sdbusplus::exception_t& e)
        {
            throwHostError(e);
        }
    }

    std::mutex busMutex;

    sdbusplus::bus_t bus;
};

/** @class LoginSignalSource
 *
 *  @brief PrepareForShutdown signal match on the signal loop's connection.
 */
class LoginSignalSource : public HostSignalSource
{
  public:
    explicit LoginSignalSource(sdbusplus::bus_t& bus);

    void subscribe(ShutdownSignalHandler handler) override;
    void unsubscribe() override;

  private:
    sdbusplus::bus_t& bus;

    std::unique_ptr<sdbusplus::bus::match_t> prepareForShutdownMatch;

    bool tornDown = false;
};

} // namespace systemctl_mqtt::host
