#pragma once

#include "host_control.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace systemctl_mqtt::bridge
{

struct ActionDescriptor
{
    std::string name;

    // @param host       the host to act on
    // @param payload    the MQTT payload, ignored by most actions
    std::function<void(host::HostControl& host, const std::string& payload)>
        invoke;
};

struct ActionSettings
{
    // Delay between a poweroff/reboot request and its execution
    std::chrono::milliseconds poweroffDelay = std::chrono::seconds(4);

    // systemd units which get a start topic each
    std::vector<std::string> controlledUnits;
};

/** @class ActionRegistry
 *
 *  @brief Immutable mapping of MQTT topic suffixes to host actions.
 */
class ActionRegistry
{
  public:
    explicit ActionRegistry(const ActionSettings& settings);

    // @returns     the action for the suffix, nullptr for unknown suffixes
    const ActionDescriptor* resolve(const std::string& suffix) const;

    // All entries ordered by suffix
    const std::map<std::string, ActionDescriptor>& entries() const
    {
        return actions;
    }

  private:
    std::map<std::string, ActionDescriptor> actions;
};

// Schedules a poweroff or reboot after the delay and logs the shutdown
// inhibitors currently registered with the host.
void scheduleShutdown(host::HostControl& host, host::ShutdownAction action,
                      std::chrono::milliseconds delay);

// Best effort, failures to list the inhibitors are only logged.
void logShutdownInhibitors(host::HostControl& host);

} // namespace systemctl_mqtt::bridge
