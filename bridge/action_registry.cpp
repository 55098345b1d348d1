#include "action_registry.hpp"

#include "utils.hpp"

#include <phosphor-logging/lg2.hpp>

#include <exception>

PHOSPHOR_LOG2_USING;

namespace systemctl_mqtt::bridge
{

using host::HostControl;
using host::ShutdownAction;

ActionRegistry::ActionRegistry(const ActionSettings& settings)
{
    const auto delay = settings.poweroffDelay;

    actions.emplace(
        "poweroff",
        ActionDescriptor{"poweroff",
                         [delay](HostControl& host, const std::string&) {
                             scheduleShutdown(host, ShutdownAction::Poweroff,
                                              delay);
                         }});

    actions.emplace(
        "reboot",
        ActionDescriptor{"reboot",
                         [delay](HostControl& host, const std::string&) {
                             scheduleShutdown(host, ShutdownAction::Reboot,
                                              delay);
                         }});

    actions.emplace("suspend",
                    ActionDescriptor{"suspend", [](HostControl& host,
                                                   const std::string&) {
                                         info("suspending system");
                                         host.suspend();
                                     }});

    actions.emplace(
        "lock-all-sessions",
        ActionDescriptor{"lock-all-sessions",
                         [](HostControl& host, const std::string&) {
                             info("instruct all sessions to activate screen "
                                  "locks");
                             host.lockAllSessions();
                         }});

    actions.emplace(
        "schedule-poweroff",
        ActionDescriptor{"schedule-poweroff",
                         [](HostControl& host, const std::string& payload) {
                             scheduleShutdown(host, ShutdownAction::Poweroff,
                                              utils::parseDuration(payload));
                         }});

    actions.emplace(
        "schedule-reboot",
        ActionDescriptor{"schedule-reboot",
                         [](HostControl& host, const std::string& payload) {
                             scheduleShutdown(host, ShutdownAction::Reboot,
                                              utils::parseDuration(payload));
                         }});

    actions.emplace(
        "cancel-scheduled-shutdown",
        ActionDescriptor{"cancel-scheduled-shutdown",
                         [](HostControl& host, const std::string&) {
                             if (host.cancelScheduledShutdown())
                             {
                                 info("cancelled scheduled shutdown");
                             }
                             else
                             {
                                 info("no scheduled shutdown to cancel");
                             }
                         }});

    for (const auto& unit : settings.controlledUnits)
    {
        actions.emplace(
            "unit/system/" + unit + "/start",
            ActionDescriptor{"start " + unit,
                             [unit](HostControl& host, const std::string&) {
                                 info("starting system unit {UNIT}", "UNIT",
                                      unit);
                                 host.startUnit(unit);
                             }});
    }
}

const ActionDescriptor* ActionRegistry::resolve(const std::string& suffix) const
{
    auto it = actions.find(suffix);
    if (it == actions.end())
    {
        return nullptr;
    }
    return &it->second;
}

void scheduleShutdown(HostControl& host, ShutdownAction action,
                      std::chrono::milliseconds delay)
{
    const auto time = std::chrono::system_clock::now() + delay;
    const std::string actionName = host::toString(action);

    info("scheduling {ACTION} for {TIME}", "ACTION", actionName, "TIME",
         utils::formatTime(time));

    host.scheduleShutdown(action, time);

    logShutdownInhibitors(host);
}

void logShutdownInhibitors(HostControl& host)
{
    std::vector<host::InhibitorInfo> inhibitors;
    try
    {
        inhibitors = host.listInhibitors();
    }
    catch (const std::exception& e)
    {
        warning("failed to fetch shutdown inhibitors: {ERROR}", "ERROR", e);
        return;
    }

    bool found = false;
    for (const auto& inhibitor : inhibitors)
    {
        if (inhibitor.what.find("shutdown") == std::string::npos)
        {
            continue;
        }
        found = true;
        debug(
            "detected shutdown inhibitor {WHO} (pid={PID}, uid={UID}, mode={MODE}): {WHY}",
            "WHO", inhibitor.who, "PID", inhibitor.pid, "UID", inhibitor.uid,
            "MODE", inhibitor.mode, "WHY", inhibitor.why);
    }

    if (!found)
    {
        debug("no shutdown inhibitor locks found");
    }
}

} // namespace systemctl_mqtt::bridge
