#pragma once

#include <functional>

namespace systemctl_mqtt::host
{

// Receives logind's PrepareForShutdown argument:
// true when a shutdown starts, false when it was cancelled.
using ShutdownSignalHandler = std::function<void(bool)>;

/** @class HostSignalSource
 *
 *  @brief Subscription to the host's shutdown preparation notification.
 *
 *  The handler runs on the thread of the signal loop the source is attached
 *  to. A source cannot be subscribed again once it was unsubscribed.
 */
class HostSignalSource
{
  public:
    virtual ~HostSignalSource() = default;

    // @throws std::logic_error    when called after unsubscribe()
    virtual void subscribe(ShutdownSignalHandler handler) = 0;

    virtual void unsubscribe() = 0;
};

} // namespace systemctl_mqtt::host
