#pragma once

#include <stdexcept>
#include <string>

namespace systemctl_mqtt
{

// Invalid or contradicting configuration, fatal before any connection attempt
class ConfigurationError : public std::invalid_argument
{
  public:
    using std::invalid_argument::invalid_argument;
};

// The MQTT transport could not be set up or connected
class ConnectionError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

// A call into logind / systemd failed
class HostError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

// The host refused the call, usually for lack of a polkit rule
class Unauthorized : public HostError
{
  public:
    using HostError::HostError;
};

// An action could not be carried out, e.g. unparsable payload
class ActionError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

} // namespace systemctl_mqtt
