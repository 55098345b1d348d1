#pragma once

#include "event_loop.hpp"

#include <gmock/gmock.h>

namespace systemctl_mqtt::test
{

class MockEventLoop : public EventLoop
{
  public:
    MOCK_METHOD(void, run, (), (override));
    MOCK_METHOD(void, exit, (), (override));
};

} // namespace systemctl_mqtt::test
