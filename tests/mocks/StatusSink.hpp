#pragma once

#include <gmock/gmock.h>

#include <poll/StatusSink.hpp>

class MockStatusSink : public StatusSink {
   public:
    MOCK_METHOD(void, report, (StatusLevel level, std::string_view message),
                (override));
};
