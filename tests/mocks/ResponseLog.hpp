#pragma once

#include <gmock/gmock.h>

#include <poll/ResponseLog.hpp>

class MockResponseLog : public ResponseLog {
   public:
    MOCK_METHOD(void, append, (const ResponseRecord& record), (override));
};
