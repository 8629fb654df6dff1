#pragma once

#include <gmock/gmock.h>

#include <poll/Session.hpp>

class MockSession : public Session {
   public:
    MOCK_METHOD(absl::Status, login, (), (override));
    MOCK_METHOD(absl::StatusOr<std::string>, fetchFeedToken, (), (override));
    MOCK_METHOD(absl::StatusOr<std::string>, probeFeed,
                (const std::string& token), (override));
    MOCK_METHOD(absl::StatusOr<PollRecord>, fetchPollDetail,
                (const std::string& id, PollKind kind), (override));
    MOCK_METHOD(absl::Status, submitAnswer,
                (const PollRecord& poll, const Answer& answer), (override));
};
