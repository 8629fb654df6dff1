#pragma once

#include <gmock/gmock.h>

#include <approval/ApprovalChannel.hpp>

class MockApprovalChannel : public ApprovalChannel {
   public:
    MOCK_METHOD(absl::Status, notify,
                (RequestId id, const AnswerCandidate& candidate,
                 std::string_view question),
                (override));
    MOCK_METHOD(void, listen,
                (ApprovalResolver * resolver, const std::stop_token& token),
                (override));
    MOCK_METHOD(void, interrupt, (), (override));
};
