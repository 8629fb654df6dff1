#pragma once

#include <gmock/gmock.h>

#include <poll/LocalConfirmation.hpp>

class MockLocalConfirmation : public LocalConfirmation {
   public:
    MOCK_METHOD(bool, confirm,
                (const AnswerCandidate& candidate, std::string_view question,
                 std::chrono::milliseconds timeout),
                (override));
};
