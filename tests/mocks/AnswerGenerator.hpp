#pragma once

#include <gmock/gmock.h>

#include <llm/AnswerGenerator.hpp>

class MockAnswerGenerator : public AnswerGenerator {
   public:
    MOCK_METHOD(absl::StatusOr<OptionSelection>, selectOption,
                (std::string_view question,
                 const std::vector<PollOption>& options),
                (override));
    MOCK_METHOD(absl::StatusOr<TextResponse>, generateText,
                (std::string_view question), (override));
};
