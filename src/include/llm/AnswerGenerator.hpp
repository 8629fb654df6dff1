#pragma once

#include <absl/status/statusor.h>

#include <string>
#include <string_view>
#include <vector>

#include "poll/PollTypes.hpp"

// Reply to a multiple choice question.
struct OptionSelection {
    // Index into the options passed to selectOption()
    std::size_t optionIndex = 0;
    double confidence = 0;
    std::string reasoning;
};

// Reply to a free text question.
struct TextResponse {
    std::string text;
    double confidence = 0;
    std::string reasoning;
};

// Text generation backend. Errors are INTERNAL (GenerationError).
class AnswerGenerator {
   public:
    virtual ~AnswerGenerator() = default;

    virtual absl::StatusOr<OptionSelection> selectOption(
        std::string_view question, const std::vector<PollOption>& options) = 0;

    virtual absl::StatusOr<TextResponse> generateText(
        std::string_view question) = 0;
};
