#pragma once

#include <absl/status/statusor.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "AnswerGenerator.hpp"
#include "AnthropicApi.hpp"

class HttpClient;

// AnswerGenerator backed by Claude through forced tool use.
class ClaudeClient : public AnswerGenerator {
   public:
    struct Options {
        std::string choiceModel = "claude-3-7-sonnet-latest";
        std::string textModel = "claude-3-5-sonnet-latest";
        double choiceTemperature = 0.0;
        double textTemperature = 0.7;
        int maxTokens = 1024;
    };

    explicit ClaudeClient(std::string apiKey);
    ClaudeClient(std::string apiKey, Options options);
    ~ClaudeClient() override;

    absl::StatusOr<OptionSelection> selectOption(
        std::string_view question,
        const std::vector<PollOption>& options) override;

    absl::StatusOr<TextResponse> generateText(
        std::string_view question) override;

    // Request and response mapping, public for tests.
    static anthropic::MessagesRequest buildChoiceRequest(
        const Options& options, std::string_view question,
        const std::vector<PollOption>& choices);
    static anthropic::MessagesRequest buildTextRequest(
        const Options& options, std::string_view question);
    // Input of the tool_use block named toolName
    static absl::StatusOr<anthropic::json> extractToolInput(
        std::string_view body, std::string_view toolName);
    static absl::StatusOr<OptionSelection> parseSelection(
        const anthropic::json& input);
    static absl::StatusOr<TextResponse> parseTextResponse(
        const anthropic::json& input);

    static constexpr std::string_view kChoiceTool = "get_poll_answer";
    static constexpr std::string_view kTextTool = "get_free_text_answer";

   private:
    absl::StatusOr<anthropic::json> call(
        const anthropic::MessagesRequest& request);

    std::string apiKey_;
    Options options_;
    std::unique_ptr<HttpClient> http_;
};
