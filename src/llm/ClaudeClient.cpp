#include <absl/status/status.h>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include <DurationPoint.hpp>
#include <llm/ClaudeClient.hpp>
#include <net/HttpClient.hpp>
#include <poll/Errors.hpp>
#include <utility>

#include <AbslLogCompat.hpp>

using anthropic::json;

namespace {

constexpr std::string_view kChoicePrompt =
    R"(Using the context from the question and the answer choices below, pick the choice that is most likely to be correct. You must pick one of the listed choices, even if the question gives you little context. Prefer the most likely answer over being certain.

Question: {question}

Answer choices (index. text):
{options}

Use the get_poll_answer tool to respond, selected_option_id being the index of your choice.)";

constexpr std::string_view kTextPrompt =
    R"(You are taking part in a casual live poll and must give a short, natural answer the way an average participant would, so that it blends in with the other responses. Do not:
1. Mention being an AI, a language model, or not being human.
2. Sound formal or analytical.
3. Dodge the question instead of giving a specific answer.
4. Write more than one or two short phrases unless the question demands it.
5. Use punctuation or grammar that is too polished for a casual setting.
6. Use slang or filler that looks deliberately casual.

You are answering as:
- 20 years old
- Computer Science student
- Grew up in a big city
- Likes basketball, reading and biking

Example:
Q: "How are you feeling today?"
Good: "Pretty tired, need more coffee"
Bad: "As an AI, I don't experience feelings"

Question: {question}

Use the get_free_text_answer tool to respond.)";

json confidenceSchema(std::string_view description) {
    return {{"type", "number"},
            {"minimum", 0},
            {"maximum", 1},
            {"description", description}};
}

}  // namespace

ClaudeClient::ClaudeClient(std::string apiKey)
    : ClaudeClient(std::move(apiKey), Options{}) {}

ClaudeClient::ClaudeClient(std::string apiKey, Options options)
    : apiKey_(std::move(apiKey)),
      options_(std::move(options)),
      http_(std::make_unique<HttpClient>("pollbot")) {}

ClaudeClient::~ClaudeClient() = default;

anthropic::MessagesRequest ClaudeClient::buildChoiceRequest(
    const Options& options, const std::string_view question,
    const std::vector<PollOption>& choices) {
    std::string formatted;
    for (std::size_t i = 0; i < choices.size(); ++i) {
        formatted += fmt::format("{}. {}\n", i, choices[i].label);
    }

    anthropic::MessagesRequest request{
        .model = options.choiceModel,
        .max_tokens = options.maxTokens,
        .temperature = options.choiceTemperature,
    };
    request.messages.push_back(anthropic::Message::User(
        fmt::format(fmt::runtime(kChoicePrompt), fmt::arg("question", question),
                    fmt::arg("options", formatted))));
    request.tools.push_back(
        {.name = std::string(kChoiceTool),
         .description =
             "Select the most likely correct answer for a poll question",
         .input_schema = {
             {"type", "object"},
             {"properties",
              {{"selected_option_id",
                {{"type", "integer"},
                 {"description", "Index of the selected answer choice"}}},
               {"confidence",
                confidenceSchema("Confidence in the answer on a 0-1 scale")},
               {"reasoning",
                {{"type", "string"},
                 {"description", "Why this answer was selected"}}}}},
             {"required", {"selected_option_id", "confidence", "reasoning"}}}});
    request.tool_choice.name = std::string(kChoiceTool);
    return request;
}

anthropic::MessagesRequest ClaudeClient::buildTextRequest(
    const Options& options, const std::string_view question) {
    anthropic::MessagesRequest request{
        .model = options.textModel,
        .max_tokens = options.maxTokens,
        .temperature = options.textTemperature,
    };
    request.messages.push_back(anthropic::Message::User(fmt::format(
        fmt::runtime(kTextPrompt), fmt::arg("question", question))));
    request.tools.push_back(
        {.name = std::string(kTextTool),
         .description = "Provide a natural, human-like answer",
         .input_schema = {
             {"type", "object"},
             {"properties",
              {{"answer",
                {{"type", "string"},
                 {"description", "A casual, natural response"}}},
               {"confidence",
                confidenceSchema("Confidence that this response would blend "
                                 "in with human responses")},
               {"reasoning",
                {{"type", "string"},
                 {"description", "Why a person would answer like this"}}}}},
             {"required", {"answer", "confidence", "reasoning"}}}});
    request.tool_choice.name = std::string(kTextTool);
    return request;
}

absl::StatusOr<json> ClaudeClient::extractToolInput(
    const std::string_view body, const std::string_view toolName) {
    try {
        const auto response =
            json::parse(body).get<anthropic::MessagesResponse>();
        for (const auto& block : response.content) {
            if (block.type == "tool_use" && block.name == toolName) {
                if (!block.input.is_object()) {
                    break;
                }
                return block.input;
            }
        }
    } catch (const json::exception& e) {
        return poll_errors::GenerationError(
            fmt::format("Malformed response: {}", e.what()));
    }
    return poll_errors::GenerationError(
        fmt::format("Response has no {} tool call", toolName));
}

absl::StatusOr<OptionSelection> ClaudeClient::parseSelection(
    const json& input) {
    try {
        const auto index = input.at("selected_option_id").get<long long>();
        if (index < 0) {
            return poll_errors::GenerationError(
                fmt::format("Negative option index {}", index));
        }
        return OptionSelection{
            .optionIndex = static_cast<std::size_t>(index),
            .confidence = clampConfidence(input.at("confidence").get<double>()),
            .reasoning = input.value("reasoning", "")};
    } catch (const json::exception& e) {
        return poll_errors::GenerationError(
            fmt::format("Malformed tool input: {}", e.what()));
    }
}

absl::StatusOr<TextResponse> ClaudeClient::parseTextResponse(
    const json& input) {
    try {
        return TextResponse{
            .text = input.at("answer").get<std::string>(),
            .confidence = clampConfidence(input.at("confidence").get<double>()),
            .reasoning = input.value("reasoning", "")};
    } catch (const json::exception& e) {
        return poll_errors::GenerationError(
            fmt::format("Malformed tool input: {}", e.what()));
    }
}

absl::StatusOr<json> ClaudeClient::call(
    const anthropic::MessagesRequest& request) {
    MilliSecondDP dp;
    const auto response =
        http_->postJson(anthropic::kMessagesEndpoint, json(request).dump(),
                        {{"x-api-key", apiKey_},
                         {"anthropic-version", anthropic::kApiVersion}});
    if (!response.ok()) {
        return poll_errors::GenerationError(
            std::string(response.status().message()));
    }
    if (!response->ok()) {
        std::string reason = response->body;
        try {
            reason = json::parse(response->body)
                         .get<anthropic::ErrorResponse>()
                         .error.message;
        } catch (const json::exception&) {
            // Keep the raw body
        }
        return poll_errors::GenerationError(
            fmt::format("HTTP {}: {}", response->code, reason));
    }
    DLOG(INFO) << fmt::format("{} answered in {}", request.model, dp.get());
    return extractToolInput(response->body, request.tool_choice.name);
}

absl::StatusOr<OptionSelection> ClaudeClient::selectOption(
    const std::string_view question, const std::vector<PollOption>& options) {
    const auto input = call(buildChoiceRequest(options_, question, options));
    if (!input.ok()) {
        return input.status();
    }
    return parseSelection(*input);
}

absl::StatusOr<TextResponse> ClaudeClient::generateText(
    const std::string_view question) {
    const auto input = call(buildTextRequest(options_, question));
    if (!input.ok()) {
        return input.status();
    }
    return parseTextResponse(*input);
}
