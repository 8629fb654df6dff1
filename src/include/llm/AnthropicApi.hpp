#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

// Subset of the Anthropic Messages API used for forced tool calls.
namespace anthropic {

using json = nlohmann::json;

constexpr const char* kMessagesEndpoint = "https://api.anthropic.com/v1/messages";
constexpr const char* kApiVersion = "2023-06-01";

// --- Request ---

struct Message {
    std::string role;  // "user" or "assistant"
    std::string content;

    static Message User(std::string text) {
        return {.role = "user", .content = std::move(text)};
    }
};

struct Tool {
    std::string name;
    std::string description;
    json input_schema;
};

struct ToolChoice {
    std::string type = "tool";
    std::string name;
};

struct MessagesRequest {
    std::string model;
    int max_tokens = 1024;
    double temperature = 0.0;
    std::vector<Message> messages;
    std::vector<Tool> tools;
    ToolChoice tool_choice;
};

// --- Response ---

struct ContentBlock {
    std::string type;  // "text" or "tool_use"
    std::string text;
    std::string id;
    std::string name;
    json input;
};

struct Usage {
    int input_tokens = 0;
    int output_tokens = 0;
};

struct MessagesResponse {
    std::string id;
    std::string model;
    std::string stop_reason;
    std::vector<ContentBlock> content;
    Usage usage;
};

struct ErrorDetail {
    std::string type;
    std::string message;
};

struct ErrorResponse {
    ErrorDetail error;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Message, role, content)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Tool, name, description, input_schema)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ToolChoice, type, name)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(MessagesRequest, model, max_tokens,
                                   temperature, messages, tools, tool_choice)

// Fields differ per block type, missing ones keep their defaults.
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ContentBlock, type, text, id,
                                                name, input)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Usage, input_tokens,
                                                output_tokens)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(MessagesResponse, id, model,
                                                stop_reason, content, usage)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ErrorDetail, type, message)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ErrorResponse, error)

}  // namespace anthropic
