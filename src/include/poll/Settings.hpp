#pragma once

#include <absl/status/statusor.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

class ConfigManager;

enum class LoginType {
    PollEv,  // username and password on pollev.com
    UW,      // University of Washington single sign-on
};

// Everything the bot reads from configuration, validated.
struct BotSettings {
    std::string username;
    std::string password;
    std::string host;
    LoginType loginType = LoginType::UW;

    std::optional<std::string> claudeApiKey;
    std::optional<std::string> telegramToken;
    std::optional<std::int64_t> telegramChatId;

    std::size_t minOption = 0;
    std::optional<std::size_t> maxOption;

    std::chrono::seconds closedWait{5};
    std::chrono::seconds openWait{60};
    // nullopt runs until stopped
    std::optional<std::chrono::seconds> lifetime;

    std::filesystem::path responseLog = "poll_responses.jsonl";
    std::optional<std::filesystem::path> logFile;

    std::chrono::seconds approvalTimeout{60};
    std::chrono::seconds approvalTtl{600};
    int maxRetries = 3;
    double minConfidence = 0.7;
    std::size_t maxResponseLength = 150;
};

/**
 * @brief Reads and validates all settings.
 *
 * @return INVALID_ARGUMENT naming the first offending setting if a required
 * value is missing, a number does not parse, or a value is out of range.
 */
absl::StatusOr<BotSettings> loadSettings(ConfigManager& config);
