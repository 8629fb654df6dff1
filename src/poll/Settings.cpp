#include <absl/status/status.h>
#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <fmt/format.h>

#include <limits>
#include <poll/Settings.hpp>
#include <utility>
#include <utils/ConfigManager.hpp>

#include <AbslLogCompat.hpp>

namespace {

using Configs = ConfigManager::Configs;

absl::Status invalid(std::string_view name, std::string_view value,
                     std::string_view why) {
    return absl::InvalidArgumentError(
        fmt::format("Invalid {} '{}': {}", name, value, why));
}

// Reads an integer setting into out, leaving it untouched when unset.
template <typename T>
absl::Status readInteger(ConfigManager& config, Configs key,
                         std::string_view name, T& out,
                         std::int64_t min = 0) {
    const auto value = config.get(key);
    if (!value) {
        return absl::OkStatus();
    }
    std::int64_t parsed = 0;
    if (!absl::SimpleAtoi(*value, &parsed)) {
        return invalid(name, *value, "not an integer");
    }
    if (parsed < min) {
        return invalid(name, *value, fmt::format("must be at least {}", min));
    }
    if (std::cmp_greater(parsed, std::numeric_limits<T>::max())) {
        return invalid(name, *value,
                       fmt::format("must be at most {}",
                                   std::numeric_limits<T>::max()));
    }
    out = static_cast<T>(parsed);
    return absl::OkStatus();
}

absl::Status readSeconds(ConfigManager& config, Configs key,
                         std::string_view name, std::chrono::seconds& out) {
    std::int64_t seconds = out.count();
    if (auto status = readInteger(config, key, name, seconds); !status.ok()) {
        return status;
    }
    out = std::chrono::seconds(seconds);
    return absl::OkStatus();
}

absl::Status require(ConfigManager& config, Configs key,
                     std::string_view name, std::string& out) {
    auto value = config.get(key);
    if (!value || value->empty()) {
        return absl::InvalidArgumentError(
            fmt::format("Missing required setting {}", name));
    }
    out = std::move(*value);
    return absl::OkStatus();
}

std::optional<std::string> optionalString(ConfigManager& config,
                                          Configs key) {
    auto value = config.get(key);
    if (value && value->empty()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

#define RETURN_IF_ERROR(expr)              \
    do {                                   \
        if (auto _s = (expr); !_s.ok()) {  \
            return _s;                     \
        }                                  \
    } while (0)

absl::StatusOr<BotSettings> loadSettings(ConfigManager& config) {
    BotSettings settings;

    RETURN_IF_ERROR(require(config, Configs::POLLEV_USERNAME,
                            "POLLEV_USERNAME", settings.username));
    RETURN_IF_ERROR(require(config, Configs::POLLEV_PASSWORD,
                            "POLLEV_PASSWORD", settings.password));
    RETURN_IF_ERROR(
        require(config, Configs::POLLEV_HOST, "POLLEV_HOST", settings.host));

    if (auto login = config.get(Configs::LOGIN_TYPE)) {
        const std::string type = absl::AsciiStrToLower(*login);
        if (type == "uw") {
            settings.loginType = LoginType::UW;
        } else if (type == "pollev") {
            settings.loginType = LoginType::PollEv;
        } else {
            return invalid("LOGIN_TYPE", *login, "expected uw or pollev");
        }
    }
    if (settings.loginType == LoginType::PollEv &&
        absl::EndsWithIgnoreCase(settings.username, "@uw.edu")) {
        LOG(WARNING) << "Username looks like a UW account, consider "
                        "LOGIN_TYPE=uw";
    }

    settings.claudeApiKey = optionalString(config, Configs::CLAUDE_API_KEY);
    settings.telegramToken = optionalString(config, Configs::TELEGRAM_TOKEN);
    if (auto chat = optionalString(config, Configs::TELEGRAM_CHAT_ID)) {
        std::int64_t chatId = 0;
        if (!absl::SimpleAtoi(*chat, &chatId)) {
            return invalid("TELEGRAM_CHAT_ID", *chat, "not an integer");
        }
        settings.telegramChatId = chatId;
    }

    RETURN_IF_ERROR(readInteger(config, Configs::MIN_OPTION, "MIN_OPTION",
                                settings.minOption));
    if (config.get(Configs::MAX_OPTION)) {
        std::size_t maxOption = 0;
        RETURN_IF_ERROR(readInteger(config, Configs::MAX_OPTION, "MAX_OPTION",
                                    maxOption));
        settings.maxOption = maxOption;
    }

    RETURN_IF_ERROR(readSeconds(config, Configs::CLOSED_WAIT, "CLOSED_WAIT",
                                settings.closedWait));
    RETURN_IF_ERROR(readSeconds(config, Configs::OPEN_WAIT, "OPEN_WAIT",
                                settings.openWait));
    if (config.get(Configs::LIFETIME)) {
        std::chrono::seconds lifetime{};
        RETURN_IF_ERROR(
            readSeconds(config, Configs::LIFETIME, "LIFETIME", lifetime));
        settings.lifetime = lifetime;
    }

    if (auto path = optionalString(config, Configs::RESPONSE_LOG)) {
        settings.responseLog = *path;
    }
    if (auto path = optionalString(config, Configs::LOG_FILE)) {
        settings.logFile = *path;
    }

    RETURN_IF_ERROR(readSeconds(config, Configs::APPROVAL_TIMEOUT,
                                "APPROVAL_TIMEOUT", settings.approvalTimeout));
    RETURN_IF_ERROR(readSeconds(config, Configs::APPROVAL_TTL, "APPROVAL_TTL",
                                settings.approvalTtl));
    RETURN_IF_ERROR(readInteger(config, Configs::MAX_RETRIES, "MAX_RETRIES",
                                settings.maxRetries, 1));
    RETURN_IF_ERROR(readInteger(config, Configs::MAX_RESPONSE_LENGTH,
                                "MAX_RESPONSE_LENGTH",
                                settings.maxResponseLength, 1));

    if (auto value = config.get(Configs::MIN_CONFIDENCE)) {
        double confidence = 0;
        if (!absl::SimpleAtod(*value, &confidence)) {
            return invalid("MIN_CONFIDENCE", *value, "not a number");
        }
        if (confidence < 0 || confidence > 1) {
            return invalid("MIN_CONFIDENCE", *value, "must be within [0, 1]");
        }
        settings.minConfidence = confidence;
    }

    return settings;
}
