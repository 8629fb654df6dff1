#pragma once

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "CommandLine.hpp"

// Abstract manager for config loader
// Currently have three sources, env and file, cmdline
class ConfigManager {
   public:
    enum class Configs {
        POLLEV_USERNAME,
        POLLEV_PASSWORD,
        POLLEV_HOST,
        LOGIN_TYPE,
        CLAUDE_API_KEY,
        TELEGRAM_TOKEN,
        TELEGRAM_CHAT_ID,
        MIN_OPTION,
        MAX_OPTION,
        CLOSED_WAIT,
        OPEN_WAIT,
        LIFETIME,
        RESPONSE_LOG,
        LOG_FILE,
        APPROVAL_TIMEOUT,
        APPROVAL_TTL,
        MAX_RETRIES,
        MIN_CONFIDENCE,
        MAX_RESPONSE_LENGTH,
        HELP,
        MAX
    };
    static constexpr size_t CONFIG_MAX = static_cast<int>(Configs::MAX);

    /**
     * get - Function used to retrieve the value of a specific
     * configuration.
     *
     * @param config The configuration for which the value is to be retrieved.
     * @return A std::optional containing the value of the specified
     * configuration, or std::nullopt if the configuration is not found.
     */
    std::optional<std::string> get(Configs config);

    /**
     * serializeHelpToOStream - Function used to serialize the help information
     * to an output stream.
     *
     * @param out The output stream to which the help information will be
     * serialized.
     */
    static void serializeHelpToOStream(std::ostream& out);

    struct Backend {
        virtual ~Backend() = default;

        virtual bool load() { return true; }
        virtual std::optional<std::string> get(const std::string_view name) = 0;

        /**
         * @brief This field stores the name of the backend.
         *
         * This field stores the name of the backend, such as "Command line" or
         * "File". This field is used for logging purposes.
         */
        [[nodiscard]] virtual std::string_view name() const = 0;
    };

    // Loads the command line, environment and ~/pollbot.ini backends.
    explicit ConfigManager(CommandLine line);

    // Uses the given backends, highest priority first.
    explicit ConfigManager(std::vector<std::unique_ptr<Backend>> backends);

    // True if --HELP was passed on the command line.
    [[nodiscard]] bool helpRequested() const { return helpRequested_; }

    struct Entry {
        static constexpr char ALIAS_NONE = '\0';

        Configs config;
        std::string_view name;
        std::string_view description;
        char alias;
        enum class ArgType { NONE, STRING } type;
    };

    static constexpr std::array<Entry, CONFIG_MAX> kConfigMap = {
        Entry{
            Configs::POLLEV_USERNAME,
            "POLLEV_USERNAME",
            "PollEv username or email",
            'u',
            Entry::ArgType::STRING,
        },
        {
            Configs::POLLEV_PASSWORD,
            "POLLEV_PASSWORD",
            "PollEv password",
            'p',
            Entry::ArgType::STRING,
        },
        {
            Configs::POLLEV_HOST,
            "POLLEV_HOST",
            "Poll host to watch",
            'H',
            Entry::ArgType::STRING,
        },
        {
            Configs::LOGIN_TYPE,
            "LOGIN_TYPE",
            "Login flow (uw/pollev)",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::CLAUDE_API_KEY,
            "CLAUDE_API_KEY",
            "Anthropic API key, random answers without it",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::TELEGRAM_TOKEN,
            "TELEGRAM_TOKEN",
            "Telegram bot token for remote approval",
            't',
            Entry::ArgType::STRING,
        },
        {
            Configs::TELEGRAM_CHAT_ID,
            "TELEGRAM_CHAT_ID",
            "Telegram chat receiving approval requests",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::MIN_OPTION,
            "MIN_OPTION",
            "First option index to pick from (inclusive)",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::MAX_OPTION,
            "MAX_OPTION",
            "Last option index to pick from (exclusive)",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::CLOSED_WAIT,
            "CLOSED_WAIT",
            "Seconds between probes while no poll is open",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::OPEN_WAIT,
            "OPEN_WAIT",
            "Seconds to wait before answering a new poll",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::LIFETIME,
            "LIFETIME",
            "Seconds to run before exiting",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::RESPONSE_LOG,
            "RESPONSE_LOG",
            "JSONL file recording every answer",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::LOG_FILE,
            "LOG_FILE",
            "Log file path",
            'f',
            Entry::ArgType::STRING,
        },
        {
            Configs::APPROVAL_TIMEOUT,
            "APPROVAL_TIMEOUT",
            "Seconds to wait for an approval",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::APPROVAL_TTL,
            "APPROVAL_TTL",
            "Seconds before a stale approval is discarded",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::MAX_RETRIES,
            "MAX_RETRIES",
            "Generation attempts for free text",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::MIN_CONFIDENCE,
            "MIN_CONFIDENCE",
            "Lowest accepted confidence for free text",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::MAX_RESPONSE_LENGTH,
            "MAX_RESPONSE_LENGTH",
            "Longest accepted free text answer",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::HELP,
            "HELP",
            "Display help information",
            'h',
            Entry::ArgType::NONE,
        },
    };

    static constexpr std::string_view kConfigFileName = "pollbot.ini";

   private:
    std::vector<std::unique_ptr<Backend>> backends_;
    bool helpRequested_ = false;
};
