#pragma once

#include <fmt/format.h>

#include <string_view>

enum class StatusLevel { Info, Success, Warning, Danger };

// Receives the user-visible progress of the bot.
class StatusSink {
   public:
    virtual ~StatusSink() = default;
    virtual void report(StatusLevel level, std::string_view message) = 0;
};

// Forwards status updates to the log.
class LoggingStatusSink : public StatusSink {
   public:
    void report(StatusLevel level, std::string_view message) override;
};

template <>
struct fmt::formatter<StatusLevel> : formatter<std::string_view> {
    auto format(StatusLevel c,
                format_context& ctx) const -> format_context::iterator {
        string_view name = "info";
        switch (c) {
            case StatusLevel::Info:
                name = "info";
                break;
            case StatusLevel::Success:
                name = "success";
                break;
            case StatusLevel::Warning:
                name = "warning";
                break;
            case StatusLevel::Danger:
                name = "danger";
                break;
        }
        return formatter<string_view>::format(name, ctx);
    }
};
