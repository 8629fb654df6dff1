#pragma once

#include <absl/strings/numbers.h>
#include <fmt/format.h>

#include <optional>
#include <string>
#include <string_view>

#include "ApprovalChannel.hpp"

// Button payloads of the form "<action>_<request id>".
struct CallbackData {
    ApprovalAction action;
    RequestId id;

    [[nodiscard]] std::string str() const {
        return fmt::format("{}_{}", toString(action), id);
    }

    static std::optional<CallbackData> parse(const std::string_view data) {
        const auto sep = data.find('_');
        if (sep == std::string_view::npos) {
            return std::nullopt;
        }
        const auto action = parseApprovalAction(data.substr(0, sep));
        RequestId id = 0;
        if (!action ||
            !absl::SimpleAtoi(std::string(data.substr(sep + 1)), &id)) {
            return std::nullopt;
        }
        return CallbackData{*action, id};
    }
};
