#include <absl/status/status.h>
#include <fmt/format.h>

#include <nlohmann/json.hpp>
#include <poll/PollWatcher.hpp>
#include <string>

#include <AbslLogCompat.hpp>

using json = nlohmann::json;

namespace {

constexpr std::string_view kExpiredSubscription = "ExpiredSubscription";

std::string idToString(const json& uid) {
    if (uid.is_string()) {
        return uid.get<std::string>();
    }
    return uid.dump();
}

}  // namespace

PollWatcher::PollWatcher(Session* session) : session_(session) {}

ProbeResult PollWatcher::parseFeedPayload(const std::string_view payload) {
    ProbeResult result;
    try {
        const auto outer = json::parse(payload);
        if (!outer.is_object() || !outer.contains("message") ||
            !outer["message"].is_string()) {
            return result;
        }
        const auto inner = json::parse(outer["message"].get<std::string>());
        if (!inner.is_object()) {
            return result;
        }
        if (inner.contains("error")) {
            const auto& error = inner["error"];
            if (error.is_object() && error.value("type", "") ==
                                         kExpiredSubscription) {
                result.state = ProbeResult::State::SubscriptionExpired;
            } else {
                LOG(WARNING) << "Feed reported an error: " << error.dump();
            }
            return result;
        }
        if (!inner.contains("uid") || inner["uid"].is_null()) {
            return result;
        }
        result.id = idToString(inner["uid"]);
        result.kind = pollKindFromFeedType(inner.value("type", ""));
        result.state = ProbeResult::State::NewPoll;
    } catch (const json::exception& e) {
        DLOG(INFO) << "Unusable feed payload: " << e.what();
        return {};
    }
    return result;
}

ProbeResult PollWatcher::probe(const std::string& token) {
    const auto payload = session_->probeFeed(token);
    if (!payload.ok()) {
        // No response within the probe window means nothing is open
        if (!absl::IsDeadlineExceeded(payload.status())) {
            LOG(WARNING) << "Feed probe failed: " << payload.status();
        }
        return {};
    }

    auto result = parseFeedPayload(*payload);
    if (result.state != ProbeResult::State::NewPoll) {
        return result;
    }
    if (const auto [it, inserted] = answered_.insert(result.id); !inserted) {
        result.state = ProbeResult::State::AlreadyAnswered;
        return result;
    }
    LOG(INFO) << fmt::format("New poll {} ({})", result.id, result.kind);
    return result;
}
