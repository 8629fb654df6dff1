#pragma once

#include <absl/status/status.h>

#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

#include "poll/PollTypes.hpp"

using RequestId = std::uint64_t;

// The three things an approver can do with a proposed answer.
enum class ApprovalAction { Approve, Reject, Edit };

inline std::string_view toString(const ApprovalAction action) {
    switch (action) {
        case ApprovalAction::Approve:
            return "approve";
        case ApprovalAction::Reject:
            return "reject";
        case ApprovalAction::Edit:
            return "edit";
    }
    return "unknown";
}

inline std::optional<ApprovalAction> parseApprovalAction(
    const std::string_view str) {
    if (str == "approve") return ApprovalAction::Approve;
    if (str == "reject") return ApprovalAction::Reject;
    if (str == "edit") return ApprovalAction::Edit;
    return std::nullopt;
}

// Receiver of remote approval actions, implemented by ApprovalBroker.
class ApprovalResolver {
   public:
    virtual ~ApprovalResolver() = default;

    // Returns true if this call moved the request out of Pending.
    // Missing or already resolved requests are left untouched.
    virtual bool resolve(RequestId id, ApprovalAction action,
                         std::optional<std::string> modifiedText) = 0;

    // True while the request exists and nobody has acted on it.
    [[nodiscard]] virtual bool isPending(RequestId id) const = 0;
};

// Transport that shows a candidate to a human and reports their decision.
class ApprovalChannel {
   public:
    ApprovalChannel() = default;
    virtual ~ApprovalChannel() = default;

    ApprovalChannel(const ApprovalChannel&) = delete;
    ApprovalChannel& operator=(const ApprovalChannel&) = delete;

    /**
     * @brief Presents a candidate for review with approve/reject/edit actions.
     *
     * @param id Correlation id that must come back with the action.
     * @param candidate The proposed free-text answer.
     * @param question The poll question, for context.
     *
     * @return OK once the approver can act on the request. Any error means
     * nobody will ever resolve it.
     */
    virtual absl::Status notify(RequestId id, const AnswerCandidate& candidate,
                                std::string_view question) = 0;

    /**
     * @brief Receives remote actions until the token is stopped.
     *
     * Runs on a dedicated background thread and forwards every action to
     * resolver->resolve().
     */
    virtual void listen(ApprovalResolver* resolver,
                        const std::stop_token& token) = 0;

    // Wake up a blocked listen() after stop was requested.
    virtual void interrupt() {}
};
