#pragma once

#include <absl/status/statusor.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "ApprovalChannel.hpp"
#include "ManagedThreads.hpp"
#include "poll/PollTypes.hpp"

enum class ApprovalStatus { Pending, Approved, Rejected };

struct PendingApproval {
    using TimePoint = std::chrono::steady_clock::time_point;

    RequestId requestId{};
    AnswerCandidate candidate;
    std::string question;
    TimePoint createdAt;
    ApprovalStatus status = ApprovalStatus::Pending;
    // Approver supplied replacement for candidate.text
    std::optional<std::string> modifiedText;
};

struct ApprovalOutcome {
    enum class Kind {
        Approved,
        Rejected,
        TimedOut,  // the waiter gave up and rejected the request itself
        Expired,   // already claimed by the reaper, or never existed
    };

    Kind kind = Kind::Expired;
    std::optional<std::string> modifiedText;

    [[nodiscard]] bool approved() const { return kind == Kind::Approved; }
};

/**
 * In-flight approval requests shared between three parties:
 *  - the caller, which creates a request and blocks in awaitResolution(),
 *  - the channel listener thread, which calls resolve(),
 *  - the reaper thread, which rejects requests older than the TTL.
 *
 * Each request moves Pending -> Approved | Rejected at most once and is
 * removed from the table exactly once, by whichever of the waiter or the
 * reaper claims it first. Every check-and-modify runs under one mutex.
 */
class ApprovalBroker : public ApprovalResolver {
   public:
    using Clock = std::chrono::steady_clock;

    struct Options {
        std::chrono::milliseconds ttl = std::chrono::minutes(10);
        std::chrono::milliseconds reapInterval = std::chrono::seconds(60);
        // Age source for the TTL. Waiting always uses the real clock.
        std::function<Clock::time_point()> clock = [] { return Clock::now(); };
        bool startListener = true;
        bool startReaper = true;
    };

    // channel may be nullptr, in which case every request fails to notify.
    explicit ApprovalBroker(ApprovalChannel* channel);
    ApprovalBroker(ApprovalChannel* channel, Options options);
    ~ApprovalBroker() override;

    ApprovalBroker(const ApprovalBroker&) = delete;
    ApprovalBroker& operator=(const ApprovalBroker&) = delete;

    /**
     * @brief Registers a Pending request and notifies the channel.
     *
     * @return The new request id, or the notification error. On error the
     * request is withdrawn and the caller should confirm locally instead.
     */
    absl::StatusOr<RequestId> requestApproval(const AnswerCandidate& candidate,
                                              std::string_view question);

    // First transition wins. Edit approves and stores modifiedText.
    bool resolve(RequestId id, ApprovalAction action,
                 std::optional<std::string> modifiedText) override;
    [[nodiscard]] bool isPending(RequestId id) const override;

    /**
     * @brief Blocks until the request leaves Pending or timeout elapses.
     *
     * Claims (removes) the request on the first terminal status seen. On
     * timeout the request is rejected and removed. If the request is gone
     * already, returns Kind::Expired.
     */
    ApprovalOutcome awaitResolution(RequestId id,
                                    std::chrono::milliseconds timeout);

    // One reaper pass: rejects and removes requests older than the TTL.
    // Returns the removed records with their final status.
    std::vector<PendingApproval> reapExpired();

    [[nodiscard]] std::optional<ApprovalStatus> statusOf(RequestId id) const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool hasChannel() const { return channel_ != nullptr; }

   private:
    ApprovalChannel* channel_;
    Options options_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<RequestId, PendingApproval> table_;
    std::atomic<RequestId> nextId_;

    ThreadManager threads_;
};
