#include <absl/status/status.h>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include <approval/ApprovalBroker.hpp>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <utility>

#include <AbslLogCompat.hpp>

namespace {

// Forwards remote actions from the channel into the broker.
class ChannelListener : public ThreadRunner {
   public:
    ChannelListener(ApprovalChannel* channel, ApprovalResolver* resolver)
        : channel_(channel), resolver_(resolver) {}

   protected:
    void runFunction(const std::stop_token& token) override {
        channel_->listen(resolver_, token);
    }
    void onPreStop() override { channel_->interrupt(); }

   private:
    ApprovalChannel* channel_;
    ApprovalResolver* resolver_;
};

// Periodically expires requests nobody is waiting for anymore.
class Reaper : public ThreadRunner {
   public:
    Reaper(ApprovalBroker* broker, std::chrono::milliseconds interval)
        : broker_(broker), interval_(interval) {}

   protected:
    void runFunction(const std::stop_token& token) override {
        while (!token.stop_requested()) {
            std::unique_lock<std::mutex> lock(mutex_);
            if (condvar_.wait_for(lock, interval_,
                                  [token] { return token.stop_requested(); })) {
                break;
            }
            lock.unlock();
            const auto reaped = broker_->reapExpired();
            LOG_IF(INFO, !reaped.empty())
                << "Reaper removed " << reaped.size() << " stale request(s)";
        }
    }

    void onPreStop() override {
        { std::lock_guard<std::mutex> lock(mutex_); }
        condvar_.notify_all();
    }

   private:
    ApprovalBroker* broker_;
    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    std::condition_variable condvar_;
};

RequestId initialRequestId() {
    // Start from wall clock milliseconds so that ids never repeat across
    // restarts, in case an old button is pressed after a restart.
    return static_cast<RequestId>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
}

}  // namespace

ApprovalBroker::ApprovalBroker(ApprovalChannel* channel)
    : ApprovalBroker(channel, Options{}) {}

ApprovalBroker::ApprovalBroker(ApprovalChannel* channel, Options options)
    : channel_(channel),
      options_(std::move(options)),
      nextId_(initialRequestId()) {
    if (channel_ == nullptr) {
        LOG(INFO) << "No approval channel, answers are confirmed locally";
        return;
    }
    if (options_.startListener) {
        threads_.create<ChannelListener>(
            ThreadManager::Usage::APPROVAL_LISTENER_THREAD, channel_, this);
    }
    if (options_.startReaper) {
        threads_.create<Reaper>(ThreadManager::Usage::APPROVAL_REAPER_THREAD,
                                this, options_.reapInterval);
    }
}

ApprovalBroker::~ApprovalBroker() { threads_.destroy(); }

absl::StatusOr<RequestId> ApprovalBroker::requestApproval(
    const AnswerCandidate& candidate, const std::string_view question) {
    if (channel_ == nullptr) {
        return absl::FailedPreconditionError("No approval channel configured");
    }

    const RequestId id = nextId_++;
    {
        const std::lock_guard<std::mutex> lock(mutex_);
        table_.emplace(id, PendingApproval{.requestId = id,
                                           .candidate = candidate,
                                           .question = std::string(question),
                                           .createdAt = options_.clock()});
    }

    if (auto status = channel_->notify(id, candidate, question); !status.ok()) {
        LOG(WARNING) << fmt::format("Could not send request {} for approval: {}",
                                    id, status.ToString());
        const std::lock_guard<std::mutex> lock(mutex_);
        table_.erase(id);
        return status;
    }
    LOG(INFO) << "Sent response " << id << " for approval";
    return id;
}

bool ApprovalBroker::resolve(const RequestId id, const ApprovalAction action,
                             std::optional<std::string> modifiedText) {
    {
        const std::lock_guard<std::mutex> lock(mutex_);
        auto it = table_.find(id);
        if (it == table_.end() ||
            it->second.status != ApprovalStatus::Pending) {
            DLOG(INFO) << fmt::format("Ignoring late '{}' for request {}",
                                      toString(action), id);
            return false;
        }
        switch (action) {
            case ApprovalAction::Approve:
            case ApprovalAction::Edit:
                it->second.status = ApprovalStatus::Approved;
                it->second.modifiedText = std::move(modifiedText);
                break;
            case ApprovalAction::Reject:
                it->second.status = ApprovalStatus::Rejected;
                break;
        }
    }
    cv_.notify_all();
    LOG(INFO) << fmt::format("Request {} resolved with '{}'", id,
                             toString(action));
    return true;
}

ApprovalOutcome ApprovalBroker::awaitResolution(
    const RequestId id, const std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, deadline, [this, id] {
        auto it = table_.find(id);
        return it == table_.end() ||
               it->second.status != ApprovalStatus::Pending;
    });

    auto it = table_.find(id);
    if (it == table_.end()) {
        LOG(INFO) << "Request " << id << " was already expired";
        return {.kind = ApprovalOutcome::Kind::Expired};
    }

    ApprovalOutcome outcome;
    switch (it->second.status) {
        case ApprovalStatus::Approved:
            outcome.kind = ApprovalOutcome::Kind::Approved;
            outcome.modifiedText = std::move(it->second.modifiedText);
            break;
        case ApprovalStatus::Rejected:
            outcome.kind = ApprovalOutcome::Kind::Rejected;
            break;
        case ApprovalStatus::Pending:
            it->second.status = ApprovalStatus::Rejected;
            outcome.kind = ApprovalOutcome::Kind::TimedOut;
            LOG(INFO) << fmt::format("Request {} timed out after {}", id,
                                     timeout);
            break;
    }
    table_.erase(it);
    return outcome;
}

std::vector<PendingApproval> ApprovalBroker::reapExpired() {
    std::vector<PendingApproval> reaped;
    {
        const std::lock_guard<std::mutex> lock(mutex_);
        const auto now = options_.clock();
        for (auto it = table_.begin(); it != table_.end();) {
            if (now - it->second.createdAt <= options_.ttl) {
                ++it;
                continue;
            }
            if (it->second.status == ApprovalStatus::Pending) {
                it->second.status = ApprovalStatus::Rejected;
                LOG(INFO) << "Response " << it->first
                          << " expired and auto-rejected";
            } else {
                LOG(INFO) << "Dropping unclaimed response " << it->first;
            }
            reaped.emplace_back(std::move(it->second));
            it = table_.erase(it);
        }
    }
    if (!reaped.empty()) {
        cv_.notify_all();
    }
    return reaped;
}

std::optional<ApprovalStatus> ApprovalBroker::statusOf(
    const RequestId id) const {
    const std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = table_.find(id); it != table_.end()) {
        return it->second.status;
    }
    return std::nullopt;
}

bool ApprovalBroker::isPending(const RequestId id) const {
    return statusOf(id) == ApprovalStatus::Pending;
}

std::size_t ApprovalBroker::size() const {
    const std::lock_guard<std::mutex> lock(mutex_);
    return table_.size();
}
