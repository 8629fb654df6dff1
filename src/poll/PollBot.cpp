#include <absl/status/status.h>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include <Providers.hpp>
#include <poll/AnswerPipeline.hpp>
#include <poll/Errors.hpp>
#include <poll/PollBot.hpp>
#include <poll/PollWatcher.hpp>
#include <poll/Session.hpp>
#include <string>

#include <AbslLogCompat.hpp>

namespace {

std::string secondsText(const std::chrono::milliseconds duration) {
    return fmt::format(
        "{}", std::chrono::duration_cast<std::chrono::seconds>(duration)
                  .count());
}

}  // namespace

PollBot::PollBot(Timing timing, Providers* providers, Session& session,
                 PollWatcher& watcher, AnswerPipeline& pipeline)
    : timing_(timing),
      providers_(providers),
      session_(session),
      watcher_(watcher),
      pipeline_(pipeline) {}

void PollBot::status(const StatusLevel level, const std::string_view message) {
    if (providers_ != nullptr && providers_->status) {
        providers_->status->report(level, message);
    } else {
        LOG(INFO) << message;
    }
    lastStatus_ = std::chrono::steady_clock::now();
}

bool PollBot::sleepFor(const std::chrono::milliseconds duration,
                       const std::stop_token& token) {
    std::unique_lock<std::mutex> lock(sleepMutex_);
    // Nothing notifies the condvar, only a stop request ends the wait early
    sleepCv_.wait_for(lock, token, duration, [] { return false; });
    return !token.stop_requested();
}

absl::Status PollBot::run(const std::stop_token& token) {
    status(StatusLevel::Info, "Bot starting...");
    if (auto loggedIn = session_.login(); !loggedIn.ok()) {
        LOG(ERROR) << "Login failed: " << loggedIn;
        status(StatusLevel::Danger, fmt::format("Error: {}", std::string(loggedIn.message())));
        return loggedIn;
    }
    status(StatusLevel::Success, "Successfully logged in to PollEv");

    auto feedToken = session_.fetchFeedToken();
    if (!feedToken.ok()) {
        LOG(ERROR) << "Cannot get feed token: " << feedToken.status();
        status(StatusLevel::Danger,
               fmt::format("Error: {}",
                           std::string(feedToken.status().message())));
        return feedToken.status();
    }
    status(StatusLevel::Success, "Connected to PollEv firehose");

    const auto start = std::chrono::steady_clock::now();
    const auto alive = [&] {
        if (token.stop_requested()) {
            return false;
        }
        return !timing_.lifetime ||
               std::chrono::steady_clock::now() < start + *timing_.lifetime;
    };

    int probeCount = 0;
    while (alive()) {
        ++probeCount;
        if (timing_.heartbeatEvery > 0 &&
            probeCount % timing_.heartbeatEvery == 0) {
            status(StatusLevel::Info, "Bot is running and checking for polls");
        }

        const auto result = watcher_.probe(*feedToken);
        switch (result.state) {
            case ProbeResult::State::SubscriptionExpired: {
                status(StatusLevel::Warning,
                       "Firehose subscription expired, getting new token");
                auto renewed = session_.fetchFeedToken();
                if (renewed.ok()) {
                    feedToken = std::move(renewed);
                    continue;
                }
                if (poll_errors::isFatal(renewed.status())) {
                    status(StatusLevel::Danger,
                           fmt::format("Error: {}",
                                       std::string(renewed.status().message())));
                    return renewed.status();
                }
                LOG(WARNING) << "Token refresh failed, retrying later: "
                             << renewed.status();
                sleepFor(timing_.closedWait, token);
                continue;
            }
            case ProbeResult::State::NoPoll:
            case ProbeResult::State::AlreadyAnswered: {
                const auto now = std::chrono::steady_clock::now();
                if (!lastStatus_ ||
                    now - *lastStatus_ > timing_.quietStatusInterval) {
                    status(StatusLevel::Info,
                           fmt::format("No new polls found. Checking again in "
                                       "{} seconds",
                                       secondsText(timing_.closedWait)));
                }
                sleepFor(timing_.closedWait, token);
                continue;
            }
            case ProbeResult::State::NewPoll:
                break;
        }

        status(StatusLevel::Success,
               fmt::format("New poll detected! Waiting {} seconds before "
                           "responding",
                           secondsText(timing_.openWait)));
        if (!sleepFor(timing_.openWait, token)) {
            break;
        }

        LOG(INFO) << fmt::format("Answering poll {} of type {}", result.id,
                                 result.kind);
        auto poll = session_.fetchPollDetail(result.id, result.kind);
        if (!poll.ok()) {
            LOG(ERROR) << "Cannot fetch poll " << result.id << ": "
                       << poll.status();
            status(StatusLevel::Warning, "No answer submitted for poll");
            continue;
        }

        const auto answered = pipeline_.answerAndSubmit(*poll, session_);
        if (answered.ok()) {
            status(StatusLevel::Success, "Successfully answered poll");
        } else {
            LOG(INFO) << "Poll " << result.id << " not answered: " << answered;
            status(StatusLevel::Warning, "No answer submitted for poll");
        }
    }

    LOG(INFO) << fmt::format("Bot stopped after {} probes, {} polls seen",
                             probeCount, watcher_.answeredCount());
    return absl::OkStatus();
}
