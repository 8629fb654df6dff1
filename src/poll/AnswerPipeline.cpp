#include <absl/status/status.h>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include <DurationPoint.hpp>
#include <Providers.hpp>
#include <algorithm>
#include <approval/ApprovalBroker.hpp>
#include <llm/AnswerGenerator.hpp>
#include <poll/AnswerPipeline.hpp>
#include <poll/Errors.hpp>
#include <poll/LocalConfirmation.hpp>
#include <poll/ResponseLog.hpp>
#include <poll/Session.hpp>
#include <poll/Validator.hpp>
#include <utility>

#include <AbslLogCompat.hpp>

AnswerPipeline::AnswerPipeline(Config config, Providers* providers,
                               AnswerGenerator* generator,
                               const Validator& validator,
                               ApprovalBroker* broker, LocalConfirmation* local)
    : config_(std::move(config)),
      providers_(providers),
      generator_(generator),
      validator_(validator),
      broker_(broker),
      local_(local) {}

std::vector<PollOption> AnswerPipeline::optionWindow(
    const std::vector<PollOption>& options, const std::size_t minOption,
    const std::optional<std::size_t> maxOption) {
    const std::size_t end =
        std::min(maxOption.value_or(options.size()), options.size());
    if (minOption >= end) {
        return {};
    }
    return {options.begin() + static_cast<std::ptrdiff_t>(minOption),
            options.begin() + static_cast<std::ptrdiff_t>(end)};
}

AnswerPipeline::Attempt AnswerPipeline::answer(const PollRecord& poll) {
    switch (poll.kind) {
        case PollKind::MultipleChoice:
            return answerMultipleChoice(poll);
        case PollKind::FreeText:
            return answerFreeText(poll);
    }
    return {.status = absl::InvalidArgumentError("Unknown poll kind")};
}

AnswerPipeline::Attempt AnswerPipeline::answerMultipleChoice(
    const PollRecord& poll) {
    const auto window =
        optionWindow(poll.options, config_.minOption, config_.maxOption);
    if (window.empty()) {
        auto message = fmt::format(
            "Could not answer poll: poll only has {} options but min option "
            "was {} and max option was {}",
            poll.options.size(), config_.minOption,
            config_.maxOption ? std::to_string(*config_.maxOption) : "none");
        LOG(ERROR) << message;
        return {.status = poll_errors::EmptyOptionRange(message)};
    }

    if (generator_ == nullptr) {
        const auto index =
            providers_->random->generate(static_cast<RandomBase::ret_type>(
                window.size() - 1));
        auto candidate = AnswerCandidate::option(
            window[static_cast<std::size_t>(index)].id, 0, "random selection");
        LOG(INFO) << "Randomly selected option " << candidate.selectedOptionId;
        Answer answer{.kind = PollKind::MultipleChoice,
                      .value = candidate.selectedOptionId};
        return {.candidate = std::move(candidate), .answer = std::move(answer)};
    }

    MilliSecondDP dp;
    auto selection = generator_->selectOption(poll.title, window);
    if (!selection.ok()) {
        LOG(ERROR) << "Generator failed for multiple choice: "
                   << selection.status();
        return {.status = selection.status()};
    }
    DLOG(INFO) << fmt::format("Generator took {}", dp.get());
    if (selection->optionIndex >= window.size()) {
        auto message = fmt::format("Generator picked option {} out of {}",
                                   selection->optionIndex, window.size());
        LOG(ERROR) << message;
        return {.status = poll_errors::GenerationError(message)};
    }

    auto candidate =
        AnswerCandidate::option(window[selection->optionIndex].id,
                                selection->confidence, selection->reasoning);
    LOG(INFO) << fmt::format("Selected option {} with confidence {:.2f}",
                             candidate.selectedOptionId, candidate.confidence);
    LOG(INFO) << "Reasoning: " << candidate.reasoning;
    Answer answer{.kind = PollKind::MultipleChoice,
                  .value = candidate.selectedOptionId};
    return {.candidate = std::move(candidate), .answer = std::move(answer)};
}

AnswerPipeline::Attempt AnswerPipeline::answerFreeText(const PollRecord& poll) {
    if (generator_ == nullptr) {
        LOG(WARNING) << "No generator configured, cannot answer free text poll";
        return {.status = poll_errors::GenerationError(
                    "No generator configured for free text")};
    }

    std::optional<AnswerCandidate> last;
    for (int attempt = 1; attempt <= config_.maxRetries; ++attempt) {
        auto response = generator_->generateText(poll.title);
        if (!response.ok()) {
            // Only validation failures are retried
            LOG(ERROR) << fmt::format("Attempt {}/{}: generator failed: {}",
                                      attempt, config_.maxRetries,
                                      response.status().ToString());
            return {.status = response.status(), .candidate = std::move(last)};
        }
        auto candidate = AnswerCandidate::freeText(
            std::move(response->text), response->confidence,
            std::move(response->reasoning));
        const auto violations = validator_.validate(candidate);
        if (violations.empty()) {
            LOG(INFO) << fmt::format("Valid response on attempt {}", attempt);
            return seekApproval(poll, std::move(candidate));
        }
        LOG(WARNING) << fmt::format("Attempt {}/{} rejected: {}", attempt,
                                    config_.maxRetries,
                                    Validator::describe(violations));
        last = std::move(candidate);
    }

    LOG(WARNING) << "Could not get a valid response, skipping poll";
    return {.status = poll_errors::ValidationExhausted(fmt::format(
                "No valid response after {} attempts", config_.maxRetries)),
            .candidate = std::move(last)};
}

AnswerPipeline::Attempt AnswerPipeline::seekApproval(
    const PollRecord& poll, AnswerCandidate candidate) {
    Attempt result{.candidate = candidate};

    bool remote = false;
    if (broker_ != nullptr && broker_->hasChannel()) {
        auto id = broker_->requestApproval(candidate, poll.title);
        if (id.ok()) {
            remote = true;
            const auto outcome =
                broker_->awaitResolution(*id, config_.approvalTimeout);
            switch (outcome.kind) {
                case ApprovalOutcome::Kind::Approved:
                    result.answer = Answer{
                        .kind = PollKind::FreeText,
                        .value = outcome.modifiedText.value_or(candidate.text)};
                    break;
                case ApprovalOutcome::Kind::Rejected:
                    result.status = poll_errors::ApprovalRejected(
                        "Response rejected by approver");
                    break;
                case ApprovalOutcome::Kind::TimedOut:
                    result.status = poll_errors::ApprovalTimeout(fmt::format(
                        "No approval within {}", config_.approvalTimeout));
                    break;
                case ApprovalOutcome::Kind::Expired:
                    result.status = poll_errors::ApprovalTimeout(
                        "Approval request expired");
                    break;
            }
        } else {
            LOG(WARNING) << "Remote approval unavailable, confirming locally: "
                         << id.status();
        }
    }

    if (!remote) {
        if (local_ != nullptr &&
            local_->confirm(candidate, poll.title,
                            config_.localConfirmTimeout)) {
            result.answer =
                Answer{.kind = PollKind::FreeText, .value = candidate.text};
        } else {
            result.status = poll_errors::ApprovalRejected(
                "Response cancelled by user");
        }
    }

    if (result.answer) {
        LOG(INFO) << "Using response: " << result.answer->value;
    } else {
        LOG(INFO) << "Response dropped: " << result.status.message();
    }
    return result;
}

absl::Status AnswerPipeline::answerAndSubmit(const PollRecord& poll,
                                             Session& session) {
    const Attempt attempt = answer(poll);
    absl::Status submitStatus;
    if (attempt.status.ok()) {
        submitStatus = session.submitAnswer(poll, *attempt.answer);
        LOG_IF(ERROR, !submitStatus.ok())
            << "Failed to submit answer for poll " << poll.id << ": "
            << submitStatus;
    }
    record(poll, attempt, submitStatus);
    return attempt.status.ok() ? submitStatus : attempt.status;
}

void AnswerPipeline::record(const PollRecord& poll, const Attempt& attempt,
                            const absl::Status& submitStatus) {
    if (!providers_->responseLog) {
        return;
    }
    ResponseRecord entry{.poll = poll, .candidate = attempt.candidate};
    if (attempt.answer) {
        entry.finalText = attempt.answer->value;
    }
    if (!attempt.status.ok()) {
        // Approver said no or never answered: the candidate existed
        const bool dropped = absl::IsCancelled(attempt.status) ||
                             absl::IsDeadlineExceeded(attempt.status);
        entry.outcome = dropped ? ResponseRecord::Outcome::Dropped
                                : ResponseRecord::Outcome::NoAnswer;
        entry.detail = std::string(attempt.status.message());
    } else if (!submitStatus.ok()) {
        entry.outcome = ResponseRecord::Outcome::Dropped;
        entry.detail = "submission failed: " + submitStatus.ToString();
    } else {
        entry.outcome = ResponseRecord::Outcome::Submitted;
    }
    providers_->responseLog->append(entry);
}
