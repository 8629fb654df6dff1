#pragma once

#include <absl/status/status.h>

#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

#include "PollTypes.hpp"

class AnswerGenerator;
class ApprovalBroker;
class LocalConfirmation;
class Providers;
class Session;
class Validator;

/**
 * Turns one PollRecord into an Answer, or into a reason not to answer.
 *
 * Multiple choice: random pick from the option window without a generator,
 * one generator call otherwise. Never reviewed.
 * Free text: up to maxRetries generator calls until one passes the
 * Validator, then a remote approval through the broker, falling back to a
 * local confirmation when the channel is missing or fails.
 */
class AnswerPipeline {
   public:
    struct Config {
        std::size_t minOption = 0;
        // Exclusive. nullopt means up to the last option.
        std::optional<std::size_t> maxOption;
        int maxRetries = 3;
        std::chrono::milliseconds approvalTimeout = std::chrono::seconds(60);
        std::chrono::milliseconds localConfirmTimeout =
            std::chrono::seconds(60);
    };

    // Result of answer(). status is OK exactly when answer is set.
    struct Attempt {
        absl::Status status;
        // Last candidate considered, if any was produced
        std::optional<AnswerCandidate> candidate;
        std::optional<Answer> answer;
    };

    // generator, broker and local may be nullptr.
    AnswerPipeline(Config config, Providers* providers,
                   AnswerGenerator* generator, const Validator& validator,
                   ApprovalBroker* broker, LocalConfirmation* local);

    Attempt answer(const PollRecord& poll);

    // answer(), then submit through the session if there is something to
    // submit, then append the outcome to the response log.
    absl::Status answerAndSubmit(const PollRecord& poll, Session& session);

    // options[minOption, maxOption), clamped to the list.
    static std::vector<PollOption> optionWindow(
        const std::vector<PollOption>& options, std::size_t minOption,
        std::optional<std::size_t> maxOption);

    [[nodiscard]] const Config& config() const { return config_; }

   private:
    Attempt answerMultipleChoice(const PollRecord& poll);
    Attempt answerFreeText(const PollRecord& poll);
    Attempt seekApproval(const PollRecord& poll, AnswerCandidate candidate);
    void record(const PollRecord& poll, const Attempt& attempt,
                const absl::Status& submitStatus);

    Config config_;
    Providers* providers_;
    AnswerGenerator* generator_;
    const Validator& validator_;
    ApprovalBroker* broker_;
    LocalConfirmation* local_;
};
