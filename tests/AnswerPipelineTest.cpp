#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <Providers.hpp>
#include <Random.hpp>
#include <approval/ApprovalBroker.hpp>
#include <map>
#include <poll/AnswerPipeline.hpp>
#include <poll/Validator.hpp>

#include "mocks/AnswerGenerator.hpp"
#include "mocks/ApprovalChannel.hpp"
#include "mocks/LocalConfirmation.hpp"
#include "mocks/Random.hpp"
#include "mocks/ResponseLog.hpp"
#include "mocks/Session.hpp"

using testing::_;
using testing::AllOf;
using testing::DoAll;
using testing::Field;
using testing::Invoke;
using testing::Optional;
using testing::Return;
using testing::SaveArg;

using namespace std::chrono_literals;

namespace {

PollRecord multipleChoice(std::size_t count) {
    PollRecord poll{.id = "p1",
                    .kind = PollKind::MultipleChoice,
                    .title = "Which one?"};
    for (std::size_t i = 0; i < count; ++i) {
        poll.options.push_back(
            {.id = fmt::format("o{}", i), .label = fmt::format("Option {}", i)});
    }
    return poll;
}

PollRecord freeText() {
    return {.id = "p2", .kind = PollKind::FreeText, .title = "How are you?"};
}

TextResponse text(std::string value, double confidence = 0.9) {
    return {.text = std::move(value),
            .confidence = confidence,
            .reasoning = "sounds human"};
}

}  // namespace

class AnswerPipelineTest : public ::testing::Test {
   protected:
    void SetUp() override {
        ON_CALL(channel, notify(_, _, _))
            .WillByDefault(Return(absl::OkStatus()));
        ApprovalBroker::Options options;
        options.startListener = false;
        options.startReaper = false;
        broker = std::make_unique<ApprovalBroker>(&channel, options);
        config.approvalTimeout = 100ms;
        config.localConfirmTimeout = 100ms;
    }

    AnswerPipeline make(AnswerGenerator* gen, ApprovalBroker* approvals,
                        LocalConfirmation* confirmation) {
        return {config, &providers, gen, validator, approvals, confirmation};
    }

    // Resolves every notified request from inside notify()
    void approverDoes(ApprovalAction action,
                      std::optional<std::string> modified = std::nullopt) {
        EXPECT_CALL(channel, notify(_, _, _))
            .WillOnce([this, action, modified](RequestId id,
                                               const AnswerCandidate&,
                                               std::string_view) {
                broker->resolve(id, action, modified);
                return absl::OkStatus();
            });
    }

    MockRandom random;
    testing::NiceMock<MockResponseLog> responseLog;
    Providers providers{&random, nullptr, nullptr, &responseLog};
    testing::StrictMock<MockAnswerGenerator> generator;
    testing::NiceMock<MockApprovalChannel> channel;
    std::unique_ptr<ApprovalBroker> broker;
    testing::StrictMock<MockLocalConfirmation> local;
    testing::StrictMock<MockSession> session;
    Validator validator;
    AnswerPipeline::Config config;
};

TEST_F(AnswerPipelineTest, OptionWindow) {
    const auto options = multipleChoice(5).options;
    EXPECT_EQ(AnswerPipeline::optionWindow(options, 0, std::nullopt).size(), 5);
    const auto window = AnswerPipeline::optionWindow(options, 1, 3);
    ASSERT_EQ(window.size(), 2);
    EXPECT_EQ(window[0].id, "o1");
    EXPECT_EQ(window[1].id, "o2");
    EXPECT_EQ(AnswerPipeline::optionWindow(options, 2, 100).size(), 3);
    EXPECT_TRUE(AnswerPipeline::optionWindow(options, 5, std::nullopt).empty());
    EXPECT_TRUE(AnswerPipeline::optionWindow(options, 3, 3).empty());
}

TEST_F(AnswerPipelineTest, RandomPickWithinWindow) {
    config.minOption = 1;
    config.maxOption = 3;
    EXPECT_CALL(random, generate(0, 1)).WillOnce(Return(1));
    auto pipeline = make(nullptr, nullptr, nullptr);

    const auto attempt = pipeline.answer(multipleChoice(5));
    ASSERT_TRUE(attempt.status.ok()) << attempt.status;
    EXPECT_THAT(attempt.answer,
                Optional(Answer{.kind = PollKind::MultipleChoice, .value = "o2"}));
    ASSERT_TRUE(attempt.candidate.has_value());
    EXPECT_EQ(attempt.candidate->reasoning, "random selection");
    EXPECT_EQ(attempt.candidate->confidence, 0);
}

TEST_F(AnswerPipelineTest, RandomPickCoversWholeWindow) {
    Random real;
    Providers realProviders{&real, nullptr, nullptr, nullptr};
    AnswerPipeline pipeline(config, &realProviders, nullptr, validator,
                            nullptr, nullptr);

    std::map<std::string, int> counts;
    for (int i = 0; i < 600; ++i) {
        const auto attempt = pipeline.answer(multipleChoice(3));
        ASSERT_TRUE(attempt.answer.has_value());
        ++counts[attempt.answer->value];
    }
    ASSERT_EQ(counts.size(), 3);
    for (const auto& [id, count] : counts) {
        EXPECT_GT(count, 100) << id;
    }
}

TEST_F(AnswerPipelineTest, EmptyOptionRange) {
    config.minOption = 5;
    auto pipeline = make(&generator, nullptr, nullptr);

    const auto attempt = pipeline.answer(multipleChoice(3));
    EXPECT_TRUE(absl::IsOutOfRange(attempt.status));
    EXPECT_EQ(attempt.status.message(),
              "Could not answer poll: poll only has 3 options but min option "
              "was 5 and max option was none");
    EXPECT_FALSE(attempt.answer.has_value());
}

TEST_F(AnswerPipelineTest, GeneratorSelectsFromWindow) {
    config.minOption = 1;
    std::vector<PollOption> offered;
    EXPECT_CALL(generator, selectOption(std::string_view("Which one?"), _))
        .WillOnce(DoAll(SaveArg<1>(&offered),
                        Return(OptionSelection{.optionIndex = 0,
                                               .confidence = 0.8,
                                               .reasoning = "obvious"})));
    auto pipeline = make(&generator, nullptr, nullptr);

    const auto attempt = pipeline.answer(multipleChoice(3));
    ASSERT_TRUE(attempt.status.ok()) << attempt.status;
    EXPECT_EQ(offered.size(), 2);
    EXPECT_EQ(attempt.answer->value, "o1");
    EXPECT_EQ(attempt.candidate->reasoning, "obvious");
}

TEST_F(AnswerPipelineTest, GeneratorIndexOutOfRange) {
    EXPECT_CALL(generator, selectOption(_, _))
        .WillOnce(Return(OptionSelection{.optionIndex = 3}));
    auto pipeline = make(&generator, nullptr, nullptr);

    const auto attempt = pipeline.answer(multipleChoice(3));
    EXPECT_TRUE(absl::IsInternal(attempt.status));
}

TEST_F(AnswerPipelineTest, MultipleChoiceIsNeverReviewed) {
    EXPECT_CALL(generator, selectOption(_, _))
        .WillOnce(Return(OptionSelection{.optionIndex = 2, .confidence = 0.1}));
    EXPECT_CALL(channel, notify(_, _, _)).Times(0);
    auto pipeline = make(&generator, broker.get(), &local);

    const auto attempt = pipeline.answer(multipleChoice(3));
    ASSERT_TRUE(attempt.status.ok());
    EXPECT_EQ(attempt.answer->value, "o2");
}

TEST_F(AnswerPipelineTest, RetriesUntilValid) {
    EXPECT_CALL(generator, generateText(std::string_view("How are you?")))
        .WillOnce(Return(text("As an AI, I don't experience feelings")))
        .WillOnce(Return(text("Moreover, I am well")))
        .WillOnce(Return(text("pretty tired tbh")));
    EXPECT_CALL(local, confirm(Field(&AnswerCandidate::text, "pretty tired tbh"),
                               std::string_view("How are you?"), 100ms))
        .WillOnce(Return(true));
    auto pipeline = make(&generator, nullptr, &local);

    const auto attempt = pipeline.answer(freeText());
    ASSERT_TRUE(attempt.status.ok()) << attempt.status;
    EXPECT_THAT(attempt.answer,
                Optional(Answer{.kind = PollKind::FreeText,
                                .value = "pretty tired tbh"}));
}

TEST_F(AnswerPipelineTest, RetriesExhausted) {
    EXPECT_CALL(generator, generateText(_))
        .Times(3)
        .WillRepeatedly(Return(text("Furthermore, I cannot say")));
    auto pipeline = make(&generator, broker.get(), &local);

    const auto attempt = pipeline.answer(freeText());
    EXPECT_TRUE(absl::IsResourceExhausted(attempt.status));
    EXPECT_FALSE(attempt.answer.has_value());
    ASSERT_TRUE(attempt.candidate.has_value());
    EXPECT_EQ(attempt.candidate->text, "Furthermore, I cannot say");
}

TEST_F(AnswerPipelineTest, GeneratorErrorIsNotRetried) {
    EXPECT_CALL(generator, generateText(_))
        .WillOnce(Return(absl::InternalError("overloaded")));
    EXPECT_CALL(local, confirm(_, _, _)).Times(0);
    auto pipeline = make(&generator, broker.get(), &local);

    const auto attempt = pipeline.answer(freeText());
    EXPECT_TRUE(absl::IsInternal(attempt.status));
    EXPECT_EQ(attempt.status.message(), "overloaded");
    EXPECT_FALSE(attempt.answer.has_value());
    EXPECT_FALSE(attempt.candidate.has_value());
}

TEST_F(AnswerPipelineTest, GeneratorErrorKeepsRejectedCandidate) {
    EXPECT_CALL(generator, generateText(_))
        .WillOnce(Return(text("Thus, no")))
        .WillOnce(Return(absl::InternalError("overloaded")));
    ResponseRecord logged;
    EXPECT_CALL(responseLog, append(_)).WillOnce(SaveArg<0>(&logged));
    auto pipeline = make(&generator, nullptr, &local);

    EXPECT_TRUE(
        absl::IsInternal(pipeline.answerAndSubmit(freeText(), session)));
    EXPECT_EQ(logged.outcome, ResponseRecord::Outcome::NoAnswer);
    EXPECT_EQ(logged.detail, "overloaded");
    ASSERT_TRUE(logged.candidate.has_value());
    EXPECT_EQ(logged.candidate->text, "Thus, no");
}

TEST_F(AnswerPipelineTest, MaxRetriesIsHonored) {
    config.maxRetries = 5;
    EXPECT_CALL(generator, generateText(_))
        .Times(5)
        .WillRepeatedly(Return(text("fine", 0.2)));
    auto pipeline = make(&generator, nullptr, &local);

    EXPECT_TRUE(absl::IsResourceExhausted(pipeline.answer(freeText()).status));
}

TEST_F(AnswerPipelineTest, FreeTextWithoutGenerator) {
    auto pipeline = make(nullptr, broker.get(), &local);
    EXPECT_TRUE(absl::IsInternal(pipeline.answer(freeText()).status));
}

TEST_F(AnswerPipelineTest, RemoteApprove) {
    EXPECT_CALL(generator, generateText(_)).WillOnce(Return(text("good")));
    approverDoes(ApprovalAction::Approve);
    auto pipeline = make(&generator, broker.get(), &local);

    const auto attempt = pipeline.answer(freeText());
    ASSERT_TRUE(attempt.status.ok()) << attempt.status;
    EXPECT_EQ(attempt.answer->value, "good");
    EXPECT_EQ(broker->size(), 0);
}

TEST_F(AnswerPipelineTest, RemoteEditReplacesText) {
    EXPECT_CALL(generator, generateText(_)).WillOnce(Return(text("good")));
    approverDoes(ApprovalAction::Edit, "great actually");
    auto pipeline = make(&generator, broker.get(), &local);

    const auto attempt = pipeline.answer(freeText());
    ASSERT_TRUE(attempt.status.ok()) << attempt.status;
    EXPECT_EQ(attempt.answer->value, "great actually");
    EXPECT_EQ(attempt.candidate->text, "good");
}

TEST_F(AnswerPipelineTest, RemoteReject) {
    EXPECT_CALL(generator, generateText(_)).WillOnce(Return(text("good")));
    approverDoes(ApprovalAction::Reject);
    auto pipeline = make(&generator, broker.get(), &local);

    const auto attempt = pipeline.answer(freeText());
    EXPECT_TRUE(absl::IsCancelled(attempt.status));
    EXPECT_FALSE(attempt.answer.has_value());
}

TEST_F(AnswerPipelineTest, RemoteTimeout) {
    EXPECT_CALL(generator, generateText(_)).WillOnce(Return(text("good")));
    EXPECT_CALL(channel, notify(_, _, _)).WillOnce(Return(absl::OkStatus()));
    auto pipeline = make(&generator, broker.get(), &local);

    const auto attempt = pipeline.answer(freeText());
    EXPECT_TRUE(absl::IsDeadlineExceeded(attempt.status));
    EXPECT_EQ(broker->size(), 0);
}

TEST_F(AnswerPipelineTest, FallsBackToLocalWhenChannelFails) {
    EXPECT_CALL(generator, generateText(_)).WillOnce(Return(text("good")));
    EXPECT_CALL(channel, notify(_, _, _))
        .WillOnce(Return(absl::UnavailableError("no network")));
    EXPECT_CALL(local, confirm(_, _, _)).WillOnce(Return(false));
    auto pipeline = make(&generator, broker.get(), &local);

    const auto attempt = pipeline.answer(freeText());
    EXPECT_TRUE(absl::IsCancelled(attempt.status));
}

TEST_F(AnswerPipelineTest, NoConfirmationAtAllCancels) {
    EXPECT_CALL(generator, generateText(_)).WillOnce(Return(text("good")));
    auto pipeline = make(&generator, nullptr, nullptr);
    EXPECT_TRUE(absl::IsCancelled(pipeline.answer(freeText()).status));
}

TEST_F(AnswerPipelineTest, SubmitsAndLogsOnce) {
    EXPECT_CALL(random, generate(0, 2)).WillOnce(Return(0));
    EXPECT_CALL(session, submitAnswer(Field(&PollRecord::id, "p1"),
                                      Answer{.kind = PollKind::MultipleChoice,
                                             .value = "o0"}))
        .WillOnce(Return(absl::OkStatus()));
    EXPECT_CALL(responseLog,
                append(AllOf(Field(&ResponseRecord::outcome,
                                   ResponseRecord::Outcome::Submitted),
                             Field(&ResponseRecord::finalText,
                                   Optional(std::string("o0"))))))
        .Times(1);
    auto pipeline = make(nullptr, nullptr, nullptr);

    EXPECT_TRUE(pipeline.answerAndSubmit(multipleChoice(3), session).ok());
}

TEST_F(AnswerPipelineTest, SubmissionFailureIsLoggedAsDropped) {
    EXPECT_CALL(random, generate(0, 2)).WillOnce(Return(1));
    EXPECT_CALL(session, submitAnswer(_, _))
        .WillOnce(Return(absl::UnavailableError("reset")));
    ResponseRecord logged;
    EXPECT_CALL(responseLog, append(_)).WillOnce(SaveArg<0>(&logged));
    auto pipeline = make(nullptr, nullptr, nullptr);

    EXPECT_TRUE(absl::IsUnavailable(
        pipeline.answerAndSubmit(multipleChoice(3), session)));
    EXPECT_EQ(logged.outcome, ResponseRecord::Outcome::Dropped);
    EXPECT_THAT(logged.detail, testing::StartsWith("submission failed: "));
}

TEST_F(AnswerPipelineTest, RejectedIsLoggedAsDroppedWithoutSubmit) {
    EXPECT_CALL(generator, generateText(_)).WillOnce(Return(text("good")));
    approverDoes(ApprovalAction::Reject);
    ResponseRecord logged;
    EXPECT_CALL(responseLog, append(_)).WillOnce(SaveArg<0>(&logged));
    auto pipeline = make(&generator, broker.get(), &local);

    EXPECT_TRUE(
        absl::IsCancelled(pipeline.answerAndSubmit(freeText(), session)));
    EXPECT_EQ(logged.outcome, ResponseRecord::Outcome::Dropped);
    ASSERT_TRUE(logged.candidate.has_value());
    EXPECT_EQ(logged.candidate->text, "good");
}

TEST_F(AnswerPipelineTest, InvalidIsLoggedAsNoAnswer) {
    EXPECT_CALL(generator, generateText(_))
        .Times(3)
        .WillRepeatedly(Return(text("As an AI, I cannot answer that")));
    ResponseRecord logged;
    EXPECT_CALL(responseLog, append(_)).WillOnce(SaveArg<0>(&logged));
    auto pipeline = make(&generator, broker.get(), &local);

    EXPECT_TRUE(absl::IsResourceExhausted(
        pipeline.answerAndSubmit(freeText(), session)));
    EXPECT_EQ(logged.outcome, ResponseRecord::Outcome::NoAnswer);
    EXPECT_FALSE(logged.finalText.has_value());
}
