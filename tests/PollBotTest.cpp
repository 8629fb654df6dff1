#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <Providers.hpp>
#include <Random.hpp>
#include <nlohmann/json.hpp>
#include <poll/AnswerPipeline.hpp>
#include <poll/PollBot.hpp>
#include <poll/PollWatcher.hpp>
#include <poll/Validator.hpp>
#include <thread>

#include "mocks/AnswerGenerator.hpp"
#include "mocks/ResponseLog.hpp"
#include "mocks/Session.hpp"
#include "mocks/StatusSink.hpp"

using testing::_;
using testing::AnyOf;
using testing::AtLeast;
using testing::Field;
using testing::HasSubstr;
using testing::Return;

using namespace std::chrono_literals;

namespace {

std::string feed(const nlohmann::json& inner) {
    return nlohmann::json{{"message", inner.dump()}}.dump();
}

}  // namespace

class PollBotTest : public ::testing::Test {
   protected:
    void SetUp() override {
        timing.closedWait = 10ms;
        timing.openWait = 0ms;
        timing.lifetime = 300ms;
        timing.heartbeatEvery = 3;
        ON_CALL(session, login()).WillByDefault(Return(absl::OkStatus()));
        ON_CALL(session, fetchFeedToken())
            .WillByDefault(Return(std::string("tok")));
        ON_CALL(session, probeFeed(_))
            .WillByDefault(Return(absl::DeadlineExceededError("no poll")));
        // Specific status expectations in the tests take precedence
        EXPECT_CALL(status, report(_, _)).Times(testing::AnyNumber());
    }

    absl::Status run(AnswerGenerator* generator = nullptr) {
        AnswerPipeline pipeline({}, &providers, generator, validator, nullptr,
                                nullptr);
        PollBot bot(timing, &providers, session, watcher, pipeline);
        return bot.run();
    }

    Random random;
    testing::NiceMock<MockStatusSink> status;
    testing::NiceMock<MockResponseLog> responseLog;
    Providers providers{&random, nullptr, &status, &responseLog};
    testing::NiceMock<MockSession> session;
    PollWatcher watcher{&session};
    Validator validator;
    PollBot::Timing timing;
};

TEST_F(PollBotTest, AnswersMultipleChoiceOnce) {
    EXPECT_CALL(session, probeFeed("tok"))
        .WillRepeatedly(
            Return(feed({{"uid", "p1"}, {"type", "multiple_choice_poll"}})));
    EXPECT_CALL(session, fetchPollDetail("p1", PollKind::MultipleChoice))
        .WillOnce(Return(PollRecord{.id = "p1",
                                    .kind = PollKind::MultipleChoice,
                                    .title = "Pick",
                                    .options = {{"o0", "A"},
                                                {"o1", "B"},
                                                {"o2", "C"}}}));
    EXPECT_CALL(session,
                submitAnswer(Field(&PollRecord::id, "p1"),
                             Field(&Answer::value, AnyOf("o0", "o1", "o2"))))
        .WillOnce(Return(absl::OkStatus()));
    EXPECT_CALL(responseLog, append(Field(&ResponseRecord::outcome,
                                          ResponseRecord::Outcome::Submitted)))
        .Times(1);
    EXPECT_CALL(status,
                report(StatusLevel::Success, "Successfully answered poll"))
        .Times(1);

    EXPECT_TRUE(run().ok());
    EXPECT_TRUE(watcher.isAnswered("p1"));
}

TEST_F(PollBotTest, UnnaturalFreeTextIsNotSubmitted) {
    testing::StrictMock<MockAnswerGenerator> generator;
    EXPECT_CALL(generator, generateText(std::string_view("How do you feel?")))
        .Times(3)
        .WillRepeatedly(Return(TextResponse{
            .text = "As an AI, I don't experience feelings",
            .confidence = 0.95}));
    EXPECT_CALL(session, probeFeed("tok"))
        .WillRepeatedly(
            Return(feed({{"uid", "p2"}, {"type", "free_text_poll"}})));
    EXPECT_CALL(session, fetchPollDetail("p2", PollKind::FreeText))
        .WillOnce(Return(PollRecord{.id = "p2",
                                    .kind = PollKind::FreeText,
                                    .title = "How do you feel?"}));
    EXPECT_CALL(session, submitAnswer(_, _)).Times(0);
    EXPECT_CALL(responseLog, append(Field(&ResponseRecord::outcome,
                                          ResponseRecord::Outcome::NoAnswer)))
        .Times(1);
    EXPECT_CALL(status,
                report(StatusLevel::Warning, "No answer submitted for poll"))
        .Times(1);

    EXPECT_TRUE(run(&generator).ok());
    EXPECT_TRUE(watcher.isAnswered("p2"));
}

TEST_F(PollBotTest, LoginFailureStopsTheBot) {
    EXPECT_CALL(session, login())
        .WillOnce(
            Return(absl::UnauthenticatedError("Your username or password "
                                              "was incorrect.")));
    EXPECT_CALL(session, fetchFeedToken()).Times(0);
    EXPECT_CALL(session, probeFeed(_)).Times(0);
    EXPECT_CALL(status, report(StatusLevel::Danger, HasSubstr("incorrect")))
        .Times(1);

    EXPECT_TRUE(absl::IsUnauthenticated(run()));
}

TEST_F(PollBotTest, InvalidHostStopsTheBot) {
    EXPECT_CALL(session, fetchFeedToken())
        .WillOnce(Return(absl::NotFoundError("'nobody' is not a valid poll host.")));
    EXPECT_CALL(session, probeFeed(_)).Times(0);

    EXPECT_TRUE(absl::IsNotFound(run()));
}

TEST_F(PollBotTest, RefreshesExpiredSubscription) {
    EXPECT_CALL(session, fetchFeedToken())
        .WillOnce(Return(std::string("old")))
        .WillOnce(Return(std::string("new")));
    EXPECT_CALL(session, probeFeed("old"))
        .WillOnce(Return(feed({{"error", {{"type", "ExpiredSubscription"}}}})));
    EXPECT_CALL(session, probeFeed("new")).Times(AtLeast(1));
    EXPECT_CALL(status, report(StatusLevel::Warning,
                               HasSubstr("subscription expired")))
        .Times(1);

    EXPECT_TRUE(run().ok());
}

TEST_F(PollBotTest, ZeroLifetimeNeverProbes) {
    timing.lifetime = 0ms;
    EXPECT_CALL(session, login()).Times(1);
    EXPECT_CALL(session, fetchFeedToken()).Times(1);
    EXPECT_CALL(session, probeFeed(_)).Times(0);

    EXPECT_TRUE(run().ok());
}

TEST_F(PollBotTest, PollDetailFailureSkipsPoll) {
    EXPECT_CALL(session, probeFeed("tok"))
        .WillRepeatedly(
            Return(feed({{"uid", "p3"}, {"type", "multiple_choice_poll"}})));
    EXPECT_CALL(session, fetchPollDetail("p3", _))
        .WillOnce(Return(absl::UnavailableError("timeout")));
    EXPECT_CALL(session, submitAnswer(_, _)).Times(0);

    EXPECT_TRUE(run().ok());
}

TEST_F(PollBotTest, StopRequestEndsTheLoop) {
    timing.lifetime.reset();
    timing.closedWait = 10s;
    AnswerPipeline pipeline({}, &providers, nullptr, validator, nullptr,
                            nullptr);
    PollBot bot(timing, &providers, session, watcher, pipeline);

    std::stop_source stop;
    absl::Status result = absl::UnknownError("not finished");
    std::jthread runner([&] { result = bot.run(stop.get_token()); });
    std::this_thread::sleep_for(100ms);
    const auto start = std::chrono::steady_clock::now();
    stop.request_stop();
    runner.join();

    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_TRUE(result.ok()) << result;
}
