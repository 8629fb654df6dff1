#include <gtest/gtest.h>

#include <pollev/PollEvSession.hpp>

TEST(PollEvSessionTest, FeedToken) {
    const auto token =
        PollEvSession::parseFeedToken(R"({"firehose_token": "abc.def"})", "h");
    ASSERT_TRUE(token.ok()) << token.status();
    EXPECT_EQ(*token, "abc.def");
}

TEST(PollEvSessionTest, NullFeedTokenIsEmpty) {
    const auto token =
        PollEvSession::parseFeedToken(R"({"firehose_token": null})", "h");
    ASSERT_TRUE(token.ok()) << token.status();
    EXPECT_TRUE(token->empty());
}

TEST(PollEvSessionTest, UnknownHost) {
    const auto token = PollEvSession::parseFeedToken(
        R"({"message": "Presenter not found"})", "nobody");
    EXPECT_TRUE(absl::IsNotFound(token.status()));
    EXPECT_EQ(token.status().message(), "'nobody' is not a valid poll host.");
}

TEST(PollEvSessionTest, GarbageFeedToken) {
    EXPECT_TRUE(absl::IsUnavailable(
        PollEvSession::parseFeedToken("<html>", "h").status()));
    EXPECT_TRUE(absl::IsUnavailable(
        PollEvSession::parseFeedToken("{}", "h").status()));
}

TEST(PollEvSessionTest, MultipleChoiceDetail) {
    const auto poll = PollEvSession::parsePollDetail(
        R"({"title": "Best color?", "options": [
              {"id": 11, "value": "red", "humanized_value": "Red"},
              {"id": 12, "value": "blue"}]})",
        "p1", PollKind::MultipleChoice);
    ASSERT_TRUE(poll.ok()) << poll.status();
    EXPECT_EQ(poll->id, "p1");
    EXPECT_EQ(poll->title, "Best color?");
    EXPECT_EQ(poll->options,
              (std::vector<PollOption>{{"11", "Red"}, {"12", "blue"}}));
}

TEST(PollEvSessionTest, FreeTextDetailHasNoOptions) {
    const auto poll = PollEvSession::parsePollDetail(
        R"({"title": "Thoughts?", "options": [{"id": 1, "value": "x"}]})", "p2",
        PollKind::FreeText);
    ASSERT_TRUE(poll.ok());
    EXPECT_EQ(poll->kind, PollKind::FreeText);
    EXPECT_TRUE(poll->options.empty());
}

TEST(PollEvSessionTest, MalformedDetail) {
    EXPECT_FALSE(PollEvSession::parsePollDetail("nope", "p3",
                                                PollKind::MultipleChoice)
                     .ok());
    EXPECT_FALSE(PollEvSession::parsePollDetail(
                     R"({"options": [{"value": "no id"}]})", "p3",
                     PollKind::MultipleChoice)
                     .ok());
}

TEST(PollEvSessionTest, SessionIdFromFormAction) {
    EXPECT_EQ(PollEvSession::extractSessionId(
                  "/idp/profile/SAML2/Redirect/SSO;jsessionid=ABC123.node1"
                  "?execution=e1s1"),
              "ABC123");
    EXPECT_EQ(PollEvSession::extractSessionId("/idp/profile/SSO"), "");
}

TEST(PollEvSessionTest, AuthTokenFromRedirect) {
    EXPECT_EQ(PollEvSession::extractAuthToken(
                  "https://pollev.com/?pe_auth_token=tok123&other=1"),
              "tok123");
    EXPECT_EQ(
        PollEvSession::extractAuthToken("https://pollev.com/?pe_auth_token=z"),
        "z");
    EXPECT_EQ(PollEvSession::extractAuthToken("https://pollev.com/"), "");
}
