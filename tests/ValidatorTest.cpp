#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <poll/Validator.hpp>
#include <string>

using testing::ElementsAre;
using testing::Field;
using testing::IsEmpty;

class ValidatorTest : public ::testing::Test {
   protected:
    static std::vector<Violation::Kind> kinds(
        const std::vector<Violation>& violations) {
        std::vector<Violation::Kind> out;
        out.reserve(violations.size());
        for (const auto& v : violations) {
            out.emplace_back(v.kind);
        }
        return out;
    }

    static AnswerCandidate candidate(std::string text,
                                     double confidence = 0.9) {
        return AnswerCandidate::freeText(std::move(text), confidence, "");
    }

    Validator validator;
};

TEST_F(ValidatorTest, CasualAnswerPasses) {
    EXPECT_THAT(validator.validate(candidate("pretty tired, need coffee")),
                IsEmpty());
}

TEST_F(ValidatorTest, DisclosureIsCaseInsensitive) {
    EXPECT_THAT(kinds(validator.validate("As an AI, I cannot answer that")),
                ElementsAre(Violation::Kind::Disclosure));
    EXPECT_THAT(kinds(validator.validate("AS AN ai i guess")),
                ElementsAre(Violation::Kind::Disclosure));
}

TEST_F(ValidatorTest, DisclosureMatchesWholeWordsOnly) {
    // "ai" inside "said" or "claim" is not a self reference
    EXPECT_THAT(validator.validate("she said they would claim it"), IsEmpty());
    EXPECT_THAT(kinds(validator.validate("i apologize, no idea")),
                ElementsAre(Violation::Kind::Disclosure));
}

TEST_F(ValidatorTest, FormalRegister) {
    EXPECT_THAT(kinds(validator.validate("Moreover it depends")),
                ElementsAre(Violation::Kind::FormalRegister));
    EXPECT_THAT(validator.validate("thusly is not a word i use"), IsEmpty());
}

TEST_F(ValidatorTest, LengthBoundary) {
    EXPECT_THAT(validator.validate(std::string(150, 'a')), IsEmpty());

    const auto violations = validator.validate(std::string(151, 'a'));
    ASSERT_THAT(kinds(violations), ElementsAre(Violation::Kind::TooLong));
    EXPECT_EQ(violations[0].detail, "Response too long (151 chars)");
}

TEST_F(ValidatorTest, LengthCountsCharactersNotBytes) {
    // 150 two-byte characters
    std::string text;
    for (int i = 0; i < 150; ++i) {
        text += "\xC3\xA9";
    }
    EXPECT_THAT(validator.validate(text), IsEmpty());
}

TEST_F(ValidatorTest, UnnaturalStructure) {
    EXPECT_THAT(kinds(validator.validate("**bold** answer")),
                ElementsAre(Violation::Kind::Unnatural));
    EXPECT_THAT(kinds(validator.validate("yes; no")),
                ElementsAre(Violation::Kind::Unnatural));
    EXPECT_THAT(kinds(validator.validate("a. b. c. d.")),
                ElementsAre(Violation::Kind::Unnatural));
    EXPECT_THAT(validator.validate("a. b. c."), IsEmpty());
}

TEST_F(ValidatorTest, LowConfidence) {
    const auto violations = validator.validate(candidate("sure why not", 0.5));
    ASSERT_THAT(kinds(violations), ElementsAre(Violation::Kind::LowConfidence));
    EXPECT_EQ(violations[0].detail, "Confidence too low: 0.50");

    EXPECT_THAT(validator.validate(candidate("sure why not", 0.7)), IsEmpty());
}

TEST_F(ValidatorTest, ViolationsAccumulate) {
    const auto violations = validator.validate(
        candidate("As an AI; furthermore " + std::string(150, 'x'), 0.1));
    EXPECT_THAT(kinds(violations),
                ElementsAre(Violation::Kind::LowConfidence,
                            Violation::Kind::Disclosure,
                            Violation::Kind::FormalRegister,
                            Violation::Kind::TooLong,
                            Violation::Kind::Unnatural));
    EXPECT_EQ(Validator::describe({violations[1], violations[2]}),
              "Contains AI disclosure patterns; Contains overly formal "
              "language");
}

TEST_F(ValidatorTest, CustomRules) {
    Validator::Rules rules;
    rules.maxLength = 5;
    rules.allowSemicolon = true;
    rules.minConfidence = 0.2;
    const Validator custom(rules);

    EXPECT_THAT(custom.validate(candidate("a;b", 0.3)), IsEmpty());
    EXPECT_THAT(kinds(custom.validate("abcdef")),
                ElementsAre(Violation::Kind::TooLong));
}
