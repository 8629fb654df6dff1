#pragma once

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "PollTypes.hpp"

// A single reason why a free-text candidate would stand out.
struct Violation {
    enum class Kind {
        Disclosure,      // AI self-reference or refusal phrasing
        FormalRegister,  // "furthermore", "moreover", ...
        TooLong,         // over the length ceiling
        Unnatural,       // markdown, too many periods, semicolons
        LowConfidence,   // candidate's own confidence under the floor
    };

    Kind kind;
    std::string detail;

    bool operator==(const Violation&) const = default;
};

/**
 * Rule based classifier for free-text answers.
 *
 * Stateless after construction and safe to share between threads. All checks
 * run every time; violations accumulate instead of short-circuiting so the
 * caller can log every reason at once. An empty result means the text passes.
 */
class Validator {
   public:
    struct Rules {
        // Case-insensitive ECMAScript patterns
        std::vector<std::string> disclosurePatterns{
            R"(\b(ai|artificial intelligence|language model|llm|claude|assistant)\b)",
            R"(\bas an ai\b)",
            R"(\bi am an\b)",
            R"(\bi cannot\b)",
            R"(\bi don't experience\b)",
            R"(\bi apologize\b)",
        };
        // Case-insensitive whole words
        std::vector<std::string> formalWords{
            "furthermore", "moreover",     "thus",         "hence",
            "wherein",     "hereby",       "nevertheless", "subsequently",
        };
        // In characters (UTF-8 code points), inclusive
        std::size_t maxLength = 150;
        std::vector<std::string> markdownMarkers{"```", "#", "*"};
        std::size_t maxPeriods = 3;
        bool allowSemicolon = false;
        double minConfidence = 0.7;
    };

    Validator();
    // Throws std::regex_error if a disclosure pattern does not compile.
    explicit Validator(Rules rules);

    // Text-only checks: disclosure, formality, length, structure.
    [[nodiscard]] std::vector<Violation> validate(std::string_view text) const;

    // Confidence floor plus all text checks.
    [[nodiscard]] std::vector<Violation> validate(
        const AnswerCandidate& candidate) const;

    [[nodiscard]] const Rules& rules() const { return rules_; }

    // "reason; reason; ..." for logging.
    static std::string describe(const std::vector<Violation>& violations);

   private:
    void checkText(std::string_view text,
                   std::vector<Violation>& violations) const;

    Rules rules_;
    std::vector<std::regex> disclosure_;
    std::vector<std::regex> formal_;
};
