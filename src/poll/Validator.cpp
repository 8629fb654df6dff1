#include <absl/strings/str_join.h>
#include <fmt/format.h>

#include <algorithm>
#include <poll/Validator.hpp>
#include <regex>
#include <string>
#include <utility>

namespace {

constexpr auto kRegexFlags = std::regex::ECMAScript | std::regex::icase |
                             std::regex::optimize;

std::string escapeRegex(const std::string_view word) {
    static const std::string_view kSpecial = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(word.size());
    for (const char c : word) {
        if (kSpecial.find(c) != std::string_view::npos) {
            out += '\\';
        }
        out += c;
    }
    return out;
}

// Count UTF-8 code points, so that accented letters count once.
std::size_t characterCount(const std::string_view text) {
    return std::ranges::count_if(text, [](const char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    });
}

bool matchesAny(const std::vector<std::regex>& patterns,
                const std::string& text) {
    return std::ranges::any_of(patterns, [&text](const std::regex& re) {
        return std::regex_search(text, re);
    });
}

}  // namespace

Validator::Validator() : Validator(Rules{}) {}

Validator::Validator(Rules rules) : rules_(std::move(rules)) {
    disclosure_.reserve(rules_.disclosurePatterns.size());
    for (const auto& pattern : rules_.disclosurePatterns) {
        disclosure_.emplace_back(pattern, kRegexFlags);
    }
    formal_.reserve(rules_.formalWords.size());
    for (const auto& word : rules_.formalWords) {
        formal_.emplace_back(fmt::format(R"(\b{}\b)", escapeRegex(word)),
                             kRegexFlags);
    }
}

void Validator::checkText(const std::string_view text,
                          std::vector<Violation>& violations) const {
    const std::string str(text);

    if (matchesAny(disclosure_, str)) {
        violations.push_back(
            {Violation::Kind::Disclosure, "Contains AI disclosure patterns"});
    }

    if (matchesAny(formal_, str)) {
        violations.push_back({Violation::Kind::FormalRegister,
                              "Contains overly formal language"});
    }

    if (const auto length = characterCount(text); length > rules_.maxLength) {
        violations.push_back(
            {Violation::Kind::TooLong,
             fmt::format("Response too long ({} chars)", length)});
    }

    const bool hasMarkdown = std::ranges::any_of(
        rules_.markdownMarkers, [&text](const std::string& marker) {
            return text.find(marker) != std::string_view::npos;
        });
    const auto periods =
        static_cast<std::size_t>(std::ranges::count(text, '.'));
    const bool hasSemicolon =
        !rules_.allowSemicolon && text.find(';') != std::string_view::npos;
    if (hasMarkdown || periods > rules_.maxPeriods || hasSemicolon) {
        violations.push_back({Violation::Kind::Unnatural,
                              "Response structure appears unnatural"});
    }
}

std::vector<Violation> Validator::validate(const std::string_view text) const {
    std::vector<Violation> violations;
    checkText(text, violations);
    return violations;
}

std::vector<Violation> Validator::validate(
    const AnswerCandidate& candidate) const {
    std::vector<Violation> violations;
    if (candidate.confidence < rules_.minConfidence) {
        violations.push_back(
            {Violation::Kind::LowConfidence,
             fmt::format("Confidence too low: {:.2f}", candidate.confidence)});
    }
    checkText(candidate.text, violations);
    return violations;
}

std::string Validator::describe(const std::vector<Violation>& violations) {
    return absl::StrJoin(violations, "; ",
                         [](std::string* out, const Violation& violation) {
                             out->append(violation.detail);
                         });
}
