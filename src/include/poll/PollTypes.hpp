#pragma once

#include <fmt/format.h>

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class PollKind { MultipleChoice, FreeText };

// Feed type strings as the platform reports them.
constexpr std::string_view kFeedTypeFreeText = "free_text_poll";
constexpr std::string_view kFeedTypeMultipleChoice = "multiple_choice_poll";

// Anything that is not explicitly free text is answered as multiple choice.
inline PollKind pollKindFromFeedType(const std::string_view type) {
    return type == kFeedTypeFreeText ? PollKind::FreeText
                                     : PollKind::MultipleChoice;
}

inline std::string_view toFeedType(const PollKind kind) {
    return kind == PollKind::FreeText ? kFeedTypeFreeText
                                      : kFeedTypeMultipleChoice;
}

struct PollOption {
    std::string id;
    std::string label;

    bool operator==(const PollOption&) const = default;
};

// A poll as fetched from the platform. Immutable once created.
struct PollRecord {
    std::string id;
    PollKind kind = PollKind::MultipleChoice;
    std::string title;
    // Only populated for PollKind::MultipleChoice
    std::vector<PollOption> options;
};

inline double clampConfidence(const double confidence) {
    return std::clamp(confidence, 0.0, 1.0);
}

// A proposed answer, from the generator or the random fallback.
struct AnswerCandidate {
    PollKind kind = PollKind::MultipleChoice;
    std::string selectedOptionId;  // MultipleChoice
    std::string text;              // FreeText
    double confidence = 0;
    std::string reasoning;

    static AnswerCandidate option(std::string optionId, double confidence,
                                  std::string reasoning) {
        return {.kind = PollKind::MultipleChoice,
                .selectedOptionId = std::move(optionId),
                .confidence = clampConfidence(confidence),
                .reasoning = std::move(reasoning)};
    }

    static AnswerCandidate freeText(std::string text, double confidence,
                                    std::string reasoning) {
        return {.kind = PollKind::FreeText,
                .text = std::move(text),
                .confidence = clampConfidence(confidence),
                .reasoning = std::move(reasoning)};
    }

    [[nodiscard]] const std::string& value() const {
        return kind == PollKind::FreeText ? text : selectedOptionId;
    }
};

// The final payload handed to Session::submitAnswer.
struct Answer {
    PollKind kind = PollKind::MultipleChoice;
    // Option id for multiple choice, the text for free text.
    std::string value;

    bool operator==(const Answer&) const = default;
};

template <>
struct fmt::formatter<PollKind> : formatter<std::string_view> {
    auto format(PollKind c,
                format_context& ctx) const -> format_context::iterator {
        string_view name = "unknown";
        switch (c) {
            case PollKind::MultipleChoice:
                name = "MultipleChoice";
                break;
            case PollKind::FreeText:
                name = "FreeText";
                break;
        }
        return formatter<string_view>::format(name, ctx);
    }
};
