#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include "PollTypes.hpp"

struct ResponseRecord {
    enum class Outcome {
        Submitted,  // answer was accepted by the platform
        Dropped,    // rejected by the approver, timed out, or failed to submit
        NoAnswer,   // nothing usable was produced
    };

    std::chrono::system_clock::time_point timestamp =
        std::chrono::system_clock::now();
    PollRecord poll;
    std::optional<AnswerCandidate> candidate;
    // What was (or would have been) submitted, after approver edits
    std::optional<std::string> finalText;
    Outcome outcome = Outcome::NoAnswer;
    std::string detail;
};

// Append-only record of every answer attempt.
class ResponseLog {
   public:
    virtual ~ResponseLog() = default;

    // Must not throw and must not block for long.
    virtual void append(const ResponseRecord& record) = 0;
};

// One JSON object per line.
class JsonlResponseLog : public ResponseLog {
   public:
    explicit JsonlResponseLog(std::filesystem::path path);

    void append(const ResponseRecord& record) override;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    // The JSON line written for a record, without the newline.
    static std::string serialize(const ResponseRecord& record);

   private:
    std::filesystem::path path_;
    std::mutex mutex_;
};
