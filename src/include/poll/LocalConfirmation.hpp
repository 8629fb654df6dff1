#pragma once

#include <chrono>
#include <cstdio>
#include <string_view>

#include "PollTypes.hpp"

// Synchronous yes/no from whoever runs the bot, used when the remote
// approval channel is missing or fails.
class LocalConfirmation {
   public:
    virtual ~LocalConfirmation() = default;

    // True only on an explicit yes before the timeout.
    virtual bool confirm(const AnswerCandidate& candidate,
                         std::string_view question,
                         std::chrono::milliseconds timeout) = 0;
};

// Single keypress on a terminal: 'y' submits, anything else cancels.
class TerminalConfirmation : public LocalConfirmation {
   public:
    // fd to read the key from, and stream to print the prompt on
    explicit TerminalConfirmation(int inputFd = 0, std::FILE* out = stdout);

    bool confirm(const AnswerCandidate& candidate, std::string_view question,
                 std::chrono::milliseconds timeout) override;

   private:
    int inputFd_;
    std::FILE* out_;
};
