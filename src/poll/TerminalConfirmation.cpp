#include <fmt/chrono.h>
#include <fmt/format.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <poll/LocalConfirmation.hpp>

#include <AbslLogCompat.hpp>

namespace {

// Puts the terminal into non-canonical mode so that a single key is
// delivered without Enter, restoring the previous mode on scope exit.
class ScopedRawInput {
   public:
    explicit ScopedRawInput(int fd) : fd_(fd) {
        if (isatty(fd_) == 0 || tcgetattr(fd_, &saved_) != 0) {
            return;
        }
        termios raw = saved_;
        raw.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO);
        raw.c_cc[VMIN] = 1;
        raw.c_cc[VTIME] = 0;
        if (tcsetattr(fd_, TCSANOW, &raw) == 0) {
            active_ = true;
        } else {
            PLOG(WARNING) << "Cannot switch terminal to raw input";
        }
    }
    ~ScopedRawInput() {
        if (active_) {
            tcsetattr(fd_, TCSANOW, &saved_);
        }
    }
    ScopedRawInput(const ScopedRawInput&) = delete;
    ScopedRawInput& operator=(const ScopedRawInput&) = delete;

   private:
    int fd_;
    termios saved_{};
    bool active_ = false;
};

}  // namespace

TerminalConfirmation::TerminalConfirmation(int inputFd, std::FILE* out)
    : inputFd_(inputFd), out_(out) {}

bool TerminalConfirmation::confirm(const AnswerCandidate& candidate,
                                   const std::string_view question,
                                   const std::chrono::milliseconds timeout) {
    const std::string rule(50, '=');
    fmt::print(out_, "\n{}\nPROPOSED RESPONSE:\n", rule);
    fmt::print(out_, "Question: {}\n", question);
    fmt::print(out_, "Answer: {}\n", candidate.value());
    fmt::print(out_, "Confidence: {:.2f}\n", candidate.confidence);
    fmt::print(out_, "Reasoning: {}\n{}\n", candidate.reasoning, rule);
    fmt::print(out_,
               "\nPress 'y' to submit this response, any other key to "
               "cancel.\nYou have {} to respond. No response will be "
               "treated as a cancel.\n",
               std::chrono::duration_cast<std::chrono::seconds>(timeout));
    std::fflush(out_);

    ScopedRawInput raw(inputFd_);
    pollfd pfd{.fd = inputFd_, .events = POLLIN, .revents = 0};
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
        if (remaining <= std::chrono::milliseconds::zero()) {
            break;
        }
        const int ret = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            PLOG(ERROR) << "poll on confirmation input failed";
            return false;
        }
        if (ret == 0) {
            break;
        }
        char key = 0;
        const ssize_t n = ::read(inputFd_, &key, 1);
        if (n <= 0) {
            LOG(WARNING) << "Confirmation input closed";
            return false;
        }
        return key == 'y' || key == 'Y';
    }
    fmt::print(out_, "\nTimeout reached - cancelling response\n");
    std::fflush(out_);
    return false;
}
