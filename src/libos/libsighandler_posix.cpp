#include <array>
#include <csignal>

#include "libsighandler.hpp"

#include <AbslLogCompat.hpp>

std::atomic_bool SignalHandler::kUnderSignal;

namespace {
constexpr std::array<int, 2> kHandledSignals{SIGINT, SIGTERM};
}  // namespace

void SignalHandler::signalHandler(int /*signum*/) { kUnderSignal = true; }

void SignalHandler::install() {
    for (const auto &sig : kHandledSignals) {
        if (std::signal(sig, SignalHandler::signalHandler) == SIG_ERR) {
            PLOG(ERROR) << "Failed to install signal handler";
        }
    }
}

void SignalHandler::uninstall() {
    for (const auto &sig : kHandledSignals) {
        if (std::signal(sig, SIG_DFL) == SIG_ERR) {
            PLOG(ERROR) << "Failed to uninstall signal handler";
        }
    }
}
