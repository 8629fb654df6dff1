#pragma once

#include <absl/status/status.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

#include "StatusSink.hpp"

class AnswerPipeline;
class PollWatcher;
class Providers;
class Session;

/**
 * The main loop: log in, get a feed token, then probe, wait and answer one
 * poll at a time until the lifetime runs out or a stop is requested.
 *
 * Stop requests and the lifetime are honored between iterations and during
 * the closed/open waits, never inside a network call.
 */
class PollBot {
   public:
    struct Timing {
        std::chrono::milliseconds closedWait = std::chrono::seconds(5);
        std::chrono::milliseconds openWait = std::chrono::seconds(60);
        // nullopt runs until stopped
        std::optional<std::chrono::milliseconds> lifetime;
        int heartbeatEvery = 10;
        std::chrono::milliseconds quietStatusInterval =
            std::chrono::seconds(60);
    };

    PollBot(Timing timing, Providers* providers, Session& session,
            PollWatcher& watcher, AnswerPipeline& pipeline);

    /**
     * @brief Runs until the lifetime expires or token is stopped.
     *
     * @return OK on a normal exit. UNAUTHENTICATED if login fails, NOT_FOUND
     * if the host does not exist, or the transport error that prevented
     * getting a feed token at startup.
     */
    absl::Status run(const std::stop_token& token = {});

   private:
    void status(StatusLevel level, std::string_view message);
    // False if interrupted by a stop request.
    bool sleepFor(std::chrono::milliseconds duration,
                  const std::stop_token& token);

    Timing timing_;
    Providers* providers_;
    Session& session_;
    PollWatcher& watcher_;
    AnswerPipeline& pipeline_;

    std::optional<std::chrono::steady_clock::time_point> lastStatus_;
    std::mutex sleepMutex_;
    std::condition_variable_any sleepCv_;
};
