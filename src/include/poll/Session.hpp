#pragma once

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include <string>

#include "PollTypes.hpp"

// Authenticated connection to the polling platform.
class Session {
   public:
    Session() = default;
    virtual ~Session() = default;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // UNAUTHENTICATED when the credentials are rejected.
    virtual absl::Status login() = 0;

    // Token for the feed. An empty string means the host works without one.
    // NOT_FOUND when the host does not exist.
    virtual absl::StatusOr<std::string> fetchFeedToken() = 0;

    // Raw feed body, bounded to a short timeout.
    // DEADLINE_EXCEEDED on timeout, UNAVAILABLE on other transport failures.
    virtual absl::StatusOr<std::string> probeFeed(const std::string& token) = 0;

    virtual absl::StatusOr<PollRecord> fetchPollDetail(const std::string& id,
                                                       PollKind kind) = 0;

    virtual absl::Status submitAnswer(const PollRecord& poll,
                                      const Answer& answer) = 0;
};
