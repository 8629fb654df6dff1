#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>

#include "PollTypes.hpp"
#include "Session.hpp"

struct ProbeResult {
    enum class State {
        NoPoll,               // nothing open, timeout, or unusable payload
        NewPoll,              // first sighting; id is now in the answered set
        AlreadyAnswered,      // open, but handled earlier in this process
        SubscriptionExpired,  // refresh the feed token and probe again
    };

    State state = State::NoPoll;
    std::string id;
    PollKind kind = PollKind::MultipleChoice;
};

/**
 * Probes the feed and deduplicates poll ids.
 *
 * A poll id is recorded as answered the moment it is first returned, before
 * any answer is attempted, so it is never returned as NewPoll again within
 * this process, even if answering it fails.
 *
 * Not thread-safe: the answered set is owned by the single main loop. Do not
 * probe concurrently from several threads.
 */
class PollWatcher {
   public:
    explicit PollWatcher(Session* session);

    ProbeResult probe(const std::string& token);

    // Interpret a raw feed body without touching the answered set.
    // NewPoll here only means "a poll is open".
    static ProbeResult parseFeedPayload(std::string_view payload);

    [[nodiscard]] bool isAnswered(const std::string& id) const {
        return answered_.contains(id);
    }
    [[nodiscard]] std::size_t answeredCount() const { return answered_.size(); }

   private:
    Session* session_;
    std::unordered_set<std::string> answered_;
};
