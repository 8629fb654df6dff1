#pragma once

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include <chrono>
#include <string>
#include <string_view>

#include "net/HttpClient.hpp"
#include "poll/Session.hpp"
#include "poll/Settings.hpp"

/**
 * Session against pollev.com, logging in either directly or through the UW
 * SAML2 single sign-on.
 */
class PollEvSession : public Session {
   public:
    struct Credentials {
        std::string username;
        std::string password;
        std::string host;
        LoginType loginType = LoginType::UW;
    };

    explicit PollEvSession(Credentials credentials);

    absl::Status login() override;
    absl::StatusOr<std::string> fetchFeedToken() override;
    absl::StatusOr<std::string> probeFeed(const std::string& token) override;
    absl::StatusOr<PollRecord> fetchPollDetail(const std::string& id,
                                               PollKind kind) override;
    absl::Status submitAnswer(const PollRecord& poll,
                              const Answer& answer) override;

    // Parsers for the platform's JSON bodies, public for tests.
    static absl::StatusOr<std::string> parseFeedToken(std::string_view body,
                                                      std::string_view host);
    static absl::StatusOr<PollRecord> parsePollDetail(std::string_view body,
                                                      const std::string& id,
                                                      PollKind kind);
    // "https://...;jsessionid=ABC.node1?x" -> "ABC"
    static std::string extractSessionId(std::string_view action);
    // pe_auth_token value from a redirect URL
    static std::string extractAuthToken(std::string_view url);

    // 300 ms, anything slower means no poll is open
    static constexpr std::chrono::milliseconds kProbeTimeout{300};

   private:
    absl::StatusOr<std::string> csrfToken();
    bool pollevLogin();
    bool uwLogin();

    Credentials credentials_;
    HttpClient http_;
};
