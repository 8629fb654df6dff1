#pragma once

#include <string_view>

// PollEverywhere and UW single sign-on URLs, as fmt format strings.
namespace pollev::endpoints {

// {timestamp}
constexpr std::string_view kCsrf =
    "https://pollev.com/proxy/api/csrf_token?_={timestamp}";
constexpr std::string_view kLogin = "https://pollev.com/proxy/api/sessions";

constexpr std::string_view kUwSaml =
    "https://pollev.com/auth/saml/uw?redirect=%2Fparticipant";
// {id}
constexpr std::string_view kUwLogin =
    "https://idp.u.washington.edu/idp/profile/SAML2/Redirect/"
    "SSO;jsessionid={id}?execution=e1s1";
constexpr std::string_view kUwCallback =
    "https://www.polleverywhere.com/auth/washington/callback";
constexpr std::string_view kUwAuthToken =
    "https://pollev.com/proxy/api/participant/auth_token";

// {host}, {timestamp}
constexpr std::string_view kFirehoseAuth =
    "https://pollev.com/proxy/api/users/{host}/registration_info?_={timestamp}";
// {host}, {token}, {timestamp}
constexpr std::string_view kFirehoseWithToken =
    "https://firehose-production.polleverywhere.com/users/{host}/activity/"
    "current.json?firehose_token={token}&_={timestamp}";
// {host}, {timestamp}
constexpr std::string_view kFirehoseNoToken =
    "https://firehose-production.polleverywhere.com/users/{host}/activity/"
    "current.json?last_message_sequence=0&_={timestamp}";

// {uid}
constexpr std::string_view kPollData =
    "https://pollev.com/proxy/api/polls/{uid}";
constexpr std::string_view kPollDataFreeText =
    "https://pollev.com/proxy/api/free_text_polls/{uid}";
constexpr std::string_view kRespondToPoll =
    "https://pollev.com/proxy/api/polls/{uid}/options/results";
constexpr std::string_view kRespondToPollFreeText =
    "https://pollev.com/proxy/api/free_text_polls/{uid}/results";

constexpr std::string_view kCookieDomain = ".pollev.com";

}  // namespace pollev::endpoints
