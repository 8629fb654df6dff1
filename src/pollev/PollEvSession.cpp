#include <absl/status/status.h>
#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <fmt/format.h>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <chrono>
#include <libxml2_helper.hpp>
#include <nlohmann/json.hpp>
#include <poll/Errors.hpp>
#include <pollev/Endpoints.hpp>
#include <pollev/PollEvSession.hpp>
#include <utility>

#include <AbslLogCompat.hpp>

using json = nlohmann::json;
namespace endpoints = pollev::endpoints;

namespace {

constexpr std::string_view kBadCredentials =
    "Your username or password was incorrect.";

long long timestamp() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string idToString(const json& id) {
    return id.is_string() ? id.get<std::string>() : id.dump();
}

}  // namespace

PollEvSession::PollEvSession(Credentials credentials)
    : credentials_(std::move(credentials)) {}

absl::StatusOr<std::string> PollEvSession::csrfToken() {
    const auto response = http_.get(
        fmt::format(fmt::runtime(endpoints::kCsrf), fmt::arg("timestamp", timestamp())));
    if (!response.ok()) {
        return response.status();
    }
    try {
        return json::parse(response->body).at("token").get<std::string>();
    } catch (const json::exception& e) {
        return poll_errors::TransportError(
            fmt::format("Unexpected CSRF response: {}", e.what()));
    }
}

bool PollEvSession::pollevLogin() {
    LOG(INFO) << "Logging into PollEv through pollev.com";
    const auto csrf = csrfToken();
    if (!csrf.ok()) {
        LOG(ERROR) << "Cannot get CSRF token: " << csrf.status();
        return false;
    }
    const auto response = http_.postForm(
        endpoints::kLogin,
        {{"login", credentials_.username}, {"password", credentials_.password}},
        {{"x-csrf-token", *csrf}});
    // PollEv answers a successful login with an empty body
    return response.ok() && response->body.empty();
}

bool PollEvSession::uwLogin() {
    LOG(INFO) << "Logging into PollEv through MyUW";
    const auto ssoPage = http_.get(endpoints::kUwSaml);
    if (!ssoPage.ok()) {
        LOG(ERROR) << "Cannot reach the UW sign-on page: " << ssoPage.status();
        return false;
    }
    const auto action = HtmlDocument(ssoPage->body)
                            .attribute("//form[@id='idplogindiv']", "action");
    if (!action) {
        LOG(ERROR) << "UW sign-on page has no login form";
        return false;
    }

    const auto signIn = http_.postForm(
        fmt::format(fmt::runtime(endpoints::kUwLogin),
                    fmt::arg("id", extractSessionId(*action))),
        {{"j_username", credentials_.username},
         {"j_password", credentials_.password},
         {"_eventId_proceed", "Sign in"}});
    if (!signIn.ok()) {
        LOG(ERROR) << "UW sign-in failed: " << signIn.status();
        return false;
    }
    // A failed sign-in comes back without a SAML response
    const auto saml =
        HtmlDocument(signIn->body)
            .attribute("//input[@type='hidden' and @name='SAMLResponse']",
                       "value");
    if (!saml) {
        return false;
    }

    const auto callback =
        http_.postForm(endpoints::kUwCallback, {{"SAMLResponse", *saml}});
    if (!callback.ok()) {
        LOG(ERROR) << "SAML callback failed: " << callback.status();
        return false;
    }
    const auto authToken = extractAuthToken(callback->effectiveUrl);
    if (authToken.empty()) {
        LOG(ERROR) << "No auth token in " << callback->effectiveUrl;
        return false;
    }

    const auto csrf = csrfToken();
    if (!csrf.ok()) {
        LOG(ERROR) << "Cannot get CSRF token: " << csrf.status();
        return false;
    }
    const auto exchanged =
        http_.postForm(endpoints::kUwAuthToken, {{"token", authToken}},
                       {{"x-csrf-token", *csrf}});
    return exchanged.ok() && exchanged->ok();
}

absl::Status PollEvSession::login() {
    const bool success = credentials_.loginType == LoginType::UW
                             ? uwLogin()
                             : pollevLogin();
    if (!success) {
        return poll_errors::AuthError(kBadCredentials);
    }
    LOG(INFO) << "Login successful";
    return absl::OkStatus();
}

absl::StatusOr<std::string> PollEvSession::fetchFeedToken() {
    // The token endpoint checks for two visitor cookies that the web page
    // would generate in javascript, random uuids are accepted.
    boost::uuids::random_generator generator;
    http_.setCookie(endpoints::kCookieDomain, "pollev_visitor",
                    boost::uuids::to_string(generator()));
    http_.setCookie(endpoints::kCookieDomain, "pollev_visit",
                    boost::uuids::to_string(generator()));

    const auto response = http_.get(fmt::format(
        fmt::runtime(endpoints::kFirehoseAuth),
        fmt::arg("host", credentials_.host), fmt::arg("timestamp", timestamp())));
    if (!response.ok()) {
        return response.status();
    }
    return parseFeedToken(response->body, credentials_.host);
}

absl::StatusOr<std::string> PollEvSession::parseFeedToken(
    const std::string_view body, const std::string_view host) {
    if (absl::StrContains(absl::AsciiStrToLower(std::string(body)),
                          "presenter not found")) {
        return poll_errors::InvalidHostError(
            fmt::format("'{}' is not a valid poll host.", host));
    }
    try {
        const auto parsed = json::parse(body);
        const auto& token = parsed.at("firehose_token");
        if (token.is_null()) {
            // Hosts outside UW work without a token
            return std::string();
        }
        return token.get<std::string>();
    } catch (const json::exception& e) {
        return poll_errors::TransportError(
            fmt::format("Unexpected feed token response: {}", e.what()));
    }
}

absl::StatusOr<std::string> PollEvSession::probeFeed(const std::string& token) {
    const auto url =
        token.empty()
            ? fmt::format(fmt::runtime(endpoints::kFirehoseNoToken),
                          fmt::arg("host", credentials_.host),
                          fmt::arg("timestamp", timestamp()))
            : fmt::format(fmt::runtime(endpoints::kFirehoseWithToken),
                          fmt::arg("host", credentials_.host),
                          fmt::arg("token", token),
                          fmt::arg("timestamp", timestamp()));
    auto response = http_.get(url, {}, kProbeTimeout);
    if (!response.ok()) {
        return response.status();
    }
    return std::move(response->body);
}

absl::StatusOr<PollRecord> PollEvSession::fetchPollDetail(const std::string& id,
                                                          const PollKind kind) {
    const auto format = kind == PollKind::FreeText ? endpoints::kPollDataFreeText
                                                   : endpoints::kPollData;
    const auto response =
        http_.get(fmt::format(fmt::runtime(format), fmt::arg("uid", id)));
    if (!response.ok()) {
        return response.status();
    }
    if (!response->ok()) {
        return poll_errors::TransportError(
            fmt::format("Poll {} returned HTTP {}", id, response->code));
    }
    return parsePollDetail(response->body, id, kind);
}

absl::StatusOr<PollRecord> PollEvSession::parsePollDetail(
    const std::string_view body, const std::string& id, const PollKind kind) {
    PollRecord poll{.id = id, .kind = kind};
    try {
        const auto parsed = json::parse(body);
        poll.title = parsed.value("title", "");
        if (kind == PollKind::MultipleChoice && parsed.contains("options")) {
            for (const auto& option : parsed.at("options")) {
                std::string label;
                if (option.contains("humanized_value") &&
                    option["humanized_value"].is_string()) {
                    label = option["humanized_value"].get<std::string>();
                } else {
                    label = option.value("value", "");
                }
                poll.options.push_back(
                    {.id = idToString(option.at("id")), .label = label});
            }
        }
    } catch (const json::exception& e) {
        return poll_errors::TransportError(
            fmt::format("Unexpected data for poll {}: {}", id, e.what()));
    }
    return poll;
}

absl::Status PollEvSession::submitAnswer(const PollRecord& poll,
                                         const Answer& answer) {
    const auto csrf = csrfToken();
    if (!csrf.ok()) {
        return csrf.status();
    }
    HttpClient::Fields form;
    std::string_view format;
    if (answer.kind == PollKind::FreeText) {
        form.emplace_back("value", answer.value);
        format = endpoints::kRespondToPollFreeText;
    } else {
        form.emplace_back("option_id", answer.value);
        format = endpoints::kRespondToPoll;
    }
    form.emplace_back("isPending", "true");
    form.emplace_back("source", "pollev_page");

    const auto response =
        http_.postForm(fmt::format(fmt::runtime(format), fmt::arg("uid", poll.id)),
                       form, {{"x-csrf-token", *csrf}});
    if (!response.ok()) {
        return response.status();
    }
    if (!response->ok()) {
        return poll_errors::TransportError(fmt::format(
            "Submitting to poll {} returned HTTP {}", poll.id, response->code));
    }
    LOG(INFO) << "Received response: " << response->body;
    return absl::OkStatus();
}

std::string PollEvSession::extractSessionId(const std::string_view action) {
    constexpr std::string_view kMarker = "jsessionid=";
    const auto begin = action.find(kMarker);
    if (begin == std::string_view::npos) {
        return {};
    }
    auto rest = action.substr(begin + kMarker.size());
    if (const auto query = rest.find('?'); query != std::string_view::npos) {
        rest = rest.substr(0, query);
    }
    // Drop the ".nodeN" route suffix
    if (const auto dot = rest.rfind('.'); dot != std::string_view::npos) {
        rest = rest.substr(0, dot);
    }
    return std::string(rest);
}

std::string PollEvSession::extractAuthToken(const std::string_view url) {
    constexpr std::string_view kMarker = "pe_auth_token=";
    const auto begin = url.find(kMarker);
    if (begin == std::string_view::npos) {
        return {};
    }
    auto rest = url.substr(begin + kMarker.size());
    return std::string(rest.substr(0, rest.find('&')));
}
