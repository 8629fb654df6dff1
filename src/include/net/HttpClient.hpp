#pragma once

#include <absl/status/statusor.h>
#include <curl/curl.h>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "trivial_helpers/raii.hpp"

struct HttpResponse {
    long code = 0;
    std::string body;
    // URL after redirects
    std::string effectiveUrl;

    [[nodiscard]] bool ok() const { return code >= 200 && code < 300; }
};

/**
 * Blocking HTTP client on a single curl easy handle.
 *
 * Cookies received are kept in memory for the lifetime of the client and sent
 * back on later requests, like a browser session. Redirects are followed.
 * Requests are serialized.
 *
 * Transport failures are UNAVAILABLE, timeouts DEADLINE_EXCEEDED. HTTP error
 * codes are not failures; check HttpResponse::ok().
 */
class HttpClient {
   public:
    using Fields = std::vector<std::pair<std::string, std::string>>;

    static constexpr std::string_view kBrowserUserAgent =
        "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like "
        "Gecko) Chrome/120.0 Safari/537.36";

    explicit HttpClient(std::string userAgent = std::string(kBrowserUserAgent));

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    absl::StatusOr<HttpResponse> get(
        std::string_view url, const Fields& headers = {},
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // application/x-www-form-urlencoded body
    absl::StatusOr<HttpResponse> postForm(std::string_view url,
                                          const Fields& form,
                                          const Fields& headers = {});

    // application/json body
    absl::StatusOr<HttpResponse> postJson(std::string_view url,
                                          std::string body,
                                          const Fields& headers = {});

    void setCookie(std::string_view domain, std::string_view name,
                   std::string_view value);
    [[nodiscard]] std::optional<std::string> cookie(std::string_view name);

    // "a=1&b=2" with both sides percent encoded
    std::string encodeForm(const Fields& form);

   private:
    absl::StatusOr<HttpResponse> perform(
        std::string_view url, const Fields& headers,
        std::optional<std::string> postBody,
        std::optional<std::chrono::milliseconds> timeout);

    std::string userAgent_;
    std::mutex mutex_;
    RAII<CURL*>::Value<void> curl_;
};
